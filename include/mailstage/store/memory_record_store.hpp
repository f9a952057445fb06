/*

memory_record_store.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <mailstage/store/record_store.hpp>

namespace mailstage::store
{

/**
Process-local record store; contents are lost on exit.
**/
class memory_record_store : public record_store
{
public:
    result<record_id> create_email(const email_record& draft) override
    {
        std::lock_guard lock(mutex_);
        email_record rec = draft;
        rec.id = ++last_email_id_;
        rec.created_at = std::chrono::system_clock::now();
        rec.sent_at.reset();
        emails_.emplace(rec.id, std::move(rec));
        return last_email_id_;
    }

    result_void update_status(record_id id, email_status status) override
    {
        std::lock_guard lock(mutex_);
        auto it = emails_.find(id);
        if (it == emails_.end())
            return fail(error_code::record_not_found, "Email " + std::to_string(id) + " not found.");
        if (!can_transition(it->second.status, status))
        {
            return fail(error_code::invalid_transition, "Email " + std::to_string(id) + " cannot move from "
                + std::string(status_to_string(it->second.status)) + " to " + std::string(status_to_string(status)) + ".");
        }
        it->second.status = status;
        if (status == email_status::sent)
            it->second.sent_at = std::chrono::system_clock::now();
        return ok();
    }

    result<std::vector<email_record>> list_emails() override
    {
        std::lock_guard lock(mutex_);
        std::vector<email_record> out;
        out.reserve(emails_.size());
        for (const auto& [id, rec] : emails_)
            out.push_back(rec);
        std::sort(out.begin(), out.end(), [](const email_record& a, const email_record& b)
        {
            if (a.created_at != b.created_at)
                return a.created_at > b.created_at;
            return a.id > b.id;
        });
        return out;
    }

    result<std::optional<email_record>> find_email(record_id id) override
    {
        std::lock_guard lock(mutex_);
        auto it = emails_.find(id);
        if (it == emails_.end())
            return std::optional<email_record>{};
        return std::optional<email_record>{it->second};
    }

    result<record_id> create_attachment(const attachment_record& draft) override
    {
        std::lock_guard lock(mutex_);
        attachment_record rec = draft;
        rec.id = ++last_attachment_id_;
        attachments_.emplace(rec.id, std::move(rec));
        return last_attachment_id_;
    }

    result<std::vector<attachment_record>> attachments_for(record_id email_id) override
    {
        std::lock_guard lock(mutex_);
        std::vector<attachment_record> out;
        for (const auto& [id, rec] : attachments_)
        {
            if (rec.email_id == email_id)
                out.push_back(rec);
        }
        return out;
    }

    result<std::size_t> delete_attachments(record_id email_id) override
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::erase_if(attachments_, [email_id](const auto& item)
        {
            return item.second.email_id == email_id;
        }));
    }

    /// Attachment records of every email; tests use it to check cleanup.
    [[nodiscard]] std::size_t attachment_count() const
    {
        std::lock_guard lock(mutex_);
        return attachments_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<record_id, email_record> emails_;
    std::map<record_id, attachment_record> attachments_;
    record_id last_email_id_ = 0;
    record_id last_attachment_id_ = 0;
};

} // namespace mailstage::store
