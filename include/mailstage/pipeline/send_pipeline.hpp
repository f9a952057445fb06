/*

send_pipeline.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailstage/codec/base64.hpp>
#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/detail/sanitize.hpp>
#include <mailstage/mime/attachment_resolver.hpp>
#include <mailstage/mime/outbound_message.hpp>
#include <mailstage/store/record_store.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::pipeline
{

struct send_request
{
    std::string sender;
    std::vector<std::string> recipients;
    std::string subject;
    std::string body;
    /// Staged files; the pipeline deletes them once the attempt resolves.
    std::vector<std::filesystem::path> attachments;
};

/**
Checking a request before anything is recorded.

@return `validation_failed` for an empty sender, subject or body, no recipients, an empty recipient,
        or a line break in a value that ends up in a header.
**/
[[nodiscard]] inline result_void validate(const send_request& req)
{
    if (req.sender.empty())
        return fail(error_code::validation_failed, "Sender is required.");
    if (req.recipients.empty())
        return fail(error_code::validation_failed, "At least one recipient is required.");
    if (req.subject.empty())
        return fail(error_code::validation_failed, "Subject is required.");
    if (req.body.empty())
        return fail(error_code::validation_failed, "Body is required.");

    MAILSTAGE_TRY_VOID(detail::ensure_no_crlf_or_nul(req.sender, "sender"));
    for (const auto& rcpt : req.recipients)
    {
        if (rcpt.empty())
            return fail(error_code::validation_failed, "Recipients must not be empty.");
        MAILSTAGE_TRY_VOID(detail::ensure_no_crlf_or_nul(rcpt, "recipient"));
    }
    MAILSTAGE_TRY_VOID(detail::ensure_no_crlf_or_nul(req.subject, "subject"));
    return ok();
}

/**
One send attempt from request to terminal status.

    validate -> record pending -> read and register attachments -> deliver -> sent | failed

Once the record exists, the staged attachments and the attachment records are removed on every
exit path. Each attempt moves its record to exactly one terminal state.
**/
class send_pipeline
{
public:
    send_pipeline(store::record_store& records, delivery::delivery_client& delivery)
        : records_(records), delivery_(delivery)
    {
    }

    /**
    Running one attempt.

    @return Id of the email record, `validation_failed` before anything is recorded,
            `storage_failed` when an attachment cannot be read, a delivery error carrying the
            provider's explanation, or a record store error.
    **/
    [[nodiscard]] result<store::record_id> send(const send_request& req)
    {
        auto valid = validate(req);
        if (!valid)
            return fail<store::record_id>(std::move(valid).error());

        store::email_record draft;
        draft.sender = req.sender;
        draft.recipients = req.recipients;
        draft.subject = req.subject;
        draft.body = req.body;
        draft.status = store::email_status::pending;
        auto created = records_.create_email(draft);
        if (!created)
            return fail<store::record_id>(std::move(created).error());
        const store::record_id email_id = *created;
        MAILSTAGE_INFO("email " + std::to_string(email_id) + " recorded as pending with "
            + std::to_string(req.attachments.size()) + " attachment(s)");

        attempt_cleanup cleanup(records_, email_id, req.attachments);

        mime::outbound_message msg;
        msg.from = req.sender;
        msg.to = req.recipients;
        msg.subject = req.subject;
        msg.text = req.body;
        msg.html = req.body;

        for (const auto& path : req.attachments)
        {
            auto bytes = upload::read_file(path);
            if (!bytes)
            {
                MAILSTAGE_ERROR("email " + std::to_string(email_id) + ": " + bytes.error().to_string());
                mark(email_id, store::email_status::failed);
                return fail<store::record_id>(error_code::storage_failed, "Cannot read attachment.", path.string());
            }

            const auto resolved = mime::resolve(path);
            store::attachment_record att;
            att.email_id = email_id;
            att.filename = resolved.display_filename;
            att.content_type = resolved.content_type;
            auto att_id = records_.create_attachment(att);
            if (!att_id)
            {
                mark(email_id, store::email_status::failed);
                return fail<store::record_id>(std::move(att_id).error());
            }

            mime::outbound_attachment out;
            out.content = base64::encode_flat(*bytes);
            out.filename = resolved.display_filename;
            out.type = resolved.content_type;
            msg.attachments.push_back(std::move(out));
        }

        auto delivered = delivery_.send(msg);
        if (!delivered)
        {
            const auto& err = delivered.error();
            mark(email_id, store::email_status::failed);
            MAILSTAGE_WARN("email " + std::to_string(email_id) + " failed: " + err.to_string());

            std::string detail = err.message();
            if (!err.detail().empty())
            {
                detail += '\n';
                detail += err.detail();
            }
            const error_code code = err.is_delivery_error() ? err.code() : error_code::delivery_failed;
            return fail<store::record_id>(code, "Failed to send email", std::move(detail));
        }

        auto marked = records_.update_status(email_id, store::email_status::sent);
        if (!marked)
        {
            MAILSTAGE_ERROR("email " + std::to_string(email_id) + " was delivered but cannot be marked sent: "
                + marked.error().to_string());
            return fail<store::record_id>(std::move(marked).error());
        }
        MAILSTAGE_INFO("email " + std::to_string(email_id) + " sent");
        return email_id;
    }

private:
    /**
    Removes the staged files and the attachment records of one attempt when it goes out of scope.
    **/
    class attempt_cleanup
    {
    public:
        attempt_cleanup(store::record_store& records, store::record_id email_id,
            const std::vector<std::filesystem::path>& files)
            : records_(records), email_id_(email_id), files_(files)
        {
        }

        ~attempt_cleanup()
        {
            for (const auto& path : files_)
            {
                std::error_code ec;
                std::filesystem::remove(path, ec);
                if (ec)
                    MAILSTAGE_WARN("cannot remove staged file " + path.string() + ": " + ec.message());
            }

            auto removed = records_.delete_attachments(email_id_);
            if (!removed)
                MAILSTAGE_WARN("cannot remove attachment records of email " + std::to_string(email_id_) + ": "
                    + removed.error().to_string());
        }

        attempt_cleanup(const attempt_cleanup&) = delete;
        attempt_cleanup& operator=(const attempt_cleanup&) = delete;

    private:
        store::record_store& records_;
        store::record_id email_id_;
        const std::vector<std::filesystem::path>& files_;
    };

    void mark(store::record_id email_id, store::email_status status)
    {
        auto res = records_.update_status(email_id, status);
        if (!res)
            MAILSTAGE_ERROR("cannot update status of email " + std::to_string(email_id) + ": " + res.error().to_string());
    }

    store::record_store& records_;
    delivery::delivery_client& delivery_;
};

} // namespace mailstage::pipeline
