/*

sqlite_record_store.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SQLite backed record store. Two tables:

    emails(id, sender, recipients, subject, body, created_at, sent_at, status)
    attachments(id, email_id, filename, content, content_type)

Recipients are stored one address per line; `content` is always an empty blob since attachment
bytes are never persisted. Timestamps are milliseconds since the Unix epoch.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <sqlite3.h>
#include <mailstage/detail/log.hpp>
#include <mailstage/store/record_store.hpp>

#define MAILSTAGE_EMAIL_COLUMNS "id, sender, recipients, subject, body, created_at, sent_at, status"

namespace mailstage::store
{

class sqlite_record_store : public record_store
{
public:
    /**
    Opening (and creating if needed) the database file and its schema.

    @param path Database file; `:memory:` for a private in-memory database.
    **/
    [[nodiscard]] static result<std::unique_ptr<sqlite_record_store>> open(const std::string& path)
    {
        sqlite3* raw = nullptr;
        const int rc = sqlite3_open_v2(path.c_str(), &raw,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        db_handle db(raw);
        if (rc != SQLITE_OK)
        {
            std::string detail = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
            return fail<std::unique_ptr<sqlite_record_store>>(error_code::record_store_failed,
                "Cannot open database " + path + ".", std::move(detail));
        }

        std::unique_ptr<sqlite_record_store> store(new sqlite_record_store(std::move(db)));
        auto schema = store->exec(SCHEMA);
        if (!schema)
            return fail<std::unique_ptr<sqlite_record_store>>(std::move(schema).error());
        MAILSTAGE_DEBUG("record store opened at " + path);
        return store;
    }

    result<record_id> create_email(const email_record& draft) override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("INSERT INTO emails (sender, recipients, subject, body, created_at, status) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt)
            return fail<record_id>(std::move(stmt).error());

        bind_text(*stmt, 1, draft.sender);
        bind_text(*stmt, 2, join_recipients(draft.recipients));
        bind_text(*stmt, 3, draft.subject);
        bind_text(*stmt, 4, draft.body);
        sqlite3_bind_int64(stmt->get(), 5, to_millis(std::chrono::system_clock::now()));
        bind_text(*stmt, 6, status_to_string(email_status::pending));

        if (sqlite3_step(stmt->get()) != SQLITE_DONE)
            return fail<record_id>(last_error("Cannot insert email."));
        return static_cast<record_id>(sqlite3_last_insert_rowid(db_.get()));
    }

    result_void update_status(record_id id, email_status status) override
    {
        std::lock_guard lock(mutex_);
        auto current = load_status(id);
        if (!current)
            return fail(std::move(current).error());
        if (!can_transition(*current, status))
        {
            return fail(error_code::invalid_transition, "Email " + std::to_string(id) + " cannot move from "
                + std::string(status_to_string(*current)) + " to " + std::string(status_to_string(status)) + ".");
        }

        auto stmt = prepare("UPDATE emails SET status = ?, sent_at = ? WHERE id = ? AND status = 'pending'");
        if (!stmt)
            return fail(std::move(stmt).error());
        bind_text(*stmt, 1, status_to_string(status));
        if (status == email_status::sent)
            sqlite3_bind_int64(stmt->get(), 2, to_millis(std::chrono::system_clock::now()));
        else
            sqlite3_bind_null(stmt->get(), 2);
        sqlite3_bind_int64(stmt->get(), 3, id);

        if (sqlite3_step(stmt->get()) != SQLITE_DONE)
            return fail(last_error("Cannot update email status."));
        if (sqlite3_changes(db_.get()) != 1)
            return fail(error_code::invalid_transition, "Email " + std::to_string(id) + " is no longer pending.");
        return ok();
    }

    result<std::vector<email_record>> list_emails() override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("SELECT " MAILSTAGE_EMAIL_COLUMNS " FROM emails ORDER BY created_at DESC, id DESC");
        if (!stmt)
            return fail<std::vector<email_record>>(std::move(stmt).error());

        std::vector<email_record> out;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW)
            out.push_back(read_email(stmt->get()));
        if (rc != SQLITE_DONE)
            return fail<std::vector<email_record>>(last_error("Cannot list emails."));
        return out;
    }

    result<std::optional<email_record>> find_email(record_id id) override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("SELECT " MAILSTAGE_EMAIL_COLUMNS " FROM emails WHERE id = ?");
        if (!stmt)
            return fail<std::optional<email_record>>(std::move(stmt).error());
        sqlite3_bind_int64(stmt->get(), 1, id);

        const int rc = sqlite3_step(stmt->get());
        if (rc == SQLITE_DONE)
            return std::optional<email_record>{};
        if (rc != SQLITE_ROW)
            return fail<std::optional<email_record>>(last_error("Cannot read email."));
        return std::optional<email_record>{read_email(stmt->get())};
    }

    result<record_id> create_attachment(const attachment_record& draft) override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("INSERT INTO attachments (email_id, filename, content, content_type) VALUES (?, ?, ?, ?)");
        if (!stmt)
            return fail<record_id>(std::move(stmt).error());
        sqlite3_bind_int64(stmt->get(), 1, draft.email_id);
        bind_text(*stmt, 2, draft.filename);
        sqlite3_bind_zeroblob(stmt->get(), 3, 0);
        bind_text(*stmt, 4, draft.content_type);

        if (sqlite3_step(stmt->get()) != SQLITE_DONE)
            return fail<record_id>(last_error("Cannot insert attachment."));
        return static_cast<record_id>(sqlite3_last_insert_rowid(db_.get()));
    }

    result<std::vector<attachment_record>> attachments_for(record_id email_id) override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("SELECT id, email_id, filename, content_type FROM attachments WHERE email_id = ? ORDER BY id");
        if (!stmt)
            return fail<std::vector<attachment_record>>(std::move(stmt).error());
        sqlite3_bind_int64(stmt->get(), 1, email_id);

        std::vector<attachment_record> out;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW)
        {
            attachment_record rec;
            rec.id = sqlite3_column_int64(stmt->get(), 0);
            rec.email_id = sqlite3_column_int64(stmt->get(), 1);
            rec.filename = column_text(stmt->get(), 2);
            rec.content_type = column_text(stmt->get(), 3);
            out.push_back(std::move(rec));
        }
        if (rc != SQLITE_DONE)
            return fail<std::vector<attachment_record>>(last_error("Cannot list attachments."));
        return out;
    }

    result<std::size_t> delete_attachments(record_id email_id) override
    {
        std::lock_guard lock(mutex_);
        auto stmt = prepare("DELETE FROM attachments WHERE email_id = ?");
        if (!stmt)
            return fail<std::size_t>(std::move(stmt).error());
        sqlite3_bind_int64(stmt->get(), 1, email_id);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE)
            return fail<std::size_t>(last_error("Cannot delete attachments."));
        return static_cast<std::size_t>(sqlite3_changes(db_.get()));
    }

private:
    struct db_closer
    {
        void operator()(sqlite3* db) const noexcept { sqlite3_close(db); }
    };

    struct stmt_finalizer
    {
        void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
    };

    using db_handle = std::unique_ptr<sqlite3, db_closer>;
    using stmt_handle = std::unique_ptr<sqlite3_stmt, stmt_finalizer>;

    static constexpr const char* SCHEMA =
        "CREATE TABLE IF NOT EXISTS emails ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  sender TEXT NOT NULL,"
        "  recipients TEXT NOT NULL,"
        "  subject TEXT NOT NULL,"
        "  body TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  sent_at INTEGER,"
        "  status TEXT NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS attachments ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  email_id INTEGER NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  content BLOB NOT NULL,"
        "  content_type TEXT NOT NULL,"
        "  FOREIGN KEY (email_id) REFERENCES emails(id)"
        ");";

    explicit sqlite_record_store(db_handle db) : db_(std::move(db))
    {
    }

    result_void exec(const char* sql)
    {
        char* message = nullptr;
        if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &message) != SQLITE_OK)
        {
            std::string detail = message != nullptr ? message : "";
            sqlite3_free(message);
            return fail(error_code::record_store_failed, "Cannot create schema.", std::move(detail));
        }
        return ok();
    }

    result<stmt_handle> prepare(const char* sql)
    {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK)
            return fail<stmt_handle>(last_error("Cannot prepare statement."));
        return stmt_handle(raw);
    }

    result<email_status> load_status(record_id id)
    {
        auto stmt = prepare("SELECT status FROM emails WHERE id = ?");
        if (!stmt)
            return fail<email_status>(std::move(stmt).error());
        sqlite3_bind_int64(stmt->get(), 1, id);
        const int rc = sqlite3_step(stmt->get());
        if (rc == SQLITE_DONE)
            return fail<email_status>(error_code::record_not_found, "Email " + std::to_string(id) + " not found.");
        if (rc != SQLITE_ROW)
            return fail<email_status>(last_error("Cannot read email status."));
        const auto status = status_from_string(column_text(stmt->get(), 0));
        if (!status)
            return fail<email_status>(error_code::record_store_failed, "Unknown status stored for email " + std::to_string(id) + ".");
        return *status;
    }

    [[nodiscard]] error last_error(std::string message) const
    {
        return error(error_code::record_store_failed, std::move(message), sqlite3_errmsg(db_.get()));
    }

    static void bind_text(stmt_handle& stmt, int index, std::string_view value)
    {
        sqlite3_bind_text(stmt.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    static std::string column_text(sqlite3_stmt* stmt, int index)
    {
        const auto* text = sqlite3_column_text(stmt, index);
        if (text == nullptr)
            return {};
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
    }

    static email_record read_email(sqlite3_stmt* stmt)
    {
        email_record rec;
        rec.id = sqlite3_column_int64(stmt, 0);
        rec.sender = column_text(stmt, 1);
        rec.recipients = split_recipients(column_text(stmt, 2));
        rec.subject = column_text(stmt, 3);
        rec.body = column_text(stmt, 4);
        rec.created_at = from_millis(sqlite3_column_int64(stmt, 5));
        if (sqlite3_column_type(stmt, 6) != SQLITE_NULL)
            rec.sent_at = from_millis(sqlite3_column_int64(stmt, 6));
        rec.status = status_from_string(column_text(stmt, 7)).value_or(email_status::pending);
        return rec;
    }

    static std::string join_recipients(const std::vector<std::string>& recipients)
    {
        std::string out;
        for (std::size_t i = 0; i < recipients.size(); ++i)
        {
            if (i > 0)
                out += '\n';
            out += recipients[i];
        }
        return out;
    }

    static std::vector<std::string> split_recipients(std::string_view text)
    {
        std::vector<std::string> out;
        while (!text.empty())
        {
            const auto pos = text.find('\n');
            out.emplace_back(text.substr(0, pos));
            if (pos == std::string_view::npos)
                break;
            text.remove_prefix(pos + 1);
        }
        return out;
    }

    static std::int64_t to_millis(std::chrono::system_clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    static std::chrono::system_clock::time_point from_millis(std::int64_t ms)
    {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
    }

    std::mutex mutex_;
    db_handle db_;
};

} // namespace mailstage::store

#undef MAILSTAGE_EMAIL_COLUMNS
