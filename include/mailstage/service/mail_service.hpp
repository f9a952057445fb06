/*

mail_service.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/mime/attachment_resolver.hpp>
#include <mailstage/pipeline/send_pipeline.hpp>
#include <mailstage/store/record_store.hpp>
#include <mailstage/upload/chunk_assembler.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::service
{

/// One chunk as received from a client; indices are signed so that bad input can be reported.
struct chunk_request
{
    std::string upload_id;
    std::string file_name;
    std::int64_t chunk_index = -1;
    std::int64_t total_chunks = 0;
    std::string_view bytes;
};

struct chunk_receipt
{
    std::size_t chunk_index = 0;
    std::size_t total_chunks = 0;
};

struct complete_request
{
    std::string upload_id;
    std::string file_name;
    std::int64_t total_chunks = 0;
    /// Echoed back; the content type of the attachment is resolved from the file name.
    std::string mime_type;
};

struct staged_file
{
    std::filesystem::path file_path;
    std::string file_name;
    std::string mime_type;
};

/**
Transport independent entry point of the service.

Checks what a client can get wrong (ids, indices, sizes, paths) and hands the rest to the
staging, assembly and send components.
**/
class mail_service
{
public:
    mail_service(upload::chunk_store& chunks, store::record_store& records, delivery::delivery_client& delivery)
        : chunks_(chunks), assembler_(chunks), records_(records), pipeline_(records, delivery)
    {
    }

    mail_service(const mail_service&) = delete;
    mail_service& operator=(const mail_service&) = delete;

    /**
    Storing one chunk of an upload session.

    @return Position of the accepted chunk, `validation_failed` for a bad id, name or index,
            `payload_too_large` or `storage_failed`.
    **/
    [[nodiscard]] result<chunk_receipt> receive_chunk(const chunk_request& req)
    {
        MAILSTAGE_TRY_VOID(upload::validate_upload_id(req.upload_id));
        MAILSTAGE_TRY_VOID(upload::validate_file_name(req.file_name));
        if (req.total_chunks <= 0)
            return fail<chunk_receipt>(error_code::validation_failed, "Total chunks must be positive.",
                std::to_string(req.total_chunks));
        if (req.chunk_index < 0 || req.chunk_index >= req.total_chunks)
            return fail<chunk_receipt>(error_code::validation_failed, "Chunk index out of range.",
                std::to_string(req.chunk_index) + " not in [0, " + std::to_string(req.total_chunks) + ")");

        const auto index = static_cast<std::size_t>(req.chunk_index);
        MAILSTAGE_TRY_VOID(chunks_.put_chunk(req.upload_id, index, req.bytes));
        return chunk_receipt{index, static_cast<std::size_t>(req.total_chunks)};
    }

    /**
    Assembling the chunks of a session into its artifact.

    @return Artifact path, `incomplete_upload` with the missing indices, `upload_busy` or
            `storage_failed`.
    **/
    [[nodiscard]] result<staged_file> complete_upload(const complete_request& req)
    {
        MAILSTAGE_TRY_VOID(upload::validate_upload_id(req.upload_id));
        MAILSTAGE_TRY_VOID(upload::validate_file_name(req.file_name));
        if (req.total_chunks <= 0)
            return fail<staged_file>(error_code::validation_failed, "Total chunks must be positive.",
                std::to_string(req.total_chunks));

        auto artifact = assembler_.assemble(req.upload_id, req.file_name, static_cast<std::size_t>(req.total_chunks));
        if (!artifact)
            return fail<staged_file>(std::move(artifact).error());

        staged_file out;
        out.file_path = std::move(*artifact);
        out.file_name = req.file_name;
        out.mime_type = req.mime_type.empty() ? mime::resolve(out.file_path).content_type : req.mime_type;
        return out;
    }

    /**
    Staging a file uploaded in a single request.
    **/
    [[nodiscard]] result<staged_file> store_direct_upload(std::string_view file_name, std::string_view bytes)
    {
        auto path = chunks_.store_file(file_name, bytes);
        if (!path)
            return fail<staged_file>(std::move(path).error());

        staged_file out;
        out.file_path = std::move(*path);
        out.file_name = std::string(file_name);
        out.mime_type = mime::resolve(out.file_path).content_type;
        return out;
    }

    /**
    Running a send attempt.

    Attachment paths must name finished artifacts directly inside the staging directory; chunks
    of sessions still being uploaded are refused.
    **/
    [[nodiscard]] result<store::record_id> send(const pipeline::send_request& req)
    {
        for (const auto& path : req.attachments)
        {
            if (!upload::is_staged_artifact(chunks_.root(), path))
                return fail<store::record_id>(error_code::validation_failed,
                    "Attachment path is not a staged file.", path.string());
        }
        return pipeline_.send(req);
    }

    [[nodiscard]] result<std::vector<store::email_record>> list_emails()
    {
        return records_.list_emails();
    }

    /**
    @return The record, or `record_not_found`.
    **/
    [[nodiscard]] result<store::email_record> get_email(store::record_id id)
    {
        auto found = records_.find_email(id);
        if (!found)
            return fail<store::email_record>(std::move(found).error());
        if (!found->has_value())
            return fail<store::email_record>(error_code::record_not_found, "Email not found", std::to_string(id));
        return std::move(**found);
    }

    [[nodiscard]] const upload::chunk_store& chunks() const noexcept
    {
        return chunks_;
    }

private:
    upload::chunk_store& chunks_;
    upload::chunk_assembler assembler_;
    store::record_store& records_;
    pipeline::send_pipeline pipeline_;
};

} // namespace mailstage::service
