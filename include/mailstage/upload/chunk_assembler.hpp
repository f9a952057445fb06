/*

chunk_assembler.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::upload
{

/**
Turns the chunks of an upload session into one artifact file.

Every index is checked for presence before anything is read, and the artifact is written under a
temporary name and renamed into place, so the final path only ever holds a complete file. After
success the chunks and the session directory are removed.
**/
class chunk_assembler
{
public:
    explicit chunk_assembler(chunk_store& store) : store_(store)
    {
    }

    chunk_assembler(const chunk_assembler&) = delete;
    chunk_assembler& operator=(const chunk_assembler&) = delete;

    /**
    Concatenating chunks `0 .. total_chunks - 1` in index order.

    @param upload_id    Session to assemble.
    @param file_name    Original name of the file; becomes the display part of the artifact name.
    @param total_chunks Number of chunks the client announced.
    @return             Path `<staging>/<upload_id>--<file_name>`; `incomplete_upload` listing the
                        missing indices, `upload_busy` while another call assembles the same
                        session, `storage_failed` on read or write errors.
    **/
    [[nodiscard]] result<std::filesystem::path> assemble(std::string_view upload_id, std::string_view file_name,
        std::size_t total_chunks)
    {
        using path_result = result<std::filesystem::path>;

        auto id_ok = validate_upload_id(upload_id);
        if (!id_ok)
            return fail<std::filesystem::path>(std::move(id_ok).error());
        auto name_ok = validate_file_name(file_name);
        if (!name_ok)
            return fail<std::filesystem::path>(std::move(name_ok).error());
        if (total_chunks == 0)
            return fail<std::filesystem::path>(error_code::validation_failed, "Total chunk count must be positive.");

        claim_guard claim(*this, std::string(upload_id));
        if (!claim.owned())
        {
            return fail<std::filesystem::path>(error_code::upload_busy, "Upload is already being assembled.",
                std::string(upload_id));
        }

        // Work is bounded by the chunks on disk, not by the announced count.
        const auto received = store_.received_chunks(upload_id);
        std::size_t present = 0;
        for (const auto index : received)
        {
            if (index < total_chunks)
                ++present;
        }
        if (present != total_chunks)
        {
            std::string detail = missing_detail(received, total_chunks, total_chunks - present);
            MAILSTAGE_WARN("upload " + std::string(upload_id) + " incomplete: " + detail);
            return fail<std::filesystem::path>(error_code::incomplete_upload,
                "Upload " + std::string(upload_id) + " is missing chunks.", std::move(detail));
        }

        const auto final_path = store_.root() / artifact_file_name(upload_id, file_name);
        auto temp_path = final_path;
        temp_path += ".partial";

        path_result written = concatenate(upload_id, total_chunks, temp_path);
        if (!written)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return written;
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return fail<std::filesystem::path>(error_code::storage_failed, "Cannot move artifact into place.",
                final_path.string() + ": " + ec.message());
        }

        remove_session(upload_id, total_chunks);
        MAILSTAGE_INFO("assembled upload " + std::string(upload_id) + " from " + std::to_string(total_chunks)
            + " chunks into " + final_path.string());
        return final_path;
    }

private:
    class claim_guard
    {
    public:
        claim_guard(chunk_assembler& owner, std::string id) : owner_(owner), id_(std::move(id))
        {
            std::lock_guard lock(owner_.claims_mutex_);
            owned_ = owner_.claims_.insert(id_).second;
        }

        ~claim_guard()
        {
            if (!owned_)
                return;
            std::lock_guard lock(owner_.claims_mutex_);
            owner_.claims_.erase(id_);
        }

        claim_guard(const claim_guard&) = delete;
        claim_guard& operator=(const claim_guard&) = delete;

        [[nodiscard]] bool owned() const noexcept
        {
            return owned_;
        }

    private:
        chunk_assembler& owner_;
        std::string id_;
        bool owned_ = false;
    };

    /**
    Formatting `missing=<i>,<j>,...` from the sorted received indices.

    At most `MAX_LISTED_MISSING` indices are listed, followed by `,+<n> more` for the rest.
    **/
    static std::string missing_detail(const std::vector<std::size_t>& received, std::size_t total_chunks,
        std::size_t missing_count)
    {
        std::string detail = "missing=";
        std::size_t listed = 0;
        auto next = received.begin();
        for (std::size_t i = 0; i < total_chunks && listed < MAX_LISTED_MISSING; ++i)
        {
            while (next != received.end() && *next < i)
                ++next;
            if (next != received.end() && *next == i)
                continue;
            if (listed > 0)
                detail += ',';
            detail += std::to_string(i);
            ++listed;
        }
        if (missing_count > listed)
            detail += ",+" + std::to_string(missing_count - listed) + " more";
        return detail;
    }

    result<std::filesystem::path> concatenate(std::string_view upload_id, std::size_t total_chunks,
        const std::filesystem::path& temp_path)
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out)
            return fail<std::filesystem::path>(error_code::storage_failed, "Cannot create artifact.", temp_path.string());

        std::vector<char> buffer(BUFFER_SIZE);
        for (std::size_t i = 0; i < total_chunks; ++i)
        {
            const auto chunk = store_.chunk_path(upload_id, i);
            std::ifstream in(chunk, std::ios::binary);
            if (!in)
                return fail<std::filesystem::path>(error_code::storage_failed, "Cannot open chunk.", chunk.string());

            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto got = in.gcount();
                if (got > 0)
                    out.write(buffer.data(), got);
                if (!out)
                    return fail<std::filesystem::path>(error_code::storage_failed, "Cannot write artifact.", temp_path.string());
            }
            if (in.bad())
                return fail<std::filesystem::path>(error_code::storage_failed, "Cannot read chunk.", chunk.string());
        }

        out.flush();
        if (!out)
            return fail<std::filesystem::path>(error_code::storage_failed, "Cannot write artifact.", temp_path.string());
        return temp_path;
    }

    void remove_session(std::string_view upload_id, std::size_t total_chunks)
    {
        for (std::size_t i = 0; i < total_chunks; ++i)
        {
            std::error_code ec;
            std::filesystem::remove(store_.chunk_path(upload_id, i), ec);
            if (ec)
                MAILSTAGE_WARN("cannot remove chunk " + std::to_string(i) + " of upload " + std::string(upload_id) + ": " + ec.message());
        }

        auto discarded = store_.discard(upload_id);
        if (!discarded)
            MAILSTAGE_WARN("cannot remove upload directory of " + std::string(upload_id) + ": " + discarded.error().to_string());
    }

    static constexpr std::size_t BUFFER_SIZE = 64 * 1024;
    static constexpr std::size_t MAX_LISTED_MISSING = 16;

    chunk_store& store_;
    std::mutex claims_mutex_;
    std::set<std::string> claims_;
};

} // namespace mailstage::upload
