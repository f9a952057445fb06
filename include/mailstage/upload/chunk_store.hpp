/*

chunk_store.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::upload
{

/**
Durable holding area for chunks of in-progress uploads and for directly uploaded attachments.

An upload session exists as long as its directory `<root>/<upload_id>` exists. Writes of the same
index replace each other; the last completed write wins.
**/
class chunk_store
{
public:
    explicit chunk_store(std::filesystem::path root, upload_limits limits = {})
        : root_(std::move(root)), limits_(limits)
    {
    }

    chunk_store(const chunk_store&) = delete;
    chunk_store& operator=(const chunk_store&) = delete;

    /**
    Storing one chunk of an upload.

    @param upload_id   Client chosen session id.
    @param chunk_index Zero based position of the chunk.
    @param bytes       Raw chunk bytes.
    @return            `validation_failed` for a bad id, `payload_too_large` above the chunk
                       ceiling, `storage_failed` when the directory or the file cannot be written.
    **/
    [[nodiscard]] result_void put_chunk(std::string_view upload_id, std::size_t chunk_index, std::string_view bytes)
    {
        MAILSTAGE_TRY_VOID(validate_upload_id(upload_id));
        if (bytes.size() > limits_.max_chunk_bytes)
        {
            return fail(error_code::payload_too_large, "Chunk exceeds the size limit.",
                std::to_string(bytes.size()) + " > " + std::to_string(limits_.max_chunk_bytes));
        }

        const auto dir = session_dir(upload_id);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return fail(error_code::storage_failed, "Cannot create upload directory.", dir.string() + ": " + ec.message());

        MAILSTAGE_TRY_VOID(write_file_atomic(dir / chunk_file_name(chunk_index), bytes));
        MAILSTAGE_DEBUG("stored chunk " + std::to_string(chunk_index) + " of upload " + std::string(upload_id)
            + " (" + std::to_string(bytes.size()) + " bytes)");
        return ok();
    }

    [[nodiscard]] bool has_chunk(std::string_view upload_id, std::size_t chunk_index) const
    {
        if (!is_valid_upload_id(upload_id))
            return false;
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(upload_id, chunk_index), ec);
    }

    /// Indices present for an upload, ascending; empty for an unknown session.
    [[nodiscard]] std::vector<std::size_t> received_chunks(std::string_view upload_id) const
    {
        std::vector<std::size_t> out;
        if (!is_valid_upload_id(upload_id))
            return out;

        std::error_code ec;
        std::filesystem::directory_iterator it(session_dir(upload_id), ec);
        if (ec)
            return out;
        for (const auto& de : it)
        {
            std::error_code type_ec;
            if (!de.is_regular_file(type_ec))
                continue;
            const auto index = parse_chunk_name(de.path().filename().string());
            if (index)
                out.push_back(*index);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    /// Removing a whole session with every chunk it holds.
    [[nodiscard]] result_void discard(std::string_view upload_id)
    {
        MAILSTAGE_TRY_VOID(validate_upload_id(upload_id));
        std::error_code ec;
        std::filesystem::remove_all(session_dir(upload_id), ec);
        if (ec)
            return fail(error_code::storage_failed, "Cannot remove upload directory.", ec.message());
        return ok();
    }

    /**
    Staging a directly uploaded attachment under a collision free name.

    @return Path of the staged file, named `attachment-<millis>-<random>--<file_name>`.
    **/
    [[nodiscard]] result<std::filesystem::path> store_file(std::string_view file_name, std::string_view bytes)
    {
        auto valid = validate_file_name(file_name);
        if (!valid)
            return fail<std::filesystem::path>(std::move(valid).error());
        if (bytes.size() > limits_.max_file_bytes)
        {
            return fail<std::filesystem::path>(error_code::payload_too_large, "File exceeds the size limit.",
                std::to_string(bytes.size()) + " > " + std::to_string(limits_.max_file_bytes));
        }

        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
            return fail<std::filesystem::path>(error_code::storage_failed, "Cannot create staging directory.", ec.message());

        std::string name = unique_prefix();
        name += PREFIX_SEPARATOR;
        name += file_name;
        auto path = root_ / name;
        auto written = write_file_atomic(path, bytes);
        if (!written)
            return fail<std::filesystem::path>(std::move(written).error());
        MAILSTAGE_DEBUG("staged attachment " + path.string());
        return path;
    }

    [[nodiscard]] const std::filesystem::path& root() const noexcept
    {
        return root_;
    }

    [[nodiscard]] const upload_limits& limits() const noexcept
    {
        return limits_;
    }

    [[nodiscard]] std::filesystem::path session_dir(std::string_view upload_id) const
    {
        return root_ / std::string(upload_id);
    }

    [[nodiscard]] std::filesystem::path chunk_path(std::string_view upload_id, std::size_t chunk_index) const
    {
        return session_dir(upload_id) / chunk_file_name(chunk_index);
    }

private:
    static std::optional<std::size_t> parse_chunk_name(std::string_view name)
    {
        constexpr std::string_view prefix = "chunk-";
        if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix)
            return std::nullopt;
        name.remove_prefix(prefix.size());
        std::size_t value = 0;
        const auto res = std::from_chars(name.data(), name.data() + name.size(), value);
        if (res.ec != std::errc{} || res.ptr != name.data() + name.size())
            return std::nullopt;
        return value;
    }

    std::filesystem::path root_;
    upload_limits limits_;
};

} // namespace mailstage::upload
