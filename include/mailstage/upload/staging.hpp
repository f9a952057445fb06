/*

staging.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Naming and file helpers shared by everything that writes into the staging directory.

Layout:

    <staging>/<upload_id>/chunk-<i>             received chunk
    <staging>/<upload_id>--<file_name>          assembled artifact
    <staging>/attachment-<ms>-<rnd>--<file>     directly uploaded attachment

The part after the first "--" of a staged file name is the name shown to recipients.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <mailstage/detail/result.hpp>
#include <mailstage/detail/sanitize.hpp>

namespace mailstage::upload
{

/// Separates the uniqueness prefix of a staged file from the name shown to recipients.
inline constexpr std::string_view PREFIX_SEPARATOR = "--";

/// Size ceilings applied to request bodies.
struct upload_limits
{
    std::size_t max_chunk_bytes = 50 * 1024 * 1024;
    std::size_t max_file_bytes = 25 * 1024 * 1024;
};

/**
Checking an upload id: letters, digits, '.', '_' and '-' only, no leading '.', no "--".

The separator is excluded so the display name of an artifact can always be recovered.
**/
[[nodiscard]] inline bool is_valid_upload_id(std::string_view id) noexcept
{
    if (id.empty() || id.size() > 128 || id.front() == '.')
        return false;
    if (id.find(PREFIX_SEPARATOR) != std::string_view::npos)
        return false;
    for (char ch : id)
    {
        const bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
            || ch == '.' || ch == '_' || ch == '-';
        if (!ok)
            return false;
    }
    return true;
}

[[nodiscard]] inline result_void validate_upload_id(std::string_view id)
{
    if (is_valid_upload_id(id))
        return ok();
    return fail(error_code::validation_failed, "Invalid upload id.", std::string(id));
}

[[nodiscard]] inline result_void validate_file_name(std::string_view name)
{
    if (detail::is_safe_path_component(name))
        return ok();
    return fail(error_code::validation_failed, "Invalid file name.", std::string(name));
}

[[nodiscard]] inline std::string chunk_file_name(std::size_t index)
{
    return "chunk-" + std::to_string(index);
}

[[nodiscard]] inline std::string artifact_file_name(std::string_view upload_id, std::string_view file_name)
{
    std::string out(upload_id);
    out += PREFIX_SEPARATOR;
    out += file_name;
    return out;
}

/// "attachment-<millis>-<random>", unique enough for concurrent direct uploads.
[[nodiscard]] inline std::string unique_prefix()
{
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());

    std::uint32_t rnd = 0;
    {
        std::lock_guard lock(rng_mutex);
        rnd = static_cast<std::uint32_t>(rng());
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "attachment-" + std::to_string(ms) + "-" + std::to_string(rnd);
}

/**
Reading a whole file.

@return Bytes, or `storage_failed` when the file cannot be opened or read.
**/
[[nodiscard]] inline result<std::string> read_file(const std::filesystem::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return fail<std::string>(error_code::storage_failed, "Cannot open file for reading.", path.string());

    std::string out;
    ifs.seekg(0, std::ios::end);
    const auto sz = ifs.tellg();
    if (sz < 0)
        return fail<std::string>(error_code::storage_failed, "Cannot determine file size.", path.string());
    out.resize(static_cast<std::size_t>(sz));
    ifs.seekg(0, std::ios::beg);
    ifs.read(out.data(), static_cast<std::streamsize>(out.size()));
    if (!ifs)
        return fail<std::string>(error_code::storage_failed, "Cannot read file.", path.string());
    return out;
}

/**
Writing a file so that readers see either the old or the new content.

The bytes go to a private `<path>.<n>.part` first which is then renamed over `path`, so of
two concurrent writers the last rename wins.
**/
[[nodiscard]] inline result_void write_file_atomic(const std::filesystem::path& path, std::string_view bytes)
{
    static std::atomic<std::uint64_t> counter{0};
    auto tmp_path = path;
    tmp_path += "." + std::to_string(++counter) + ".part";
    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return fail(error_code::storage_failed, "Cannot open file for writing.", tmp_path.string());
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs)
        {
            ofs.close();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return fail(error_code::storage_failed, "Cannot write file.", tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return fail(error_code::storage_failed, "Cannot move file into place.", path.string() + ": " + ec.message());
    }
    return ok();
}

/**
True when `candidate` is a finished artifact of the staging directory `root`.

Accepted are regular files directly inside `root` named `<prefix>--<name>`. Chunks and session
directories below `root`, and the `.partial` and `.<n>.part` files still being written, are refused.
**/
[[nodiscard]] inline bool is_staged_artifact(const std::filesystem::path& root, const std::filesystem::path& candidate)
{
    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(root, ec);
    if (ec)
        return false;
    if (!base.has_filename())
        base = base.parent_path();
    const auto full = std::filesystem::weakly_canonical(candidate, ec);
    if (ec)
        return false;
    if (full.parent_path() != base)
        return false;
    if (!std::filesystem::is_regular_file(full, ec))
        return false;

    const std::string name = full.filename().string();
    const auto sep = name.find(PREFIX_SEPARATOR);
    if (sep == std::string::npos || sep == 0 || sep + PREFIX_SEPARATOR.size() == name.size())
        return false;
    if (name.ends_with(".partial"))
        return false;
    if (name.ends_with(".part"))
    {
        // write_file_atomic names its temporary `<target>.<n>.part`.
        const std::string_view stem(name.data(), name.size() - 5);
        const auto dot = stem.rfind('.');
        if (dot != std::string_view::npos && dot + 1 < stem.size()
            && stem.find_first_not_of("0123456789", dot + 1) == std::string_view::npos)
            return false;
    }
    return true;
}

} // namespace mailstage::upload
