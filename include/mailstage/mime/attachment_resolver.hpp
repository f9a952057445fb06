/*

attachment_resolver.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <boost/algorithm/string/case_conv.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::mime
{

/// Name and media type an attachment is presented with.
struct resolved_attachment
{
    std::string display_filename;
    std::string content_type;
};

inline constexpr std::string_view DEFAULT_CONTENT_TYPE = "application/octet-stream";

/**
Media type for a file extension, case insensitive, without the leading dot.
Unknown extensions yield `application/octet-stream`.
**/
[[nodiscard]] inline std::string_view content_type_for_extension(std::string_view ext)
{
    struct mapping
    {
        std::string_view ext;
        std::string_view type;
    };

    static constexpr mapping TYPES[] =
    {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"pdf", "application/pdf"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"rtf", "application/rtf"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"7z", "application/x-7z-compressed"},
        {"txt", "text/plain"},
        {"csv", "text/csv"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"md", "text/markdown"},
        {"ics", "text/calendar"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"mov", "video/quicktime"}
    };

    const std::string lower = boost::to_lower_copy(std::string(ext));
    for (const auto& m : TYPES)
    {
        if (m.ext == lower)
            return m.type;
    }
    return DEFAULT_CONTENT_TYPE;
}

/**
Recovering the presentation of a staged file.

The display name is the part of the base name after the first `--`, or the whole base name when
there is no separator. The content type comes from the extension of the display name. There are
no failure modes.
**/
[[nodiscard]] inline resolved_attachment resolve(const std::filesystem::path& artifact_path)
{
    const std::string base = artifact_path.filename().string();
    std::string display = base;
    const auto sep = base.find(upload::PREFIX_SEPARATOR);
    if (sep != std::string::npos && sep + upload::PREFIX_SEPARATOR.size() < base.size())
        display = base.substr(sep + upload::PREFIX_SEPARATOR.size());

    std::string_view ext;
    const auto dot = display.rfind('.');
    if (dot != std::string::npos && dot + 1 < display.size())
        ext = std::string_view(display).substr(dot + 1);

    return {display, std::string(content_type_for_extension(ext))};
}

} // namespace mailstage::mime
