/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <mailstage/detail/result.hpp>

namespace mailstage
{
namespace detail
{

inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch == '\r' || ch == '\n' || ch == '\0')
            return true;
    }
    return false;
}

[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, const char* field_name)
{
    if (!contains_crlf_or_nul(value))
        return ok();

    std::string message = "Invalid ";
    message += field_name ? field_name : "value";
    message += ": CR/LF or NUL not allowed.";
    return fail(error_code::validation_failed, std::move(message));
}

/// True for a name usable as one path component under a staging directory.
/// Empty names, "." and "..", path separators and NUL are rejected.
[[nodiscard]] inline bool is_safe_path_component(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == "..")
        return false;
    for (char ch : name)
    {
        if (ch == '/' || ch == '\\' || ch == '\0' || ch == '\r' || ch == '\n')
            return false;
    }
    return true;
}

} // namespace detail
} // namespace mailstage
