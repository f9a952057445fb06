#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace mailstage
{
namespace detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.reserve(out.size() + sv.size());
    out.append(sv.data(), sv.size());
}

inline void append_crlf(std::string& out)
{
    out.reserve(out.size() + 2);
    out.append("\r\n", 2);
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc())
        return;
    const auto len = static_cast<std::size_t>(result.ptr - buffer);
    out.reserve(out.size() + len);
    out.append(buffer, len);
}

inline void append_angle_addr(std::string& out, std::string_view addr)
{
    out.reserve(out.size() + addr.size() + 2);
    out.push_back('<');
    out.append(addr.data(), addr.size());
    out.push_back('>');
}

/// Header line "Name: value\r\n"
inline void append_header(std::string& out, std::string_view name, std::string_view value)
{
    out.reserve(out.size() + name.size() + value.size() + 4);
    out.append(name.data(), name.size());
    out.append(": ", 2);
    out.append(value.data(), value.size());
    append_crlf(out);
}

/// Quoted-string as used in MIME parameters; backslash and quote are escaped
inline void append_quoted(std::string& out, std::string_view value)
{
    out.reserve(out.size() + value.size() + 2);
    out.push_back('"');
    for (char ch : value)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
}

} // namespace detail
} // namespace mailstage
