#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mailstage::detail
{

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'a' && ca <= 'z')
            ca = static_cast<char>(ca - ('a' - 'A'));
        if (cb >= 'a' && cb <= 'z')
            cb = static_cast<char>(cb - ('a' - 'A'));
        if (ca != cb)
            return false;
    }
    return true;
}

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        if (text.empty())
            break;
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
        {
            out.push_back(text);
            break;
        }
        out.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
}

[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.empty())
        return false;
    for (unsigned char ch : text)
    {
        const bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z')
            || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' || ch == '=';
        if (!ok)
            return false;
    }
    return true;
}

/**
Hide credentials in an SMTP command line before it reaches the trace log.

`AUTH <mech> <initial-response>` keeps the mechanism, and a lone base64 token (an AUTH LOGIN
continuation) is replaced entirely.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n'))
        trimmed.remove_suffix(1);
    const std::string_view suffix = line.substr(trimmed.size());

    std::vector<std::string_view> tokens;
    split_tokens(trimmed, tokens);
    if (tokens.empty())
        return std::string(line);

    bool redacted = false;
    if (iequals_ascii(tokens.front(), "AUTH") && tokens.size() >= 3)
    {
        tokens.resize(3);
        tokens[2] = "<redacted>";
        redacted = true;
    }
    else if (tokens.size() == 1 && looks_like_base64(tokens.front()) && tokens.front().size() >= 4)
    {
        tokens[0] = "<redacted>";
        redacted = true;
    }

    if (!redacted)
        return std::string(line);

    std::string result;
    result.reserve(trimmed.size() + suffix.size() + 16);
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            result.push_back(' ');
        result.append(tokens[i].data(), tokens[i].size());
    }
    result.append(suffix.data(), suffix.size());
    return result;
}

} // namespace mailstage::detail
