/*

composer.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Rendering of an outbound message into an RFC 5322 / MIME document.

Structure of the result:

    multipart/mixed                  (only when there are attachments)
        multipart/alternative        (only when both bodies are set)
            text/plain; charset=utf-8
            text/html; charset=utf-8
        <attachment>...

All bodies are base64 encoded with 76 character lines; lines end with CRLF. Boundaries start with
"=_", a sequence that cannot occur in base64 text.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include <mailstage/codec/base64.hpp>
#include <mailstage/detail/append.hpp>
#include <mailstage/detail/redact.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/detail/sanitize.hpp>
#include <mailstage/mime/outbound_message.hpp>

namespace mailstage::mime
{

struct compose_options
{
    /// Right hand side of generated Message-IDs.
    std::string domain = "mailstage.local";

    /// Fixed time for the Date header; the current time when unset.
    std::optional<std::chrono::system_clock::time_point> date;
};

namespace detail
{

inline constexpr std::string_view BOUNDARY_DELIMITER = "--";

[[nodiscard]] inline bool is_ascii(std::string_view text) noexcept
{
    for (unsigned char ch : text)
    {
        if (ch >= 0x80)
            return false;
    }
    return true;
}

/**
RFC 2047 `B` encoding of a header value.

ASCII values are returned unchanged. Otherwise the UTF-8 text is split into encoded words of at most
45 octets (60 encoded characters), never inside a multibyte sequence, joined by a folding CRLF SP.
**/
[[nodiscard]] inline std::string encode_header_word(std::string_view text)
{
    if (is_ascii(text))
        return std::string(text);

    constexpr std::size_t MAX_OCTETS = 45;
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t end = std::min(pos + MAX_OCTETS, text.size());
        // Back off to the start of a UTF-8 sequence.
        while (end < text.size() && end > pos && (static_cast<unsigned char>(text[end]) & 0xc0) == 0x80)
            --end;
        if (end == pos)
            end = std::min(pos + MAX_OCTETS, text.size());

        if (!out.empty())
            out += "\r\n ";
        out += "=?UTF-8?B?";
        out += base64::encode_flat(text.substr(pos, end - pos));
        out += "?=";
        pos = end;
    }
    return out;
}

/// RFC 5322 date in UTC, e.g. "Fri, 21 Nov 1997 09:55:06 +0000".
[[nodiscard]] inline std::string format_date(std::chrono::system_clock::time_point tp)
{
    static constexpr const char* DAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep",
        "Oct", "Nov", "Dec"};

    const auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif
    return std::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} +0000",
        DAYS[tm_buf.tm_wday % 7], tm_buf.tm_mday, MONTHS[tm_buf.tm_mon % 12], tm_buf.tm_year + 1900,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
}

[[nodiscard]] inline std::uint64_t random_u64()
{
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());
    std::lock_guard lock(rng_mutex);
    return rng();
}

[[nodiscard]] inline std::string random_hex(std::size_t words)
{
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    for (std::size_t w = 0; w < words; ++w)
    {
        auto v = random_u64();
        for (int i = 0; i < 16; ++i)
        {
            out += HEX[v & 0x0f];
            v >>= 4;
        }
    }
    return out;
}

/// Strip line breaks from already encoded base64 text.
[[nodiscard]] inline std::string strip_line_breaks(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        if (ch != '\r' && ch != '\n')
            out += ch;
    }
    return out;
}

inline void append_base64_body(std::string& out, std::string_view encoded)
{
    const base64 wrapper(base64::MIME_LINE_POLICY);
    for (const auto& line : wrapper.wrap(encoded))
    {
        if (line.empty())
            continue;
        mailstage::detail::append_sv(out, line);
        mailstage::detail::append_crlf(out);
    }
}

inline void append_text_part(std::string& out, std::string_view subtype, std::string_view body)
{
    mailstage::detail::append_header(out, "Content-Type", "text/" + std::string(subtype) + "; charset=utf-8");
    mailstage::detail::append_header(out, "Content-Transfer-Encoding", "base64");
    mailstage::detail::append_crlf(out);
    append_base64_body(out, base64::encode_flat(body));
}

[[nodiscard]] inline std::string quoted_param(std::string_view value)
{
    std::string out;
    mailstage::detail::append_quoted(out, value);
    return out;
}

} // namespace detail

/**
Rendering the message.

@param msg  Message to render.
@param opts Message-ID domain and optional fixed date.
@return     The document, or `validation_failed` for a missing sender or recipient, a line break
            in a header value, or attachment content that is not base64.
**/
[[nodiscard]] inline result<std::string> compose(const outbound_message& msg, const compose_options& opts = {})
{
    using mailstage::detail::ensure_no_crlf_or_nul;
    using mailstage::detail::append_header;
    using mailstage::detail::append_crlf;
    using mailstage::detail::append_sv;

    if (msg.from.empty())
        return fail<std::string>(error_code::validation_failed, "Sender is required.");
    if (msg.to.empty())
        return fail<std::string>(error_code::validation_failed, "At least one recipient is required.");

    auto check = [](std::string_view value, const char* field) -> result_void
    {
        return ensure_no_crlf_or_nul(value, field);
    };
    MAILSTAGE_TRY_VOID(check(msg.from, "sender"));
    for (const auto& rcpt : msg.to)
    {
        if (rcpt.empty())
            return fail<std::string>(error_code::validation_failed, "Empty recipient.");
        MAILSTAGE_TRY_VOID(check(rcpt, "recipient"));
    }
    MAILSTAGE_TRY_VOID(check(msg.subject, "subject"));
    MAILSTAGE_TRY_VOID(check(opts.domain, "domain"));

    std::vector<std::string> encoded_attachments;
    encoded_attachments.reserve(msg.attachments.size());
    for (const auto& att : msg.attachments)
    {
        MAILSTAGE_TRY_VOID(check(att.filename, "attachment filename"));
        MAILSTAGE_TRY_VOID(check(att.type, "attachment type"));
        MAILSTAGE_TRY_VOID(check(att.disposition, "attachment disposition"));
        auto flat = detail::strip_line_breaks(att.content);
        if (!flat.empty() && !mailstage::detail::looks_like_base64(flat))
        {
            return fail<std::string>(error_code::validation_failed, "Attachment content is not base64.",
                att.filename);
        }
        encoded_attachments.push_back(std::move(flat));
    }

    std::string out;
    append_header(out, "From", msg.from);
    std::string to_line;
    for (std::size_t i = 0; i < msg.to.size(); ++i)
    {
        if (i > 0)
            to_line += ",\r\n ";
        to_line += msg.to[i];
    }
    append_header(out, "To", to_line);
    append_header(out, "Subject", detail::encode_header_word(msg.subject));
    append_header(out, "Date", detail::format_date(opts.date.value_or(std::chrono::system_clock::now())));
    append_header(out, "Message-ID", "<" + detail::random_hex(2) + "@" + opts.domain + ">");
    append_header(out, "MIME-Version", "1.0");

    // Body section: a single text part or a multipart/alternative holding both.
    auto append_body = [&msg](std::string& dst)
    {
        const bool has_text = !msg.text.empty() || msg.html.empty();
        const bool has_html = !msg.html.empty();
        if (has_text && has_html)
        {
            const std::string alt = "=_alt_" + detail::random_hex(2);
            append_header(dst, "Content-Type", "multipart/alternative; boundary=" + detail::quoted_param(alt));
            append_crlf(dst);
            append_sv(dst, detail::BOUNDARY_DELIMITER);
            append_sv(dst, alt);
            append_crlf(dst);
            detail::append_text_part(dst, "plain", msg.text);
            append_sv(dst, detail::BOUNDARY_DELIMITER);
            append_sv(dst, alt);
            append_crlf(dst);
            detail::append_text_part(dst, "html", msg.html);
            append_sv(dst, detail::BOUNDARY_DELIMITER);
            append_sv(dst, alt);
            append_sv(dst, detail::BOUNDARY_DELIMITER);
            append_crlf(dst);
        }
        else if (has_html)
            detail::append_text_part(dst, "html", msg.html);
        else
            detail::append_text_part(dst, "plain", msg.text);
    };

    if (msg.attachments.empty())
    {
        append_body(out);
        return out;
    }

    const std::string mixed = "=_mixed_" + detail::random_hex(2);

    append_header(out, "Content-Type", "multipart/mixed; boundary=" + detail::quoted_param(mixed));
    append_crlf(out);
    append_sv(out, detail::BOUNDARY_DELIMITER);
    append_sv(out, mixed);
    append_crlf(out);
    append_body(out);

    for (std::size_t i = 0; i < msg.attachments.size(); ++i)
    {
        const auto& att = msg.attachments[i];
        const std::string type = att.type.empty() ? "application/octet-stream" : att.type;
        const std::string name = detail::quoted_param(detail::encode_header_word(att.filename));

        append_sv(out, detail::BOUNDARY_DELIMITER);
        append_sv(out, mixed);
        append_crlf(out);
        append_header(out, "Content-Type", type + "; name=" + name);
        append_header(out, "Content-Transfer-Encoding", "base64");
        append_header(out, "Content-Disposition", (att.disposition.empty() ? std::string("attachment") : att.disposition)
            + "; filename=" + name);
        append_crlf(out);
        detail::append_base64_body(out, encoded_attachments[i]);
    }

    append_sv(out, detail::BOUNDARY_DELIMITER);
    append_sv(out, mixed);
    append_sv(out, detail::BOUNDARY_DELIMITER);
    append_crlf(out);
    return out;
}

} // namespace mailstage::mime
