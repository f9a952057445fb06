/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between SMTP replies, transport errors and mailstage error codes.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/error_detail.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/smtp/types.hpp>

namespace mailstage::smtp
{

enum class command_kind
{
    greeting,
    ehlo,
    helo,
    starttls,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    quit,
    other
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "ehlo";
        case command_kind::helo: return "helo";
        case command_kind::starttls: return "starttls";
        case command_kind::auth: return "auth";
        case command_kind::mail_from: return "mail_from";
        case command_kind::rcpt_to: return "rcpt_to";
        case command_kind::data_cmd: return "data_cmd";
        case command_kind::data_body: return "data_body";
        case command_kind::quit: return "quit";
        case command_kind::other: return "other";
    }
    return "other";
}

[[nodiscard]] constexpr bool is_temporary(int code) noexcept
{
    return code >= 400 && code < 500;
}

[[nodiscard]] constexpr bool is_permanent(int code) noexcept
{
    return code >= 500 && code < 600;
}

/**
Error code for an unexpected reply to a command.
**/
[[nodiscard]] constexpr error_code map_smtp_reply(command_kind k, int code) noexcept
{
    if (code == 421)
        return error_code::delivery_connection_failed;

    if (k == command_kind::auth && (is_temporary(code) || is_permanent(code)))
        return error_code::delivery_auth_failed;

    if (k == command_kind::starttls && (is_temporary(code) || is_permanent(code)))
        return error_code::delivery_tls_failed;

    if (k == command_kind::mail_from || k == command_kind::rcpt_to || k == command_kind::data_body)
    {
        if (is_temporary(code) || is_permanent(code))
            return error_code::delivery_rejected;
    }

    if (k == command_kind::data_cmd && code != 354 && (is_temporary(code) || is_permanent(code)))
        return error_code::delivery_rejected;

    if (k == command_kind::greeting && (is_temporary(code) || is_permanent(code)))
        return error_code::delivery_connection_failed;

    if (is_temporary(code) || is_permanent(code))
        return error_code::delivery_failed;

    return error_code::delivery_protocol_error;
}

/**
Error code for a transport failure while talking to the server.
**/
[[nodiscard]] inline error_code map_transport_error(const asio::error_code& ec) noexcept
{
    if (ec == asio::error::timed_out)
        return error_code::delivery_timeout;
    if (ec == asio::error::message_size || ec == asio::error::invalid_argument)
        return error_code::delivery_protocol_error;
    if (ec.category() == asio::error::get_ssl_category())
        return error_code::delivery_tls_failed;
    return error_code::delivery_connection_failed;
}

/// Enhanced status code (RFC 3463) found in the reply text, e.g. "5.1.1".
[[nodiscard]] inline std::string find_enhanced_status(const std::vector<std::string>& lines)
{
    for (const auto& line : lines)
    {
        for (std::size_t i = 0; i + 4 < line.size(); ++i)
        {
            const char a = line[i];
            const char b = line[i + 1];
            const char c = line[i + 2];
            const char d = line[i + 3];
            const char e = line[i + 4];
            if (a >= '2' && a <= '5' &&
                b == '.' &&
                c >= '0' && c <= '9' &&
                d == '.' &&
                e >= '0' && e <= '9')
            {
                return line.substr(i, 5);
            }
        }
    }
    return {};
}

[[nodiscard]] inline mailstage::detail::error_detail make_smtp_detail(
    std::string_view host,
    command_kind k,
    std::string_view cmd_line_redacted,
    const reply& r)
{
    mailstage::detail::error_detail detail;
    detail.add("proto", "smtp");
    detail.add("host", host);
    detail.add("command", command_name(k));
    if (!cmd_line_redacted.empty())
        detail.add("command.line", cmd_line_redacted);
    detail.add_int("reply.code", static_cast<std::uint64_t>(r.status));
    detail.add_lines("reply.line", r.lines);
    const std::string enhanced = find_enhanced_status(r.lines);
    if (!enhanced.empty())
        detail.add("enhanced", enhanced);
    return detail;
}

/**
Building the error for an unexpected reply.
**/
[[nodiscard]] inline error reply_error(std::string_view host, command_kind k, std::string_view cmd_line_redacted,
    const reply& r, std::string message)
{
    return error(map_smtp_reply(k, r.status), std::move(message),
        make_smtp_detail(host, k, cmd_line_redacted, r).str());
}

/**
Building the error for a transport failure.
**/
[[nodiscard]] inline error transport_error(std::string_view host, command_kind k, const asio::error_code& ec,
    std::string message)
{
    mailstage::detail::error_detail detail;
    detail.add("proto", "smtp");
    detail.add("host", host);
    detail.add("command", command_name(k));
    detail.add_int("transport.code", static_cast<std::uint64_t>(ec.value()));
    detail.add("transport.message", ec.message());
    return error(map_transport_error(ec), std::move(message), detail.str());
}

} // namespace mailstage::smtp
