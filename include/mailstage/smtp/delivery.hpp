/*

delivery.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SMTP delivery of outbound messages (RFC 5321).

Every call to `send` opens its own connection and runs one transaction on a private io_context:

    greeting, EHLO (HELO fallback), [STARTTLS, EHLO], [AUTH], MAIL FROM, RCPT TO..., DATA, QUIT

*/


#pragma once

#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailstage/codec/base64.hpp>
#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/redact.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/detail/sanitize.hpp>
#include <mailstage/mime/composer.hpp>
#include <mailstage/net/dialog.hpp>
#include <mailstage/net/upgradable_stream.hpp>
#include <mailstage/smtp/error_mapping.hpp>
#include <mailstage/smtp/types.hpp>

namespace mailstage::smtp
{

using mailstage::asio::awaitable;
using mailstage::asio::tcp;

/**
Doubling every leading dot of a line and appending the end of data marker.
**/
[[nodiscard]] inline std::string dot_stuff(std::string_view document)
{
    std::string out;
    out.reserve(document.size() + document.size() / 64 + 5);
    bool line_start = true;
    for (char ch : document)
    {
        if (line_start && ch == '.')
            out += '.';
        out += ch;
        line_start = ch == '\n';
    }
    if (out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0)
        out += "\r\n";
    out += ".\r\n";
    return out;
}

class delivery : public mailstage::delivery::delivery_client
{
public:
    explicit delivery(options opts) : options_(std::move(opts))
    {
    }

    /**
    Sending the message in one SMTP transaction.

    @return `delivery_*` errors with the server reply in the detail; `validation_failed` when the
            message cannot be rendered.
    **/
    result_void send(const mime::outbound_message& msg) override
    {
        if (options_.host.empty())
            return fail(error_code::delivery_failed, "SMTP host is not configured.");

        mime::compose_options compose_opts;
        if (!options_.helo_name.empty())
            compose_opts.domain = options_.helo_name;
        auto document = mime::compose(msg, compose_opts);
        if (!document)
            return fail(std::move(document).error());

        asio::io_context ctx;
        std::optional<result_void> outcome;
        asio::co_spawn(ctx, transaction(msg, std::move(*document)),
            [&outcome](std::exception_ptr ep, result_void res)
            {
                if (!ep)
                {
                    outcome = std::move(res);
                    return;
                }
                try
                {
                    std::rethrow_exception(ep);
                }
                catch (const std::exception& exc)
                {
                    outcome = fail(error_code::internal_error, "SMTP transaction aborted.", exc.what());
                }
            });
        ctx.run();

        if (!outcome)
            return fail(error_code::internal_error, "SMTP transaction did not complete.");
        if (*outcome)
            MAILSTAGE_INFO("message for " + std::to_string(msg.to.size()) + " recipient(s) accepted by " + options_.host);
        else
            MAILSTAGE_WARN("SMTP delivery via " + options_.host + " failed: " + outcome->error().to_string());
        return std::move(*outcome);
    }

    [[nodiscard]] const options& config() const noexcept
    {
        return options_;
    }

private:
    using dialog_type = mailstage::net::dialog<mailstage::net::upgradable_stream>;

    /**
    State of one connection.
    **/
    struct session
    {
        const options& opts;
        std::optional<dialog_type> dlg;
        asio::ssl::context ssl_ctx{asio::ssl::context::tls_client};
        capabilities caps;
        bool tls_active = false;

        explicit session(const options& o) : opts(o)
        {
        }

        awaitable<result<reply>> read_reply(command_kind kind)
        {
            reply rep;
            while (true)
            {
                auto [ec, line] = co_await dlg->read_line();
                if (ec)
                    co_return fail<reply>(transport_error(opts.host, kind, ec, "Cannot read SMTP reply."));
                if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0]))
                    || !std::isdigit(static_cast<unsigned char>(line[1]))
                    || !std::isdigit(static_cast<unsigned char>(line[2])))
                {
                    co_return fail<reply>(error_code::delivery_protocol_error, "Parsing server failure.", line);
                }

                const int code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
                bool last = true;
                if (line.size() >= 4)
                {
                    if (line[3] == '-')
                        last = false;
                    else if (line[3] != ' ')
                        co_return fail<reply>(error_code::delivery_protocol_error, "Parsing server failure.", line);
                }

                if (rep.status == 0)
                    rep.status = code;
                else if (rep.status != code)
                    co_return fail<reply>(error_code::delivery_protocol_error, "Inconsistent multi-line reply.", line);
                rep.lines.push_back(line.size() > 4 ? line.substr(4) : std::string());

                if (last)
                    break;
            }
            co_return rep;
        }

        awaitable<result<reply>> command(std::string_view line, command_kind kind)
        {
            auto ec = co_await dlg->write_line(line);
            if (ec)
                co_return fail<reply>(transport_error(opts.host, kind, ec, "Cannot send SMTP command."));
            co_return co_await read_reply(kind);
        }

        /// Command whose reply must have the given first digit.
        awaitable<result<reply>> expect(std::string_view line, command_kind kind, int klass, std::string message)
        {
            MAILSTAGE_CO_TRY_ASSIGN(rep, co_await command(line, kind));
            if (rep.status / 100 != klass)
                co_return fail<reply>(reply_error(opts.host, kind, mailstage::detail::redact_line(line), rep, std::move(message)));
            co_return rep;
        }

        awaitable<result_void> connect()
        {
            auto executor = co_await asio::this_coro::executor;

            tcp::resolver resolver(executor);
            asio::steady_timer timer(executor);
            timer.expires_after(opts.timeout);
            bool timed_out = false;
            timer.async_wait([&](asio::error_code ec)
            {
                if (ec)
                    return;
                timed_out = true;
                resolver.cancel();
            });

            asio::error_code ec;
            auto endpoints = co_await resolver.async_resolve(opts.host, std::to_string(opts.port),
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                timer.cancel();
                if (timed_out)
                    ec = asio::error::timed_out;
                co_return fail(transport_error(opts.host, command_kind::greeting, ec, "Cannot resolve SMTP host."));
            }

            tcp::socket socket(executor);
            timer.async_wait([&](asio::error_code timer_ec)
            {
                if (timer_ec)
                    return;
                timed_out = true;
                asio::error_code ignored;
                socket.close(ignored);
            });
            co_await asio::async_connect(socket, endpoints, asio::redirect_error(asio::use_awaitable, ec));
            timer.cancel();
            if (ec)
            {
                if (timed_out)
                    ec = asio::error::timed_out;
                co_return fail(transport_error(opts.host, command_kind::greeting, ec, "Cannot connect to SMTP host."));
            }

            net::upgradable_stream stream(std::move(socket));
            if (opts.tls_mode == net::tls_mode::implicit)
            {
                auto tls = co_await stream.start_tls(ssl_ctx, opts.host, opts.tls);
                if (!tls)
                    co_return fail(std::move(tls).error());
                tls_active = true;
            }

            dlg.emplace(std::move(stream), net::DEFAULT_MAX_LINE_LENGTH, opts.timeout);
            dlg->set_trace_protocol("SMTP");
            co_return ok();
        }

        awaitable<result_void> hello()
        {
            std::string name = opts.helo_name;
            if (name.empty())
            {
                asio::error_code ec;
                name = asio::ip::host_name(ec);
                if (ec || name.empty())
                    name = "localhost";
            }
            MAILSTAGE_CO_TRY_VOID(mailstage::detail::ensure_no_crlf_or_nul(name, "helo name"));

            MAILSTAGE_CO_TRY_ASSIGN(rep, co_await command("EHLO " + name, command_kind::ehlo));
            if (rep.is_positive_completion())
            {
                parse_capabilities(rep);
                co_return ok();
            }
            if (rep.status != 500 && rep.status != 502 && rep.status != 504)
                co_return fail(reply_error(opts.host, command_kind::ehlo, "EHLO " + name, rep, "EHLO rejection."));

            MAILSTAGE_CO_TRY_VOID(co_await expect("HELO " + name, command_kind::helo, 2, "HELO rejection."));
            caps.entries.clear();
            co_return ok();
        }

        awaitable<result_void> start_tls()
        {
            if (!caps.supports("STARTTLS"))
                co_return fail(error_code::delivery_tls_failed, "STARTTLS not supported.", "Server did not advertise STARTTLS.");
            MAILSTAGE_CO_TRY_VOID(co_await expect("STARTTLS", command_kind::starttls, 2, "STARTTLS failure."));
            if (dlg->has_buffered_input())
                co_return fail(error_code::delivery_protocol_error, "Unexpected data after STARTTLS reply.");

            net::upgradable_stream stream = std::move(dlg->stream());
            dlg.reset();
            auto tls = co_await stream.start_tls(ssl_ctx, opts.host, opts.tls);
            if (!tls)
                co_return fail(std::move(tls).error());
            tls_active = true;
            dlg.emplace(std::move(stream), net::DEFAULT_MAX_LINE_LENGTH, opts.timeout);
            dlg->set_trace_protocol("SMTP");
            caps.entries.clear();
            co_return ok();
        }

        awaitable<result_void> authenticate()
        {
            if (!tls_active && !opts.allow_cleartext_auth)
                co_return fail(error_code::delivery_auth_failed, "Refusing to authenticate over a cleartext connection.");
            MAILSTAGE_CO_TRY_VOID(mailstage::detail::ensure_no_crlf_or_nul(opts.username, "username"));

            auth_method method = opts.auth;
            if (method == auth_method::automatic)
                method = caps.supports_auth("PLAIN") || !caps.supports_auth("LOGIN") ? auth_method::plain : auth_method::login;

            if (method == auth_method::plain)
            {
                std::string token;
                token.push_back('\0');
                token += opts.username;
                token.push_back('\0');
                token += opts.password;
                const std::string encoded = base64::encode_flat(token);

                MAILSTAGE_CO_TRY_ASSIGN(rep, co_await command("AUTH PLAIN " + encoded, command_kind::auth));
                if (rep.status == 334)
                {
                    auto cont = co_await command(encoded, command_kind::auth);
                    if (!cont)
                        co_return fail(std::move(cont).error());
                    rep = std::move(*cont);
                }
                if (!rep.is_positive_completion())
                    co_return fail(reply_error(opts.host, command_kind::auth, "AUTH PLAIN <redacted>", rep, "Authentication rejection."));
                co_return ok();
            }

            MAILSTAGE_CO_TRY_VOID(co_await expect("AUTH LOGIN", command_kind::auth, 3, "Authentication rejection."));
            MAILSTAGE_CO_TRY_VOID(co_await expect(base64::encode_flat(opts.username), command_kind::auth, 3,
                "Username rejection."));
            MAILSTAGE_CO_TRY_VOID(co_await expect(base64::encode_flat(opts.password), command_kind::auth, 2,
                "Password rejection."));
            co_return ok();
        }

        void parse_capabilities(const reply& rep)
        {
            caps.entries.clear();
            // The first line carries the server name.
            for (std::size_t i = 1; i < rep.lines.size(); ++i)
            {
                std::vector<std::string_view> tokens;
                mailstage::detail::split_tokens(rep.lines[i], tokens);
                if (tokens.empty())
                    continue;
                auto& slot = caps.entries[capabilities::normalize_key(tokens.front())];
                for (std::size_t t = 1; t < tokens.size(); ++t)
                    slot.emplace_back(tokens[t]);
            }
        }

        void close()
        {
            if (!dlg)
                return;
            asio::error_code ec;
            dlg->stream().lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
            dlg->stream().lowest_layer().close(ec);
        }
    };

    awaitable<result_void> transaction(const mime::outbound_message& msg, std::string document)
    {
        MAILSTAGE_CO_TRY_VOID(mailstage::detail::ensure_no_crlf_or_nul(msg.from, "sender"));
        for (const auto& rcpt : msg.to)
            MAILSTAGE_CO_TRY_VOID(mailstage::detail::ensure_no_crlf_or_nul(rcpt, "recipient"));

        session s(options_);
        MAILSTAGE_CO_TRY_VOID(co_await s.connect());
        MAILSTAGE_DEBUG("connected to " + options_.host + ":" + std::to_string(options_.port));

        auto outcome = co_await run(s, msg, document);
        s.close();
        co_return outcome;
    }

    awaitable<result_void> run(session& s, const mime::outbound_message& msg, const std::string& document)
    {
        MAILSTAGE_CO_TRY_ASSIGN(greeting, co_await s.read_reply(command_kind::greeting));
        if (greeting.status != 220)
            co_return fail(reply_error(options_.host, command_kind::greeting, {}, greeting, "Connection rejection."));

        MAILSTAGE_CO_TRY_VOID(co_await s.hello());
        if (options_.tls_mode == net::tls_mode::starttls)
        {
            MAILSTAGE_CO_TRY_VOID(co_await s.start_tls());
            MAILSTAGE_CO_TRY_VOID(co_await s.hello());
        }
        if (!options_.username.empty())
            MAILSTAGE_CO_TRY_VOID(co_await s.authenticate());

        std::string mail_from = "MAIL FROM:<" + msg.from + ">";
        MAILSTAGE_CO_TRY_VOID(co_await s.expect(mail_from, command_kind::mail_from, 2, "Mail sender rejection."));
        for (const auto& rcpt : msg.to)
        {
            MAILSTAGE_CO_TRY_VOID(co_await s.expect("RCPT TO:<" + rcpt + ">", command_kind::rcpt_to, 2,
                "Mail recipient rejection."));
        }
        MAILSTAGE_CO_TRY_VOID(co_await s.expect("DATA", command_kind::data_cmd, 3, "Mail message rejection."));

        const std::string payload = dot_stuff(document);
        auto ec = co_await s.dlg->write_raw(payload);
        if (ec)
            co_return fail(transport_error(options_.host, command_kind::data_body, ec, "Cannot send message body."));
        MAILSTAGE_CO_TRY_ASSIGN(accepted, co_await s.read_reply(command_kind::data_body));
        if (!accepted.is_positive_completion())
            co_return fail(reply_error(options_.host, command_kind::data_body, {}, accepted, "Mail message rejection."));

        auto quit = co_await s.command("QUIT", command_kind::quit);
        if (!quit)
            MAILSTAGE_DEBUG("QUIT after accepted message failed: " + quit.error().to_string());
        co_return ok();
    }

    options options_;
};

} // namespace mailstage::smtp
