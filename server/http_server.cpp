/*

http_server.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include "http_server.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <mailstage/detail/log.hpp>
#include "http_routes.hpp"

namespace beast = boost::beast;

namespace mailstage::server
{

namespace
{

void log_exception(std::exception_ptr ep, const char* where)
{
    if (!ep)
        return;
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& exc)
    {
        MAILSTAGE_ERROR(std::string(where) + ": " + exc.what());
    }
}

} // namespace


http_server::http_server(asio::io_context& ioc, service::mail_service& svc, const service::config& cfg)
    : ioc_(ioc),
      svc_(svc),
      options_(cfg.server),
      body_limit_(std::max(cfg.limits.max_chunk_bytes, cfg.limits.max_file_bytes)),
      acceptor_(ioc),
      workers_(std::max<std::size_t>(cfg.server.worker_threads, 1))
{
}


http_server::~http_server()
{
    workers_.join();
}


result_void http_server::listen()
{
    asio::error_code ec;
    const auto address = asio::ip::make_address(options_.host, ec);
    if (ec)
        return fail(error_code::validation_failed, "Invalid listen address.", options_.host + ": " + ec.message());

    const asio::tcp::endpoint endpoint{address, options_.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
        acceptor_.set_option(asio::tcp::acceptor::reuse_address(true), ec);
    if (!ec)
        acceptor_.bind(endpoint, ec);
    if (!ec)
        acceptor_.listen(asio::tcp::acceptor::max_listen_connections, ec);
    if (ec)
        return fail(error_code::internal_error, "Cannot listen.",
            options_.host + ":" + std::to_string(options_.port) + ": " + ec.message());
    return ok();
}


void http_server::start()
{
    asio::co_spawn(ioc_, accept_loop(), [](std::exception_ptr ep) { log_exception(ep, "accept loop"); });
}


void http_server::stop()
{
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec)
        MAILSTAGE_WARN("closing the acceptor: " + ec.message());
}


unsigned short http_server::port() const
{
    asio::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}


asio::awaitable<void> http_server::accept_loop()
{
    while (acceptor_.is_open())
    {
        asio::error_code ec;
        asio::tcp::socket socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            if (ec == asio::error::operation_aborted)
                break;
            MAILSTAGE_WARN("accept failed: " + ec.message());
            continue;
        }
        asio::co_spawn(ioc_, serve(std::move(socket)), [](std::exception_ptr ep) { log_exception(ep, "http session"); });
    }
    MAILSTAGE_DEBUG("accept loop finished");
}


asio::awaitable<void> http_server::serve(asio::tcp::socket socket)
{
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;)
    {
        http::request_parser<http::string_body> parser;
        parser.body_limit(body_limit_);

        asio::error_code ec;
        stream.expires_after(IO_TIMEOUT);
        co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::end_of_stream)
            break;
        if (ec == http::error::body_limit)
        {
            response res{http::status::payload_too_large, parser.get().version()};
            res.set(http::field::access_control_allow_origin, "*");
            res.set(http::field::content_type, "application/json");
            res.body() = R"({"error":"Payload too large"})";
            res.keep_alive(false);
            res.prepare_payload();
            stream.expires_after(IO_TIMEOUT);
            co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
            break;
        }
        if (ec)
        {
            MAILSTAGE_DEBUG("http read: " + ec.message());
            break;
        }

        request req = parser.release();
        stream.expires_never();
        response res = co_await asio::co_spawn(workers_,
            [this, &req]() -> asio::awaitable<response>
            {
                co_return handle_request(svc_, req);
            },
            asio::use_awaitable);

        const bool keep_alive = res.keep_alive();
        stream.expires_after(IO_TIMEOUT);
        co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            MAILSTAGE_DEBUG("http write: " + ec.message());
            break;
        }
        if (!keep_alive)
            break;
    }

    asio::error_code ignored;
    stream.socket().shutdown(asio::tcp::socket::shutdown_send, ignored);
}

} // namespace mailstage::server
