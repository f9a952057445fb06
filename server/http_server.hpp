/*

http_server.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/service/config.hpp>
#include <mailstage/service/mail_service.hpp>

namespace mailstage::server
{

/**
HTTP/1.1 front end of the mail service.

Connections are served by coroutines on the given `io_context`; the request handlers, which
block on disk, database and delivery, run on a private thread pool.
**/
class http_server
{
public:
    http_server(asio::io_context& ioc, service::mail_service& svc, const service::config& cfg);

    http_server(const http_server&) = delete;
    http_server& operator=(const http_server&) = delete;

    ~http_server();

    /**
    Opening, binding and listening on the configured address.

    @return `internal_error` with the socket error in the detail.
    **/
    [[nodiscard]] result_void listen();

    /// Accepting connections until `stop`.
    void start();

    void stop();

    /// Bound port, useful when listening on port zero.
    [[nodiscard]] unsigned short port() const;

private:
    asio::awaitable<void> accept_loop();

    asio::awaitable<void> serve(asio::tcp::socket socket);

    asio::io_context& ioc_;
    service::mail_service& svc_;
    service::server_options options_;
    std::size_t body_limit_;
    asio::tcp::acceptor acceptor_;
    asio::thread_pool workers_;

    static constexpr std::chrono::seconds IO_TIMEOUT{30};
};

} // namespace mailstage::server
