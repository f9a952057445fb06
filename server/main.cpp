/*

main.cpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <csignal>
#include <cstdlib>
#include <string>
#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/service/config.hpp>
#include <mailstage/service/mail_service.hpp>
#include <mailstage/store/sqlite_record_store.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include "config_loader.hpp"
#include "http_server.hpp"

using namespace mailstage;


int main(int argc, char* argv[])
{
    auto cfg = server::load_config(argc, argv, [](const char* name) -> const char* { return std::getenv(name); });
    if (!cfg)
    {
        MAILSTAGE_FATAL("invalid configuration: " + cfg.error().to_string());
        return EXIT_FAILURE;
    }
    service::apply_logging(*cfg);

    auto prepared = server::prepare_directories(*cfg);
    if (!prepared)
    {
        MAILSTAGE_FATAL(prepared.error().to_string());
        return EXIT_FAILURE;
    }

    auto records = store::sqlite_record_store::open(cfg->database.string());
    if (!records)
    {
        MAILSTAGE_FATAL(records.error().to_string());
        return EXIT_FAILURE;
    }

    auto delivery = service::make_delivery(*cfg);
    upload::chunk_store chunks(cfg->staging_dir, cfg->limits);
    service::mail_service svc(chunks, **records, *delivery);

    asio::io_context ioc;
    server::http_server http(ioc, svc, *cfg);
    auto listening = http.listen();
    if (!listening)
    {
        MAILSTAGE_FATAL(listening.error().to_string());
        return EXIT_FAILURE;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signo)
    {
        if (ec)
            return;
        MAILSTAGE_INFO("signal " + std::to_string(signo) + " received, shutting down");
        http.stop();
        ioc.stop();
    });

    http.start();
    MAILSTAGE_INFO("Email service running on port " + std::to_string(http.port()) + " (delivery: "
        + std::string(service::to_string(cfg->delivery)) + ", staging: " + cfg->staging_dir.string() + ")");
    ioc.run();
    return EXIT_SUCCESS;
}
