/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Runtime configuration of the service.

*/

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/delivery/maildir_delivery.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/smtp/delivery.hpp>
#include <mailstage/smtp/types.hpp>
#include <mailstage/upload/staging.hpp>

namespace mailstage::service
{

enum class delivery_mode
{
    smtp,
    maildir
};

[[nodiscard]] constexpr std::string_view to_string(delivery_mode m) noexcept
{
    return m == delivery_mode::maildir ? "maildir" : "smtp";
}

[[nodiscard]] constexpr std::optional<delivery_mode> delivery_mode_from_string(std::string_view name) noexcept
{
    if (name == "smtp")
        return delivery_mode::smtp;
    if (name == "maildir")
        return delivery_mode::maildir;
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, delivery_mode m)
{
    return os << to_string(m);
}

struct server_options
{
    std::string host = "0.0.0.0";
    std::uint16_t port = 3000;
    /// Threads running disk, database and delivery work of the requests.
    std::size_t worker_threads = 4;
};

struct config
{
    std::filesystem::path staging_dir = "temp_uploads";
    std::filesystem::path database = "emails.db";
    upload::upload_limits limits;
    server_options server;
    delivery_mode delivery = delivery_mode::smtp;
    std::filesystem::path maildir = "maildir";
    smtp::options smtp;
    log::level log_level = log::level::info;
    /// Trace SMTP lines (secrets redacted).
    bool trace_smtp = false;
};

/**
Checking a configuration before anything is opened.

@return `validation_failed` when SMTP delivery has no host, a port or a limit is zero, or no
        worker thread is configured.
**/
[[nodiscard]] inline result_void validate(const config& cfg)
{
    if (cfg.staging_dir.empty())
        return fail(error_code::validation_failed, "Staging directory is not configured.");
    if (cfg.database.empty())
        return fail(error_code::validation_failed, "Database path is not configured.");
    if (cfg.limits.max_chunk_bytes == 0 || cfg.limits.max_file_bytes == 0)
        return fail(error_code::validation_failed, "Upload limits must be positive.");
    if (cfg.server.port == 0)
        return fail(error_code::validation_failed, "Server port must be positive.");
    if (cfg.server.worker_threads == 0)
        return fail(error_code::validation_failed, "At least one worker thread is required.");

    if (cfg.delivery == delivery_mode::smtp)
    {
        if (cfg.smtp.host.empty())
            return fail(error_code::validation_failed, "SMTP host is not configured.",
                "set smtp.host in the configuration file or SMTP_HOST in the environment");
        if (cfg.smtp.port == 0)
            return fail(error_code::validation_failed, "SMTP port must be positive.");
    }
    else if (cfg.maildir.empty())
    {
        return fail(error_code::validation_failed, "Maildir path is not configured.");
    }
    return ok();
}

/// Delivery collaborator selected by the configuration.
[[nodiscard]] inline std::unique_ptr<delivery::delivery_client> make_delivery(const config& cfg)
{
    if (cfg.delivery == delivery_mode::maildir)
        return std::make_unique<delivery::maildir_delivery>(cfg.maildir);
    return std::make_unique<smtp::delivery>(cfg.smtp);
}

/// Applying the logging part of a configuration to the global logger.
inline void apply_logging(const config& cfg)
{
    auto& logger = log::logger::instance();
    logger.set_level(cfg.log_level);
    logger.set_trace_enabled(cfg.trace_smtp);
}

} // namespace mailstage::service
