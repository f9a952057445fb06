/*

config_loader.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include "config_loader.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>
#include <mailstage/detail/log.hpp>
#include <mailstage/net/tls_options.hpp>
#include <mailstage/smtp/types.hpp>

using json = nlohmann::json;

namespace mailstage::server
{

namespace
{

result_void wrong_type(std::string_view key, std::string_view expected)
{
    return fail(error_code::validation_failed, "Invalid configuration value.",
        std::string(key) + " must be " + std::string(expected));
}

result_void read_string(const json& obj, const char* key, std::string& out)
{
    const auto it = obj.find(key);
    if (it == obj.end())
        return ok();
    if (!it->is_string())
        return wrong_type(key, "a string");
    out = it->get<std::string>();
    return ok();
}

result_void read_path(const json& obj, const char* key, std::filesystem::path& out)
{
    std::string text;
    MAILSTAGE_TRY_VOID(read_string(obj, key, text));
    if (!text.empty())
        out = text;
    return ok();
}

result_void read_bool(const json& obj, const char* key, bool& out)
{
    const auto it = obj.find(key);
    if (it == obj.end())
        return ok();
    if (!it->is_boolean())
        return wrong_type(key, "a boolean");
    out = it->get<bool>();
    return ok();
}

template<typename Unsigned>
result_void read_unsigned(const json& obj, const char* key, Unsigned& out)
{
    const auto it = obj.find(key);
    if (it == obj.end())
        return ok();
    if (!it->is_number_unsigned())
        return wrong_type(key, "a non negative integer");
    const auto value = it->get<std::uint64_t>();
    if (value > std::numeric_limits<Unsigned>::max())
        return wrong_type(key, "within range");
    out = static_cast<Unsigned>(value);
    return ok();
}

result_void read_object(const json& obj, const char* key, const json*& out)
{
    out = nullptr;
    const auto it = obj.find(key);
    if (it == obj.end())
        return ok();
    if (!it->is_object())
        return wrong_type(key, "an object");
    out = &*it;
    return ok();
}

template<typename Unsigned>
result<Unsigned> parse_unsigned(std::string_view name, std::string_view text)
{
    Unsigned value = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last)
        return fail<Unsigned>(error_code::validation_failed, "Invalid number in environment.",
            std::string(name) + "=" + std::string(text));
    return value;
}

result_void apply_smtp(const json& obj, smtp::options& opts)
{
    MAILSTAGE_TRY_VOID(read_string(obj, "host", opts.host));
    MAILSTAGE_TRY_VOID(read_unsigned(obj, "port", opts.port));
    MAILSTAGE_TRY_VOID(read_string(obj, "username", opts.username));
    MAILSTAGE_TRY_VOID(read_string(obj, "password", opts.password));
    MAILSTAGE_TRY_VOID(read_string(obj, "helo_name", opts.helo_name));
    MAILSTAGE_TRY_VOID(read_bool(obj, "allow_cleartext_auth", opts.allow_cleartext_auth));

    std::string tls;
    MAILSTAGE_TRY_VOID(read_string(obj, "tls", tls));
    if (!tls.empty())
    {
        const auto mode = net::tls_mode_from_string(tls);
        if (!mode)
            return wrong_type("smtp.tls", "one of none, starttls, implicit");
        opts.tls_mode = *mode;
    }

    std::string auth;
    MAILSTAGE_TRY_VOID(read_string(obj, "auth", auth));
    if (!auth.empty())
    {
        const auto method = smtp::auth_method_from_string(auth);
        if (!method)
            return wrong_type("smtp.auth", "one of auto, plain, login");
        opts.auth = *method;
    }

    std::uint32_t timeout_seconds = 0;
    MAILSTAGE_TRY_VOID(read_unsigned(obj, "timeout_seconds", timeout_seconds));
    if (timeout_seconds > 0)
        opts.timeout = std::chrono::seconds(timeout_seconds);

    bool verify_peer = opts.tls.verify == net::verify_mode::peer;
    MAILSTAGE_TRY_VOID(read_bool(obj, "verify_peer", verify_peer));
    opts.tls.verify = verify_peer ? net::verify_mode::peer : net::verify_mode::none;
    MAILSTAGE_TRY_VOID(read_bool(obj, "verify_host", opts.tls.verify_host));
    MAILSTAGE_TRY_VOID(read_bool(obj, "allow_self_signed", opts.tls.allow_self_signed));

    const auto ca = obj.find("ca_files");
    if (ca != obj.end())
    {
        if (!ca->is_array())
            return wrong_type("smtp.ca_files", "an array of strings");
        opts.tls.ca_files.clear();
        for (const auto& file : *ca)
        {
            if (!file.is_string())
                return wrong_type("smtp.ca_files", "an array of strings");
            opts.tls.ca_files.push_back(file.get<std::string>());
        }
    }
    return ok();
}

} // namespace


result<std::optional<std::filesystem::path>> config_path(int argc, const char* const* argv, const env_lookup& env)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::string_view(argv[i]) != "--config")
            continue;
        if (i + 1 >= argc)
            return fail<std::optional<std::filesystem::path>>(error_code::validation_failed,
                "Missing value of --config.");
        return std::optional<std::filesystem::path>(argv[i + 1]);
    }
    if (const char* from_env = env("MAILSTAGE_CONFIG"); from_env != nullptr && *from_env != '\0')
        return std::optional<std::filesystem::path>(from_env);
    return std::optional<std::filesystem::path>();
}


result_void apply_json(const json& doc, service::config& cfg)
{
    if (!doc.is_object())
        return wrong_type("configuration", "an object");

    MAILSTAGE_TRY_VOID(read_path(doc, "staging_dir", cfg.staging_dir));
    MAILSTAGE_TRY_VOID(read_path(doc, "database", cfg.database));
    MAILSTAGE_TRY_VOID(read_path(doc, "maildir", cfg.maildir));

    std::string delivery;
    MAILSTAGE_TRY_VOID(read_string(doc, "delivery", delivery));
    if (!delivery.empty())
    {
        const auto mode = service::delivery_mode_from_string(delivery);
        if (!mode)
            return wrong_type("delivery", "smtp or maildir");
        cfg.delivery = *mode;
    }

    const json* section = nullptr;
    MAILSTAGE_TRY_VOID(read_object(doc, "limits", section));
    if (section != nullptr)
    {
        MAILSTAGE_TRY_VOID(read_unsigned(*section, "max_chunk_bytes", cfg.limits.max_chunk_bytes));
        MAILSTAGE_TRY_VOID(read_unsigned(*section, "max_file_bytes", cfg.limits.max_file_bytes));
    }

    MAILSTAGE_TRY_VOID(read_object(doc, "server", section));
    if (section != nullptr)
    {
        MAILSTAGE_TRY_VOID(read_string(*section, "host", cfg.server.host));
        MAILSTAGE_TRY_VOID(read_unsigned(*section, "port", cfg.server.port));
        MAILSTAGE_TRY_VOID(read_unsigned(*section, "worker_threads", cfg.server.worker_threads));
    }

    MAILSTAGE_TRY_VOID(read_object(doc, "smtp", section));
    if (section != nullptr)
        MAILSTAGE_TRY_VOID(apply_smtp(*section, cfg.smtp));

    MAILSTAGE_TRY_VOID(read_object(doc, "log", section));
    if (section != nullptr)
    {
        std::string level;
        MAILSTAGE_TRY_VOID(read_string(*section, "level", level));
        if (!level.empty())
        {
            const auto lvl = log::level_from_string(level);
            if (!lvl)
                return wrong_type("log.level", "a log level");
            cfg.log_level = *lvl;
        }
        MAILSTAGE_TRY_VOID(read_bool(*section, "trace_smtp", cfg.trace_smtp));
    }
    return ok();
}


result_void apply_file(const std::filesystem::path& path, service::config& cfg)
{
    std::ifstream ifs(path);
    if (!ifs)
        return fail(error_code::validation_failed, "Cannot open configuration file.", path.string());

    const json doc = json::parse(ifs, nullptr, false);
    if (doc.is_discarded())
        return fail(error_code::validation_failed, "Configuration file is not valid JSON.", path.string());

    MAILSTAGE_TRY_VOID(apply_json(doc, cfg));
    MAILSTAGE_INFO("configuration loaded from " + path.string());
    return ok();
}


result_void apply_environment(const env_lookup& env, service::config& cfg)
{
    auto value = [&env](const char* name) -> std::string_view
    {
        const char* raw = env(name);
        return raw == nullptr ? std::string_view{} : std::string_view(raw);
    };

    if (const auto port = value("PORT"); !port.empty())
    {
        auto parsed = parse_unsigned<std::uint16_t>("PORT", port);
        if (!parsed)
            return fail(std::move(parsed).error());
        cfg.server.port = *parsed;
    }
    if (const auto dir = value("MAILSTAGE_STAGING_DIR"); !dir.empty())
        cfg.staging_dir = std::string(dir);
    if (const auto db = value("MAILSTAGE_DB"); !db.empty())
        cfg.database = std::string(db);
    if (const auto level = value("MAILSTAGE_LOG_LEVEL"); !level.empty())
    {
        const auto lvl = log::level_from_string(level);
        if (!lvl)
            return fail(error_code::validation_failed, "Invalid log level in environment.", std::string(level));
        cfg.log_level = *lvl;
    }
    if (const auto host = value("SMTP_HOST"); !host.empty())
        cfg.smtp.host = std::string(host);
    if (const auto port = value("SMTP_PORT"); !port.empty())
    {
        auto parsed = parse_unsigned<std::uint16_t>("SMTP_PORT", port);
        if (!parsed)
            return fail(std::move(parsed).error());
        cfg.smtp.port = *parsed;
    }
    if (const auto user = value("SMTP_USERNAME"); !user.empty())
        cfg.smtp.username = std::string(user);
    if (const auto pass = value("SMTP_PASSWORD"); !pass.empty())
        cfg.smtp.password = std::string(pass);
    return ok();
}


result<service::config> load_config(int argc, const char* const* argv, const env_lookup& env)
{
    service::config cfg;

    auto path = config_path(argc, argv, env);
    if (!path)
        return fail<service::config>(std::move(path).error());
    if (path->has_value())
        MAILSTAGE_TRY_VOID(apply_file(**path, cfg));

    MAILSTAGE_TRY_VOID(apply_environment(env, cfg));
    MAILSTAGE_TRY_VOID(service::validate(cfg));
    return cfg;
}


result_void prepare_directories(const service::config& cfg)
{
    std::error_code ec;
    std::filesystem::create_directories(cfg.staging_dir, ec);
    if (ec)
        return fail(error_code::storage_failed, "Cannot create staging directory.",
            cfg.staging_dir.string() + ": " + ec.message());

    const auto db_dir = cfg.database.parent_path();
    if (!db_dir.empty())
    {
        std::filesystem::create_directories(db_dir, ec);
        if (ec)
            return fail(error_code::storage_failed, "Cannot create database directory.",
                db_dir.string() + ": " + ec.message());
    }
    return ok();
}

} // namespace mailstage::server
