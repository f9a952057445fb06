/*

config_loader.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Loading the service configuration from a JSON file and the environment.

*/

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/service/config.hpp>

namespace mailstage::server
{

/// Environment lookup; returns null for an unset variable.
using env_lookup = std::function<const char*(const char*)>;

/**
Path of the configuration file: `--config <path>` on the command line, else `MAILSTAGE_CONFIG`.

@return No value when neither is given, `validation_failed` for a dangling `--config`.
**/
[[nodiscard]] result<std::optional<std::filesystem::path>> config_path(int argc, const char* const* argv,
    const env_lookup& env);

/**
Overlaying the keys present in a JSON document onto a configuration.

@return `validation_failed` naming the first key of the wrong type or with an unknown value.
**/
[[nodiscard]] result_void apply_json(const nlohmann::json& doc, service::config& cfg);

/// Reading and applying a JSON configuration file.
[[nodiscard]] result_void apply_file(const std::filesystem::path& path, service::config& cfg);

/**
Applying `PORT`, `MAILSTAGE_STAGING_DIR`, `MAILSTAGE_DB`, `MAILSTAGE_LOG_LEVEL`, `SMTP_HOST`,
`SMTP_PORT`, `SMTP_USERNAME` and `SMTP_PASSWORD`.
**/
[[nodiscard]] result_void apply_environment(const env_lookup& env, service::config& cfg);

/**
Complete startup configuration: defaults, file, environment, validation.
**/
[[nodiscard]] result<service::config> load_config(int argc, const char* const* argv, const env_lookup& env);

/// Creating the staging directory and the parent directory of the database.
[[nodiscard]] result_void prepare_directories(const service::config& cfg);

} // namespace mailstage::server
