/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailstage.
Supports multiple log levels, optional callbacks, and protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <boost/algorithm/string/predicate.hpp>

namespace mailstage::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to server
    receive   ///< Data received from server
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "SMTP", "HTTP"
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration files ("info", "WARN", ...)
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name)
{
    auto eq = [name](std::string_view lower)
    {
        return boost::iequals(name, lower);
    };
    if (eq("trace")) return level::trace;
    if (eq("debug")) return level::debug;
    if (eq("info")) return level::info;
    if (eq("warn") || eq("warning")) return level::warn;
    if (eq("error")) return level::error;
    if (eq("fatal")) return level::fatal;
    if (eq("off")) return level::off;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        std::string line = std::format("[{:02}:{:02}:{:02}.{:03}]",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count());
        if (e.trace_info)
        {
            line += ' ';
            line += e.trace_info->protocol;
            line += (e.trace_info->dir == direction::send) ? " >>> " : " <<< ";
            line += sanitize_trace(e.trace_info->data);
        }
        else
        {
            line += " [";
            line += level_to_string(e.lvl);
            line += "] ";
            line += e.message;
        }
        line += '\n';
        std::cerr << line;
    }

    /// Sanitize trace data (truncate long data, hide control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define MAILSTAGE_LOG(lvl, msg) \
    ::mailstage::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILSTAGE_TRACE(msg)  MAILSTAGE_LOG(::mailstage::log::level::trace, msg)
#define MAILSTAGE_DEBUG(msg)  MAILSTAGE_LOG(::mailstage::log::level::debug, msg)
#define MAILSTAGE_INFO(msg)   MAILSTAGE_LOG(::mailstage::log::level::info, msg)
#define MAILSTAGE_WARN(msg)   MAILSTAGE_LOG(::mailstage::log::level::warn, msg)
#define MAILSTAGE_ERROR(msg)  MAILSTAGE_LOG(::mailstage::log::level::error, msg)
#define MAILSTAGE_FATAL(msg)  MAILSTAGE_LOG(::mailstage::log::level::fatal, msg)

#define MAILSTAGE_TRACE_SEND(protocol, data) \
    ::mailstage::log::logger::instance().trace_protocol(protocol, ::mailstage::log::direction::send, data)

#define MAILSTAGE_TRACE_RECV(protocol, data) \
    ::mailstage::log::logger::instance().trace_protocol(protocol, ::mailstage::log::direction::receive, data)

} // namespace mailstage::log
