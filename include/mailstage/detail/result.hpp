/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions cross the mailstage API - all errors are returned via result<T>.

*/

#pragma once

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace mailstage
{

/// Error categories for mailstage operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Staging storage errors (100-199)
    storage_failed = 100,
    upload_busy = 101,
    payload_too_large = 102,

    // Upload completeness (200-299)
    incomplete_upload = 200,

    // Input validation (300-399)
    validation_failed = 300,

    // Delivery errors (400-499)
    delivery_failed = 400,
    delivery_connection_failed = 401,
    delivery_timeout = 402,
    delivery_tls_failed = 403,
    delivery_auth_failed = 404,
    delivery_rejected = 405,
    delivery_protocol_error = 406,

    // Record store errors (500-599)
    record_not_found = 500,
    record_store_failed = 501,
    invalid_transition = 502,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::storage_failed: return "Storage failure";
        case error_code::upload_busy: return "Upload is being assembled";
        case error_code::payload_too_large: return "Payload too large";
        case error_code::incomplete_upload: return "Incomplete upload";
        case error_code::validation_failed: return "Validation failed";
        case error_code::delivery_failed: return "Delivery failed";
        case error_code::delivery_connection_failed: return "Delivery connection failed";
        case error_code::delivery_timeout: return "Delivery timeout";
        case error_code::delivery_tls_failed: return "Delivery TLS failure";
        case error_code::delivery_auth_failed: return "Delivery authentication failed";
        case error_code::delivery_rejected: return "Delivery rejected";
        case error_code::delivery_protocol_error: return "Delivery protocol error";
        case error_code::record_not_found: return "Record not found";
        case error_code::record_store_failed: return "Record store failure";
        case error_code::invalid_transition: return "Invalid status transition";
        case error_code::internal_error: return "Internal error";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, error_code ec)
{
    return os << error_code_to_string(ec);
}

/// Rich error type with code, message, and optional detail (server or provider text)
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += std::to_string(static_cast<int>(code_));
        out += "] ";
        out += message_;
        if (!detail_.empty())
        {
            out += ": ";
            out += detail_;
        }
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    [[nodiscard]] bool is_storage_error() const noexcept { return in_range(100, 200); }
    [[nodiscard]] bool is_incomplete_upload() const noexcept { return in_range(200, 300); }
    [[nodiscard]] bool is_validation_error() const noexcept { return in_range(300, 400); }
    [[nodiscard]] bool is_delivery_error() const noexcept { return in_range(400, 500); }
    [[nodiscard]] bool is_record_error() const noexcept { return in_range(500, 600); }

private:
    [[nodiscard]] bool in_range(std::uint16_t lo, std::uint16_t hi) const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= lo && c < hi;
    }

    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create void success
[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message, std::string detail)
{
    return std::unexpected(error(code, std::move(message), std::move(detail)));
}

// ==================== Coroutine Helpers ====================

#define MAILSTAGE_CONCAT_IMPL(a, b) a##b
#define MAILSTAGE_CONCAT(a, b) MAILSTAGE_CONCAT_IMPL(a, b)

/// Await a result-returning coroutine, propagate its error or bind its value
/// Usage: MAILSTAGE_CO_TRY_ASSIGN(rep, co_await read_reply());
#define MAILSTAGE_CO_TRY_ASSIGN(lhs, expr) \
    auto MAILSTAGE_CONCAT(_try_result_, __LINE__) = (expr); \
    if (!MAILSTAGE_CONCAT(_try_result_, __LINE__)) [[unlikely]] \
        co_return std::unexpected(std::move(MAILSTAGE_CONCAT(_try_result_, __LINE__)).error()); \
    auto lhs = std::move(*MAILSTAGE_CONCAT(_try_result_, __LINE__))

/// Same but for void results
#define MAILSTAGE_CO_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            co_return std::unexpected(std::move(_result).error()); \
    } while(0)

/// Plain (non-coroutine) propagation of a void result
#define MAILSTAGE_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
    } while(0)

} // namespace mailstage
