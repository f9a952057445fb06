/*

records.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mailstage::store
{

using record_id = std::int64_t;

/**
Lifecycle of one send attempt.

`pending` is only reachable by creating a record; `sent` and `failed` are terminal.
**/
enum class email_status
{
    pending,
    sent,
    failed
};

[[nodiscard]] constexpr std::string_view status_to_string(email_status s) noexcept
{
    switch (s)
    {
        case email_status::pending: return "pending";
        case email_status::sent: return "sent";
        case email_status::failed: return "failed";
    }
    return "pending";
}

[[nodiscard]] constexpr std::optional<email_status> status_from_string(std::string_view s) noexcept
{
    if (s == "pending")
        return email_status::pending;
    if (s == "sent")
        return email_status::sent;
    if (s == "failed")
        return email_status::failed;
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, email_status s)
{
    return os << status_to_string(s);
}

[[nodiscard]] constexpr bool is_terminal(email_status s) noexcept
{
    return s != email_status::pending;
}

[[nodiscard]] constexpr bool can_transition(email_status from, email_status to) noexcept
{
    return from == email_status::pending && is_terminal(to);
}

struct email_record
{
    record_id id = 0;
    std::string sender;
    std::vector<std::string> recipients;
    std::string subject;
    std::string body;
    email_status status = email_status::pending;
    std::chrono::system_clock::time_point created_at{};
    /// Set on the transition to `sent` only.
    std::optional<std::chrono::system_clock::time_point> sent_at;
};

/// Metadata of one attachment of a send attempt; the bytes themselves are never persisted.
struct attachment_record
{
    record_id id = 0;
    record_id email_id = 0;
    std::string filename;
    std::string content_type;
};

} // namespace mailstage::store
