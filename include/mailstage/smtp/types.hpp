/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <mailstage/net/tls_options.hpp>

namespace mailstage
{
namespace smtp
{

/**
Server reply: one status code and the text of each line.
**/
struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_positive_intermediate() const noexcept { return status / 100 == 3; }
    [[nodiscard]] bool is_transient_negative() const noexcept { return status / 100 == 4; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    [[nodiscard]] std::string message() const
    {
        if (lines.empty())
            return std::string();
        std::string out = lines.front();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            out += "\n";
            out += lines[i];
        }
        return out;
    }
};

/**
EHLO keywords with their parameters, keys upper cased.
**/
struct capabilities
{
    std::map<std::string, std::vector<std::string>> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    [[nodiscard]] bool supports(std::string_view capability) const
    {
        return entries.find(normalize_key(capability)) != entries.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view capability) const
    {
        auto it = entries.find(normalize_key(capability));
        return it == entries.end() ? nullptr : &it->second;
    }

    /// True when `AUTH` lists the mechanism.
    [[nodiscard]] bool supports_auth(std::string_view mechanism) const
    {
        const auto* mechs = parameters("AUTH");
        if (mechs == nullptr)
            return false;
        const std::string wanted = normalize_key(mechanism);
        for (const auto& m : *mechs)
        {
            if (normalize_key(m) == wanted)
                return true;
        }
        return false;
    }

    [[nodiscard]] static std::string normalize_key(std::string_view key)
    {
        return boost::to_upper_copy(std::string(key));
    }
};

enum class auth_method
{
    /// PLAIN when advertised, LOGIN otherwise.
    automatic,
    plain,
    login
};

[[nodiscard]] constexpr std::optional<auth_method> auth_method_from_string(std::string_view name) noexcept
{
    if (name == "auto")
        return auth_method::automatic;
    if (name == "plain")
        return auth_method::plain;
    if (name == "login")
        return auth_method::login;
    return std::nullopt;
}

/**
Connection and account settings of the SMTP delivery.

Authentication is attempted only when a username is set.
**/
struct options
{
    std::string host;
    std::uint16_t port = 587;
    net::tls_mode tls_mode = net::tls_mode::starttls;
    net::tls_options tls;
    std::string username;
    std::string password;
    auth_method auth = auth_method::automatic;
    /// Name sent with EHLO; the local host name when empty.
    std::string helo_name;
    /// Bound of every network operation.
    std::chrono::steady_clock::duration timeout = std::chrono::seconds(60);
    /// Allow AUTH over an unencrypted connection.
    bool allow_cleartext_auth = false;
};

} // namespace smtp
} // namespace mailstage
