/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/ssl.h>
#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/result.hpp>

namespace mailstage::net
{

/**
How a connection gets encrypted.
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<tls_mode> tls_mode_from_string(std::string_view name) noexcept
{
    if (name == "none")
        return tls_mode::none;
    if (name == "starttls")
        return tls_mode::starttls;
    if (name == "implicit" || name == "tls" || name == "ssl")
        return tls_mode::implicit;
    return std::nullopt;
}

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    bool allow_self_signed = false;
};

/**
Configure the TLS trust store for a context.
**/
[[nodiscard]] inline result_void configure_trust_store(mailstage::asio::ssl::context& ctx, const tls_options& options)
{
    mailstage::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail(error_code::delivery_tls_failed, "TLS trust store configuration failed.", ec.message());
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail(error_code::delivery_tls_failed, "TLS trust store configuration failed.", file + ": " + ec.message());
    }

    if (options.min_tls_version.has_value() && SSL_CTX_get_min_proto_version(ctx.native_handle()) == 0)
    {
        if (SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
            return fail(error_code::delivery_tls_failed, "TLS min version configuration failed.");
    }
    return ok();
}

} // namespace mailstage::net
