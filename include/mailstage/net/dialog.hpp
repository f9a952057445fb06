/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <mailstage/detail/asio_decl.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/redact.hpp>
#include <mailstage/detail/result.hpp>

namespace mailstage
{
namespace net
{

/// Default maximum line length for network protocols (RFC 5321: 998 + CRLF, but commonly 8K)
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Dealing with network in a line oriented fashion.

Wraps a Boost.Asio stream (socket, upgradable stream). Every operation is bounded by the optional
timeout: on expiry the lowest layer is cancelled and the operation reports `timed_out`. Errors
are returned as Asio error codes; mapping to library errors is up to the protocol.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    /**
    Sending a line to network.

    @param line Line to send (CRLF added if missing).
    **/
    asio::awaitable<asio::error_code> write_line(std::string_view line)
    {
        std::string payload = normalize_line(line);
        trace_line(log::direction::send, payload);
        co_return co_await write_raw(payload);
    }

    /**
    Writing raw bytes to network; nothing is traced.
    **/
    asio::awaitable<asio::error_code> write_raw(std::string_view data)
    {
        timeout_guard guard(*this);
        asio::error_code ec;
        co_await asio::async_write(stream_, asio::buffer(data.data(), data.size()),
            asio::redirect_error(asio::use_awaitable, ec));
        co_return guard.translate(ec);
    }

    /**
    Receiving a line from network, without the line terminator.

    @return Error code and line; `message_size` when the line exceeds the maximum length.
    **/
    asio::awaitable<std::pair<asio::error_code, std::string>> read_line()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            timeout_guard guard(*this);
            asio::error_code ec;
            auto buffer = asio::dynamic_buffer(read_buffer_, max_line_length_ + 2);
            co_await asio::async_read_until(stream_, buffer, '\n', asio::redirect_error(asio::use_awaitable, ec));
            ec = guard.translate(ec);
            if (ec == asio::error::not_found)
                co_return std::make_pair(asio::error_code(asio::error::message_size), std::string());
            if (ec)
                co_return std::make_pair(ec, std::string());
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                co_return std::make_pair(asio::error_code(asio::error::invalid_argument), std::string());
        }

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            co_return std::make_pair(asio::error_code(asio::error::message_size), std::string());
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(log::direction::receive, line);
        co_return std::make_pair(asio::error_code(), std::move(line));
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }

    /// True when bytes beyond the last read line were already received.
    [[nodiscard]] bool has_buffered_input() const noexcept { return !read_buffer_.empty(); }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    /**
    Arms a timer for the duration of one operation; the timer cancels the stream on expiry.
    **/
    class timeout_guard
    {
    public:
        explicit timeout_guard(dialog& owner) : state_(std::make_shared<state>())
        {
            if (!owner.timeout_.has_value())
                return;
            timer_.emplace(owner.stream_.get_executor());
            timer_->expires_after(*owner.timeout_);
            timer_->async_wait([&owner, st = state_](asio::error_code ec)
            {
                if (ec || !st->active)
                    return;
                st->timed_out = true;
                asio::error_code ignored;
                owner.stream_.lowest_layer().cancel(ignored);
            });
        }

        ~timeout_guard()
        {
            state_->active = false;
            if (timer_)
                timer_->cancel();
        }

        timeout_guard(const timeout_guard&) = delete;
        timeout_guard& operator=(const timeout_guard&) = delete;

        asio::error_code translate(asio::error_code ec) const
        {
            if (state_->timed_out && ec == asio::error::operation_aborted)
                return asio::error::timed_out;
            return ec;
        }

    private:
        struct state
        {
            bool active = true;
            bool timed_out = false;
        };

        std::shared_ptr<state> state_;
        std::optional<asio::steady_timer> timer_;
    };

    static std::string normalize_line(std::string_view line)
    {
        if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
            return std::string(line);
        if (!line.empty() && line.back() == '\n')
        {
            std::string out(line.substr(0, line.size() - 1));
            out += "\r\n";
            return out;
        }
        std::string out(line);
        out += "\r\n";
        return out;
    }

    void trace_line(log::direction dir, std::string_view data) const
    {
        auto& logger = log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == log::direction::send)
        {
            logger.trace_protocol(trace_protocol_, dir, mailstage::detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::string trace_protocol_{"NET"};
};

} // namespace net
} // namespace mailstage
