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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <popdesk/detail/asio_error.hpp>
#include <popdesk/detail/log.hpp>
#include <popdesk/detail/redact.hpp>
#include <popdesk/detail/result.hpp>

namespace popdesk
{
namespace net
{

/// Default maximum line length for network protocols
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;


/**
Timer armed for the lifetime of one asynchronous operation.

When it fires before being destroyed it runs the expiry action, which is
expected to abort the operation; `translate()` then turns the resulting
`operation_aborted` into `timed_out`.
**/
class deadline
{
public:
    using duration = std::chrono::steady_clock::duration;

    deadline(asio::any_io_executor executor, std::optional<duration> timeout, std::function<void()> on_expire)
        : state_(std::make_shared<state>())
    {
        if (!timeout.has_value())
            return;
        timer_.emplace(executor);
        timer_->expires_after(*timeout);
        timer_->async_wait([state = state_, on_expire = std::move(on_expire)](const asio::error_code& ec)
        {
            if (ec || state->disarmed)
                return;
            state->expired = true;
            on_expire();
        });
    }

    deadline(const deadline&) = delete;
    deadline& operator=(const deadline&) = delete;

    ~deadline()
    {
        state_->disarmed = true;
        if (timer_)
            timer_->cancel();
    }

    [[nodiscard]] bool expired() const noexcept { return state_->expired; }

    [[nodiscard]] asio::error_code translate(asio::error_code ec) const noexcept
    {
        if (state_->expired && ec == asio::error::operation_aborted)
            return asio::error::timed_out;
        return ec;
    }

private:
    struct state
    {
        bool expired = false;
        // set once the guarded operation is over; an expiry already queued is ignored
        bool disarmed = false;
    };

    std::shared_ptr<state> state_;
    std::optional<asio::steady_timer> timer_;
};


/**
Dealing with network in a line oriented fashion.
Wraps a TCP socket; every read and write is bounded by the configured timeout.
**/
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(asio::tcp::socket socket,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : socket_(std::move(socket)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    dialog(const dialog&) = delete;
    dialog& operator=(const dialog&) = delete;

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /**
    Sending a line to network.

    @param line Line to send (CRLF added if missing).
    @return     Error mapped from the socket failure, if any.
    **/
    asio::awaitable<result_void> write_line_r(std::string line)
    {
        std::string payload = normalize_line(line);
        trace_line(popdesk::log::direction::send, payload);

        asio::error_code ec;
        deadline guard(socket_.get_executor(), timeout_, [this]() { abort(); });
        co_await asio::async_write(socket_, asio::buffer(payload), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail(error_from_asio(io_stage::write, guard.translate(ec), peer_));
        co_return ok();
    }

    /**
    Receiving a line from network, without its line terminator.

    @return Line, or `invalid_response` when it exceeds the maximum length.
    **/
    asio::awaitable<result<std::string>> read_line_r()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            asio::error_code ec;
            deadline guard(socket_.get_executor(), timeout_, [this]() { abort(); });
            co_await asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_, max_line_length_ + 2), '\n',
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return fail<std::string>(error_from_asio(io_stage::read, guard.translate(ec), peer_));
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                co_return fail<std::string>(error_code::invalid_response, "Line terminator missing.");
        }

        std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            co_return fail<std::string>(error_code::invalid_response, "Line too long.");
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(popdesk::log::direction::receive, line);
        co_return ok(std::move(line));
    }

    /// Aborts pending operations; they complete with `operation_aborted`.
    void abort() noexcept
    {
        asio::error_code ignore_ec;
        socket_.cancel(ignore_ec);
    }

    /// Closes the socket, discarding buffered input.
    void close() noexcept
    {
        asio::error_code ignore_ec;
        if (socket_.is_open())
        {
            socket_.shutdown(asio::tcp::socket::shutdown_both, ignore_ec);
            socket_.close(ignore_ec);
        }
        read_buffer_.clear();
    }

    [[nodiscard]] asio::tcp::socket& socket() noexcept { return socket_; }
    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }

    void peer(std::string host) { peer_ = std::move(host); }

    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
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

    void trace_line(popdesk::log::direction dir, std::string_view data) const
    {
        auto& logger = popdesk::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == popdesk::log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, dir, popdesk::detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    asio::tcp::socket socket_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::string peer_;

    std::string trace_protocol_{"NET"};
    bool redact_secrets_in_trace_{true};
};

} // namespace net
} // namespace popdesk
