/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown in popdesk - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace popdesk
{

/// Error codes for popdesk operations, grouped by range into error kinds
enum class error_code : std::uint16_t
{
    success = 0,

    // Credentials form (100-199)
    credentials_form = 100,
    invalid_address = 101,
    empty_secret = 102,

    // Host directory lookup (200-299)
    host_not_found = 200,

    // Startup (300-399)
    startup_fatal = 300,

    // Server rejection (400-499)
    server_rejection = 400,
    authentication_failed = 401,
    message_not_found = 402,

    // Transport (500-599)
    connection_failed = 500,
    connection_closed = 501,
    connection_timeout = 502,
    dns_resolution_failed = 503,
    socket_error = 504,
    invalid_response = 505,
    cancelled = 506,

    // Session state (600-699)
    invalid_state = 600,
};

/// Category an error code belongs to
enum class error_kind : std::uint8_t
{
    none,
    credentials_form,
    host_not_found,
    startup_fatal,
    server_rejection,
    transport,
    invalid_state
};

[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::credentials_form: return "Credentials form error";
        case error_code::invalid_address: return "Invalid address";
        case error_code::empty_secret: return "Empty secret";
        case error_code::host_not_found: return "Host not found";
        case error_code::startup_fatal: return "Startup failure";
        case error_code::server_rejection: return "Server rejection";
        case error_code::authentication_failed: return "Authentication failed";
        case error_code::message_not_found: return "Message not found";
        case error_code::connection_failed: return "Connection failed";
        case error_code::connection_closed: return "Connection closed";
        case error_code::connection_timeout: return "Connection timeout";
        case error_code::dns_resolution_failed: return "DNS resolution failed";
        case error_code::socket_error: return "Socket error";
        case error_code::invalid_response: return "Invalid response";
        case error_code::cancelled: return "Operation cancelled";
        case error_code::invalid_state: return "Invalid state";
    }
    return "Unknown error";
}

[[nodiscard]] constexpr error_kind kind_of(error_code ec) noexcept
{
    const auto c = static_cast<std::uint16_t>(ec);
    if (c >= 100 && c < 200)
        return error_kind::credentials_form;
    if (c >= 200 && c < 300)
        return error_kind::host_not_found;
    if (c >= 300 && c < 400)
        return error_kind::startup_fatal;
    if (c >= 400 && c < 500)
        return error_kind::server_rejection;
    if (c >= 500 && c < 600)
        return error_kind::transport;
    if (c >= 600 && c < 700)
        return error_kind::invalid_state;
    return error_kind::none;
}

[[nodiscard]] constexpr std::string_view error_kind_to_string(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::none: return "none";
        case error_kind::credentials_form: return "credentials_form";
        case error_kind::host_not_found: return "host_not_found";
        case error_kind::startup_fatal: return "startup_fatal";
        case error_kind::server_rejection: return "server_rejection";
        case error_kind::transport: return "transport";
        case error_kind::invalid_state: return "invalid_state";
    }
    return "unknown";
}

/// Rich error type with code, message, optional server response and detail
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string server_response)
        : code_(code), message_(std::move(message)), server_response_(std::move(server_response)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] error_kind kind() const noexcept { return kind_of(code_); }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& server_response() const noexcept { return server_response_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    error& with_detail(std::string detail)
    {
        detail_ = std::move(detail);
        return *this;
    }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }
    [[nodiscard]] bool is(error_kind kind) const noexcept { return kind_of(code_) == kind; }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += std::to_string(static_cast<int>(code_));
        out += "] ";
        out += message_;
        if (!server_response_.empty())
        {
            out += ": ";
            out += server_response_;
        }
        return out;
    }

private:
    error_code code_;
    std::string message_;
    std::string server_response_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

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
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message, std::string server_response)
{
    return std::unexpected(error(code, std::move(message), std::move(server_response)));
}

/// Propagate the error of a result-returning expression from a plain function
#define POPDESK_TRY(expr) \
    do { \
        auto&& popdesk_try_result_ = (expr); \
        if (!popdesk_try_result_) [[unlikely]] \
            return std::unexpected(std::move(popdesk_try_result_).error()); \
    } while (0)

/// Same for coroutines returning awaitable<result<T>>
#define POPDESK_CO_TRY(expr) \
    do { \
        auto&& popdesk_try_result_ = (expr); \
        if (!popdesk_try_result_) [[unlikely]] \
            co_return std::unexpected(std::move(popdesk_try_result_).error()); \
    } while (0)

} // namespace popdesk
