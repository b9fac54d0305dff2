/*

asio_error.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio names used by the network layer, and the translation of Asio
error codes into popdesk::error.

*/

#pragma once

#include <string>
#include <string_view>

#include <boost/asio.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "popdesk requires coroutine support (C++20) in Boost.Asio"
#endif

#include <popdesk/detail/error_detail.hpp>
#include <popdesk/detail/result.hpp>

namespace popdesk::asio
{

using boost::asio::any_io_executor;
using boost::asio::async_connect;
using boost::asio::async_read_until;
using boost::asio::async_write;
using boost::asio::awaitable;
using boost::asio::buffer;
using boost::asio::co_spawn;
using boost::asio::dynamic_buffer;
using boost::asio::io_context;
using boost::asio::post;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;
using error_code = boost::system::error_code;
namespace error = boost::asio::error;

} // namespace popdesk::asio

namespace popdesk
{

/// Stage of a network exchange, recorded in the error detail
enum class io_stage
{
    resolve,
    connect,
    read,
    write
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
    }
    return "unknown";
}

[[nodiscard]] inline error_code map_asio_error(io_stage stage, const asio::error_code& ec) noexcept
{
    if (ec == asio::error::timed_out)
        return error_code::connection_timeout;
    if (ec == asio::error::operation_aborted)
        return error_code::cancelled;
    if (ec == asio::error::eof ||
        ec == asio::error::connection_reset ||
        ec == asio::error::broken_pipe)
        return error_code::connection_closed;
    if (ec == asio::error::connection_refused ||
        ec == asio::error::host_unreachable ||
        ec == asio::error::network_unreachable)
        return error_code::connection_failed;
    if (ec == asio::error::host_not_found ||
        ec == asio::error::host_not_found_try_again)
        return error_code::dns_resolution_failed;
    if (ec == asio::error::message_size || ec == asio::error::not_found)
        return error_code::invalid_response;

    switch (stage)
    {
        case io_stage::resolve: return error_code::dns_resolution_failed;
        case io_stage::connect: return error_code::connection_failed;
        case io_stage::read:
        case io_stage::write: return error_code::socket_error;
    }
    return error_code::socket_error;
}

/// Convert asio::error_code to popdesk::error
[[nodiscard]] inline error error_from_asio(io_stage stage, const asio::error_code& ec, std::string_view host = {})
{
    if (!ec)
        return error{};

    detail::error_detail detail;
    detail.add("proto", "pop3");
    if (!host.empty())
        detail.add("host", host);
    detail.add("stage", stage_name(stage));
    detail.add("sys", std::to_string(ec.value()) + " " + ec.message());

    error err(map_asio_error(stage, ec), ec.message());
    err.with_detail(detail.str());
    return err;
}

} // namespace popdesk
