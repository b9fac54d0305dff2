/*

scoped_connection.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <popdesk/detail/log.hpp>
#include <popdesk/detail/result.hpp>
#include <popdesk/transport.hpp>

namespace popdesk::detail
{

/**
One connect...disconnect exchange with the server.

The transport is released on every path out of the scope. `close()` runs
logout and disconnect as regular steps and reports their failures. Otherwise
the destructor attempts the same cleanup and only logs its failures, leaving
the error already being returned untouched.
**/
class scoped_connection
{
public:
    explicit scoped_connection(transport& conn) noexcept
        : conn_(conn)
    {
    }

    scoped_connection(const scoped_connection&) = delete;
    scoped_connection& operator=(const scoped_connection&) = delete;

    ~scoped_connection()
    {
        if (!connected_)
            return;
        if (!logout_attempted_)
        {
            if (auto res = conn_.logout(); !res)
                POPDESK_WARN("Cleanup logout failed: " + res.error().to_string());
        }
        if (auto res = conn_.disconnect(); !res)
            POPDESK_WARN("Cleanup disconnect failed: " + res.error().to_string());
    }

    /// Connects and authenticates.
    [[nodiscard]] result_void open(const std::string& host, std::optional<std::uint16_t> port,
        const std::string& username, const std::string& secret)
    {
        if (auto res = conn_.connect(host, port); !res)
        {
            // a failed connect may still leave a half-open socket behind
            connected_ = conn_.is_connected();
            return res;
        }
        connected_ = true;
        return conn_.login(username, secret);
    }

    /// Logs out and disconnects, reporting the first failure.
    [[nodiscard]] result_void close()
    {
        if (!connected_)
            return ok();
        logout_attempted_ = true;
        POPDESK_TRY(conn_.logout());
        connected_ = false;
        return conn_.disconnect();
    }

    [[nodiscard]] transport& conn() noexcept { return conn_; }

private:
    transport& conn_;
    bool connected_ = false;
    bool logout_attempted_ = false;
};

} // namespace popdesk::detail
