/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <popdesk/detail/result.hpp>
#include <popdesk/mailbox.hpp>
#include <popdesk/message.hpp>

namespace popdesk
{

/**
Blocking mail retrieval transport as seen by the session.

Owns the connection and the protocol framing. Every call is one ordered
request/response exchange; none is pipelined. One connection at a time.
**/
class transport
{
public:
    virtual ~transport() = default;

    /**
    Opens the connection and consumes the server greeting.

    @param host Server address.
    @param port Port override, protocol default when empty.
    **/
    virtual result_void connect(const std::string& host, std::optional<std::uint16_t> port) = 0;

    /// Authenticates; a rejection is reported as `authentication_failed`.
    virtual result_void login(const std::string& username, const std::string& secret) = 0;

    virtual result<mailbox_stat> message_count() = 0;

    /// All messages in sequence number order.
    virtual result<std::vector<message>> messages() = 0;

    /// Marks a message for deletion; the server commits it on logout.
    virtual result_void delete_message(unsigned sequence_number) = 0;

    virtual result_void logout() = 0;

    /// Closes the connection; no-op when there is none.
    virtual result_void disconnect() = 0;

    [[nodiscard]] virtual bool is_connected() const noexcept = 0;

    /**
    Aborts the blocking call in progress, if any. Safe to call from another
    thread. The aborted call fails with `cancelled`.
    **/
    virtual void cancel() noexcept = 0;
};

} // namespace popdesk
