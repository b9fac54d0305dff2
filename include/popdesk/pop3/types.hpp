#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <popdesk/net/dialog.hpp>

namespace popdesk::pop3
{

/// Well-known POP3 port (RFC 1939)
inline constexpr std::uint16_t DEFAULT_PORT = 110;

struct options
{
    std::size_t max_line_length = popdesk::net::DEFAULT_MAX_LINE_LENGTH;
    /// Bound on each read and write; none when empty
    std::optional<std::chrono::steady_clock::duration> timeout = std::chrono::seconds(60);
    /// Bound on name resolution plus TCP connect; none when empty
    std::optional<std::chrono::steady_clock::duration> connect_timeout = std::chrono::seconds(30);
    bool redact_secrets_in_trace = true;
};

} // namespace popdesk::pop3
