/*

error_mapping.hpp
-----------------

Centralized mapping between POP3 responses and popdesk::error_code.

*/

#pragma once

#include <string_view>

#include <popdesk/detail/error_detail.hpp>
#include <popdesk/detail/result.hpp>

namespace popdesk::pop3
{

enum class error_kind
{
    response,
    auth,
    message,
    protocol,
    invalid_state
};

[[nodiscard]] constexpr error_code map_pop3_error(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::auth: return error_code::authentication_failed;
        case error_kind::message: return error_code::message_not_found;
        case error_kind::protocol: return error_code::invalid_response;
        case error_kind::invalid_state: return error_code::invalid_state;
        case error_kind::response: return error_code::server_rejection;
    }
    return error_code::server_rejection;
}

[[nodiscard]] inline detail::error_detail make_pop3_detail(std::string_view command, std::string_view response_line = {})
{
    detail::error_detail detail;
    detail.add("proto", "pop3");
    detail.add_line("command", command);
    detail.add("response.line", response_line);
    return detail;
}

} // namespace popdesk::pop3
