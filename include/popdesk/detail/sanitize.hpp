#pragma once

#include <string_view>

namespace popdesk::detail
{

/// True when the text could end a protocol line early
[[nodiscard]] constexpr bool contains_crlf_or_nul(std::string_view value) noexcept
{
    return value.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos;
}

/// Strips blanks around a header name or value
[[nodiscard]] constexpr std::string_view trim_ascii(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    return text.substr(first, text.find_last_not_of(" \t\r") - first + 1);
}

} // namespace popdesk::detail
