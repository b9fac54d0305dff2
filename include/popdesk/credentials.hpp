/*

credentials.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Structural checks on an address/secret pair, run before any network activity.

*/


#pragma once

#include <string>
#include <string_view>

#include <popdesk/detail/result.hpp>
#include <popdesk/detail/sanitize.hpp>

namespace popdesk
{

struct address_parts
{
    std::string local_part;
    std::string domain;
};

/// Signed-in user's credentials, held in memory for the session only
struct credentials
{
    std::string address;
    std::string username;
    std::string secret;

    void clear() noexcept
    {
        address.clear();
        username.clear();
        // zeroed before release
        for (char& ch : secret)
            ch = '\0';
        secret.clear();
    }
};

/**
Splits `local@domain` at its single `@`.

@param address Mail address.
@return        Local part and domain, or `invalid_address`.
**/
[[nodiscard]] inline result<address_parts> split_address(std::string_view address)
{
    const auto at = address.find('@');
    if (at == std::string_view::npos)
        return fail<address_parts>(error_code::invalid_address, "Address has no '@' sign.");
    if (address.find('@', at + 1) != std::string_view::npos)
        return fail<address_parts>(error_code::invalid_address, "Address has more than one '@' sign.");
    if (at == 0)
        return fail<address_parts>(error_code::invalid_address, "Address has an empty local part.");
    if (at + 1 == address.size())
        return fail<address_parts>(error_code::invalid_address, "Address has an empty domain.");
    return address_parts{std::string(address.substr(0, at)), std::string(address.substr(at + 1))};
}

/**
Checks the form of an address/secret pair. No network or existence check.

@return Success, or an error of kind `credentials_form`.
**/
[[nodiscard]] inline result_void validate_credentials(std::string_view address, std::string_view secret)
{
    if (detail::contains_crlf_or_nul(address))
        return fail(error_code::invalid_address, "Invalid address: CR/LF or NUL not allowed.");
    POPDESK_TRY(split_address(address));
    if (secret.empty())
        return fail(error_code::empty_secret, "Secret is empty.");
    if (detail::contains_crlf_or_nul(secret))
        return fail(error_code::credentials_form, "Invalid secret: CR/LF or NUL not allowed.");
    return ok();
}

} // namespace popdesk
