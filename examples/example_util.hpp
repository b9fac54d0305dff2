#pragma once

#include <iostream>
#include <popdesk/detail/result.hpp>

inline void print_error(const popdesk::error& err)
{
    std::cout << "Error: " << popdesk::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    if (!err.server_response().empty())
        std::cout << "Server: " << err.server_response() << "\n";
    if (!err.detail().empty())
        std::cout << "Detail:\n" << err.detail();
}
