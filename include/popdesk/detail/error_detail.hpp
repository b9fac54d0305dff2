/*

error_detail.hpp
----------------

Builder for the `key=value` lines stored in `popdesk::error::detail()`.

*/

#pragma once

#include <string>
#include <string_view>

#include <popdesk/detail/redact.hpp>

namespace popdesk::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        out_.append(key).append(1, '=').append(value).append(1, '\n');
        return *this;
    }

    /// Protocol line; a password it carries is hidden
    error_detail& add_line(std::string_view key, std::string_view line)
    {
        return add(key, redact_line(line));
    }

    error_detail& add_int(std::string_view key, unsigned long long value)
    {
        return add(key, std::to_string(value));
    }

    [[nodiscard]] const std::string& str() const noexcept { return out_; }

private:
    std::string out_;
};

} // namespace popdesk::detail
