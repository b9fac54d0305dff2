/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <popdesk/detail/redact.hpp>
#include <popdesk/detail/sanitize.hpp>

namespace popdesk
{

/**
Message fetched from the mailbox.

Holds the raw RFC 5322 text together with the sequence number the server
assigned to it for the session it was fetched in. Headers are unfolded and kept
in their original order; lookup by name is case insensitive.
**/
class message
{
public:
    using header_t = std::pair<std::string, std::string>;
    using headers_t = std::vector<header_t>;

    message() = default;

    /**
    Parses raw message text.

    @param sequence_number Server numbering, 1-based.
    @param size            Size in octets as reported by the server listing.
    @param raw             Message text with CRLF or LF line endings.
    @return                Parsed message; text without an empty separator line is all headers.
    **/
    [[nodiscard]] static message parse(unsigned sequence_number, std::uint64_t size, std::string raw)
    {
        message msg;
        msg.sequence_number_ = sequence_number;
        msg.size_ = size;
        msg.raw_ = std::move(raw);
        msg.parse_raw();
        return msg;
    }

    [[nodiscard]] unsigned sequence_number() const noexcept { return sequence_number_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& raw() const noexcept { return raw_; }
    [[nodiscard]] const headers_t& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

    /// First header with the given name, empty if absent
    [[nodiscard]] std::string header(std::string_view name) const
    {
        for (const auto& [key, value] : headers_)
            if (detail::iequals_ascii(key, name))
                return value;
        return {};
    }

    [[nodiscard]] std::string subject() const { return header("Subject"); }
    [[nodiscard]] std::string from() const { return header("From"); }
    [[nodiscard]] std::string to() const { return header("To"); }
    [[nodiscard]] std::string date() const { return header("Date"); }

private:
    void parse_raw()
    {
        std::string_view rest(raw_);
        bool in_body = false;
        while (!rest.empty())
        {
            const auto eol = rest.find('\n');
            std::string_view line = rest.substr(0, eol);
            rest = (eol == std::string_view::npos) ? std::string_view{} : rest.substr(eol + 1);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            if (line.empty())
            {
                in_body = true;
                break;
            }
            parse_header_line(line);
        }
        if (in_body)
            body_.assign(rest.data(), rest.size());
    }

    void parse_header_line(std::string_view line)
    {
        // Continuation of a folded header
        if (line.front() == ' ' || line.front() == '\t')
        {
            if (headers_.empty())
                return;
            std::string& value = headers_.back().second;
            const std::string_view more = detail::trim_ascii(line);
            if (!more.empty())
            {
                if (!value.empty())
                    value.push_back(' ');
                value.append(more.data(), more.size());
            }
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return;
        headers_.emplace_back(std::string(detail::trim_ascii(line.substr(0, colon))),
            std::string(detail::trim_ascii(line.substr(colon + 1))));
    }

    unsigned sequence_number_ = 0;
    std::uint64_t size_ = 0;
    std::string raw_;
    headers_t headers_;
    std::string body_;
};

} // namespace popdesk
