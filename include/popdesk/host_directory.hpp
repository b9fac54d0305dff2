/*

host_directory.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mail domain to POP3 server lookup, loaded once from a properties file.

*/


#pragma once

#include <charconv>
#include <cstdint>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <popdesk/detail/error_detail.hpp>
#include <popdesk/detail/log.hpp>
#include <popdesk/detail/result.hpp>

namespace popdesk
{

/// Host directory location used when the caller does not name one
inline constexpr const char* DEFAULT_HOSTS_FILE = "hosts.properties";

/// Server a mail domain is served by
struct host_record
{
    std::string host;
    std::optional<std::uint16_t> port;

    /**
    Splits `host:port`. Anything without exactly one colon followed by a port in
    1..65535 is taken as a host name verbatim.
    **/
    [[nodiscard]] static host_record from_value(std::string_view value)
    {
        const auto colon = value.find(':');
        if (colon == std::string_view::npos || colon == 0 || value.find(':', colon + 1) != std::string_view::npos)
            return host_record{std::string(value), std::nullopt};

        const std::string_view service = value.substr(colon + 1);
        std::uint32_t port = 0;
        const auto [ptr, ec] = std::from_chars(service.data(), service.data() + service.size(), port);
        if (ec != std::errc{} || ptr != service.data() + service.size() || port == 0 || port > 65535u)
            return host_record{std::string(value), std::nullopt};
        return host_record{std::string(value.substr(0, colon)), static_cast<std::uint16_t>(port)};
    }
};


namespace detail
{

/**
Reader for the Java properties format.

Handles comment lines (`#`, `!`), `=`, `:` or whitespace separators, line
continuation with a trailing backslash and the escape sequences, `\uXXXX`
included (stored as UTF-8).
**/
class properties_reader
{
public:
    using entries_t = std::unordered_map<std::string, std::string>;

    [[nodiscard]] static result<entries_t> read(std::istream& in)
    {
        entries_t entries;
        std::string logical;
        std::string natural;
        std::size_t line_no = 0;
        bool continuing = false;

        while (std::getline(in, natural))
        {
            ++line_no;
            if (!natural.empty() && natural.back() == '\r')
                natural.pop_back();

            std::string_view view(natural);
            std::size_t start = 0;
            while (start < view.size() && is_blank(view[start]))
                ++start;
            view.remove_prefix(start);

            if (!continuing)
            {
                if (view.empty() || view.front() == '#' || view.front() == '!')
                    continue;
                logical.clear();
            }

            if (ends_with_continuation(view))
            {
                view.remove_suffix(1);
                logical.append(view.data(), view.size());
                continuing = true;
                continue;
            }
            logical.append(view.data(), view.size());
            continuing = false;

            auto entry = parse_entry(logical, line_no);
            if (!entry)
                return fail<entries_t>(std::move(entry).error());
            entries.insert_or_assign(std::move(entry->first), std::move(entry->second));
        }
        if (in.bad())
            return fail<entries_t>(error_code::startup_fatal, "Reading host directory failed.");

        if (continuing && !logical.empty())
        {
            auto entry = parse_entry(logical, line_no);
            if (!entry)
                return fail<entries_t>(std::move(entry).error());
            entries.insert_or_assign(std::move(entry->first), std::move(entry->second));
        }
        return entries;
    }

private:
    static bool is_blank(char ch) noexcept
    {
        return ch == ' ' || ch == '\t' || ch == '\f';
    }

    /// Odd number of trailing backslashes
    static bool ends_with_continuation(std::string_view line) noexcept
    {
        std::size_t count = 0;
        for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it)
            ++count;
        return count % 2 == 1;
    }

    static result<std::pair<std::string, std::string>> parse_entry(std::string_view line, std::size_t line_no)
    {
        std::size_t pos = 0;
        std::string raw_key;
        while (pos < line.size())
        {
            const char ch = line[pos];
            if (ch == '\\' && pos + 1 < line.size())
            {
                raw_key.push_back(ch);
                raw_key.push_back(line[pos + 1]);
                pos += 2;
                continue;
            }
            if (ch == '=' || ch == ':' || is_blank(ch))
                break;
            raw_key.push_back(ch);
            ++pos;
        }

        while (pos < line.size() && is_blank(line[pos]))
            ++pos;
        if (pos < line.size() && (line[pos] == '=' || line[pos] == ':'))
            ++pos;
        while (pos < line.size() && is_blank(line[pos]))
            ++pos;

        auto key = unescape(raw_key, line_no);
        if (!key)
            return fail<std::pair<std::string, std::string>>(std::move(key).error());
        auto value = unescape(line.substr(pos), line_no);
        if (!value)
            return fail<std::pair<std::string, std::string>>(std::move(value).error());
        return std::make_pair(std::move(*key), std::move(*value));
    }

    static result<std::string> unescape(std::string_view text, std::size_t line_no)
    {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] != '\\' || i + 1 == text.size())
            {
                out.push_back(text[i]);
                continue;
            }
            const char esc = text[++i];
            switch (esc)
            {
                case 't': out.push_back('\t'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 'f': out.push_back('\f'); break;
                case 'u':
                {
                    if (text.size() - i - 1 < 4)
                        return malformed_unicode(line_no);
                    std::uint32_t code = 0;
                    const char* first = text.data() + i + 1;
                    const auto [ptr, ec] = std::from_chars(first, first + 4, code, 16);
                    if (ec != std::errc{} || ptr != first + 4)
                        return malformed_unicode(line_no);
                    append_utf8(out, code);
                    i += 4;
                    break;
                }
                default: out.push_back(esc); break;
            }
        }
        return out;
    }

    static result<std::string> malformed_unicode(std::size_t line_no)
    {
        detail::error_detail detail;
        detail.add("source", "host directory");
        detail.add_int("line", line_no);
        error err(error_code::startup_fatal, "Malformed \\uXXXX escape in host directory.");
        err.with_detail(detail.str());
        return fail<std::string>(std::move(err));
    }

    static void append_utf8(std::string& out, std::uint32_t code)
    {
        if (code < 0x80)
        {
            out.push_back(static_cast<char>(code));
        }
        else if (code < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }
};

} // namespace detail


/**
Static mapping from mail domain to server address.

Loaded once at startup and read-only afterwards; share it as
`std::shared_ptr<const host_directory>`.
**/
class host_directory
{
public:
    using entries_t = std::unordered_map<std::string, std::string>;

    host_directory() = default;

    explicit host_directory(entries_t entries)
        : entries_(std::move(entries))
    {
    }

    /**
    Loads the directory from a properties file.

    @param path File location, `hosts.properties` in the working directory by default.
    @return     Directory, or `startup_fatal` when the file is missing, unreadable or malformed.
    **/
    [[nodiscard]] static result<host_directory> load(const std::string& path = DEFAULT_HOSTS_FILE)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            detail::error_detail detail;
            detail.add("source", "host directory");
            detail.add("path", path);
            error err(error_code::startup_fatal, "Cannot open host directory " + path + ".");
            err.with_detail(detail.str());
            return fail<host_directory>(std::move(err));
        }
        auto dir = parse(in);
        if (dir)
            POPDESK_INFO("Loaded " + std::to_string(dir->size()) + " host(s) from " + path);
        return dir;
    }

    [[nodiscard]] static host_directory from_entries(entries_t entries)
    {
        return host_directory(std::move(entries));
    }

    [[nodiscard]] static result<host_directory> parse(std::istream& in)
    {
        auto entries = detail::properties_reader::read(in);
        if (!entries)
            return fail<host_directory>(std::move(entries).error());
        return host_directory(std::move(*entries));
    }

    /**
    Looks up the server of a mail domain. Exact, case sensitive match.

    @return Server record, or `host_not_found` when the domain is absent or maps to no host.
    **/
    [[nodiscard]] result<host_record> resolve(std::string_view domain) const
    {
        const auto it = entries_.find(std::string(domain));
        if (it == entries_.end())
            return fail<host_record>(error_code::host_not_found,
                "Cannot find host address for domain " + std::string(domain) + ".");
        auto record = host_record::from_value(it->second);
        if (record.host.empty())
            return fail<host_record>(error_code::host_not_found,
                "Host address for domain " + std::string(domain) + " is empty.");
        return record;
    }

    [[nodiscard]] bool contains(std::string_view domain) const
    {
        return entries_.find(std::string(domain)) != entries_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    entries_t entries_;
};

} // namespace popdesk
