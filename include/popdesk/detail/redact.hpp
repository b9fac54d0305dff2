#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace popdesk::detail
{

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    const auto fold = [](char ch) { return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - 'a' + 'A') : ch; };
    for (std::size_t i = 0; i < a.size(); ++i)
        if (fold(a[i]) != fold(b[i]))
            return false;
    return true;
}

/**
Hides the password of a `PASS` command line.

`PASS <secret>` becomes `PASS <redacted>`, keeping the verb's case, leading
blanks and the line terminator. Any other line is returned unchanged.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    const std::size_t verb_begin = line.find_first_not_of(' ');
    if (verb_begin == std::string_view::npos)
        return std::string(line);
    const std::size_t verb_end = line.find(' ', verb_begin);
    if (verb_end == std::string_view::npos || !iequals_ascii(line.substr(verb_begin, verb_end - verb_begin), "PASS"))
        return std::string(line);

    const std::size_t eol = line.find_first_of("\r\n", verb_end);
    const std::string_view terminator = (eol == std::string_view::npos) ? std::string_view{} : line.substr(eol);
    const std::string_view argument = line.substr(verb_end, eol == std::string_view::npos ? eol : eol - verb_end);
    if (argument.find_first_not_of(' ') == std::string_view::npos)
        return std::string(line);

    std::string out(line.substr(0, verb_end));
    out += " <redacted>";
    out += terminator;
    return out;
}

} // namespace popdesk::detail
