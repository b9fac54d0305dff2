/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide logger: a severity threshold, an optional sink callback and a
separate switch for POP3 line tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace popdesk::log
{

enum class level : std::uint8_t
{
    trace,
    debug,
    info,
    warn,
    error,
    fatal,
    off
};

enum class direction : std::uint8_t
{
    send,
    receive
};

/// One record handed to the sink; `trace_info` is set for protocol lines only
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
    const auto index = static_cast<std::size_t>(lvl);
    return index < std::size(names) ? names[index] : "UNKNOWN";
}

/// Level name as given in `POPDESK_LOG`, lower case
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        const std::string_view upper = level_to_string(lvl);
        if (name.size() != upper.size())
            continue;
        bool same = true;
        for (std::size_t i = 0; i < name.size() && same; ++i)
            same = name[i] == static_cast<char>(upper[i] - 'A' + 'a');
        if (same)
            return lvl;
    }
    return std::nullopt;
}


class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept { threshold_.store(lvl, std::memory_order_relaxed); }

    /// Replaces the stderr output; an empty callback restores it
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(cb);
    }

    void clear_callback() { set_callback(nullptr); }

    void set_trace_enabled(bool enabled) noexcept { trace_.store(enabled, std::memory_order_relaxed); }
    [[nodiscard]] bool is_trace_enabled() const noexcept { return trace_.load(std::memory_order_relaxed); }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (lvl < threshold_.load(std::memory_order_relaxed) || lvl == level::off)
            return;
        emit(entry{lvl, std::chrono::system_clock::now(), std::string(message), loc, std::nullopt});
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        emit(entry{level::trace, std::chrono::system_clock::now(), {}, loc,
            entry::trace_info_t{dir, std::string(protocol), std::string(data)}});
    }

private:
    logger() = default;

    void emit(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
            sink_(e);
        else
            std::cerr << format_line(e);
    }

    [[nodiscard]] static std::string format_line(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        const std::string stamp = std::format("[{:02}:{:02}:{:02}.{:03}]",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count());

        if (!e.trace_info)
            return std::format("{} [{}] {}\n", stamp, level_to_string(e.lvl), e.message);
        return std::format("{} {} {} {}\n", stamp, e.trace_info->protocol,
            e.trace_info->dir == direction::send ? ">>>" : "<<<", printable(e.trace_info->data));
    }

    /// Protocol line cut to 500 octets, control characters masked, terminator dropped
    [[nodiscard]] static std::string printable(std::string_view data)
    {
        while (!data.empty() && (data.back() == '\r' || data.back() == '\n'))
            data.remove_suffix(1);
        constexpr std::size_t limit = 500;
        std::string out(data.substr(0, limit));
        for (char& ch : out)
            if (static_cast<unsigned char>(ch) < 0x20)
                ch = '.';
        if (data.size() > limit)
            out += "... [truncated]";
        return out;
    }

    std::atomic<level> threshold_{level::info};
    std::atomic<bool> trace_{false};
    std::mutex mutex_;
    callback_t sink_;
};

} // namespace popdesk::log

#define POPDESK_LOG(lvl, msg) \
    ::popdesk::log::logger::instance().log(lvl, msg, std::source_location::current())

#define POPDESK_DEBUG(msg) POPDESK_LOG(::popdesk::log::level::debug, msg)
#define POPDESK_INFO(msg)  POPDESK_LOG(::popdesk::log::level::info, msg)
#define POPDESK_WARN(msg)  POPDESK_LOG(::popdesk::log::level::warn, msg)
