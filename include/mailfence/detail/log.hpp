/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailfence.
Supports multiple log levels and an optional callback sink. Output goes to
stderr by default so it never mixes with tool responses written to stdout.

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

#include <mailfence/detail/ascii.hpp>

namespace mailfence::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Very verbose diagnostics
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as found in MAILFENCE_LOG_LEVEL (case-insensitive).
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    name = detail::trim_view(name);
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        if (detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    }
    if (detail::iequals_ascii(name, "warning"))
        return level::warn;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

    /// Render third-party text for a log line: truncated, control characters masked.
    [[nodiscard]] static std::string sanitize_untrusted(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 120;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 || c == 127)
                c = '.';
        }
        return result;
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {}\n",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
            level_to_string(e.lvl), e.message);
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define MAILFENCE_LOG(lvl, msg) \
    ::mailfence::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILFENCE_TRACE(msg)  MAILFENCE_LOG(::mailfence::log::level::trace, msg)
#define MAILFENCE_DEBUG(msg)  MAILFENCE_LOG(::mailfence::log::level::debug, msg)
#define MAILFENCE_INFO(msg)   MAILFENCE_LOG(::mailfence::log::level::info, msg)
#define MAILFENCE_WARN(msg)   MAILFENCE_LOG(::mailfence::log::level::warn, msg)
#define MAILFENCE_ERROR(msg)  MAILFENCE_LOG(::mailfence::log::level::error, msg)
#define MAILFENCE_FATAL(msg)  MAILFENCE_LOG(::mailfence::log::level::fatal, msg)

} // namespace mailfence::log
