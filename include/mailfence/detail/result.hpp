/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The sanitization pipeline never throws - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace mailfence
{

/// Error codes for mailfence operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Caller input (100-199)
    invalid_argument = 100,
    missing_argument = 101,
    index_out_of_range = 102,
    unknown_tool = 103,

    // Mail collaborator (200-299)
    message_not_found = 200,
    source_unavailable = 201,
    codec_invalid_input = 202,

    // Local resources (300-399)
    io_failed = 300,

    // Startup / fatal (900-999)
    random_source_unavailable = 900,
    config_missing = 901,
    internal = 999,
};

/// Broad classes of failure, driving how a failure is reported and logged
enum class error_category : std::uint8_t
{
    none,
    caller,
    collaborator,
    local,
    fatal
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::invalid_argument: return "invalid_argument";
        case errc::missing_argument: return "missing_argument";
        case errc::index_out_of_range: return "index_out_of_range";
        case errc::unknown_tool: return "unknown_tool";
        case errc::message_not_found: return "message_not_found";
        case errc::source_unavailable: return "source_unavailable";
        case errc::codec_invalid_input: return "codec_invalid_input";
        case errc::io_failed: return "io_failed";
        case errc::random_source_unavailable: return "random_source_unavailable";
        case errc::config_missing: return "config_missing";
        case errc::internal: return "internal";
    }
    return "unknown";
}

[[nodiscard]] constexpr error_category category_of(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    if (c == 0)
        return error_category::none;
    if (c < 200)
        return error_category::caller;
    if (c < 300)
        return error_category::collaborator;
    if (c < 900)
        return error_category::local;
    return error_category::fatal;
}

/// Rich error type with code, message, structured detail and failure site
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::source_location where{};

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }

    [[nodiscard]] error_category category() const noexcept { return category_of(code); }

    [[nodiscard]] bool is_caller_error() const noexcept
    {
        return category() == error_category::caller;
    }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        return std::format("[{}] {}", mailfence::to_string(code), message);
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = std::expected<void, error_info>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message,
    std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), {}, where});
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message, std::string detail,
    std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), where});
}

/// Propagate the error of a result-returning expression, otherwise yield its value.
/// Usage: auto val = MAILFENCE_TRY(some_op());
#define MAILFENCE_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
        std::move(*_result); \
    })

} // namespace mailfence
