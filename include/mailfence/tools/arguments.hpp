/*

arguments.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Coercion of the loosely typed argument objects sent by the calling agent.
Numbers may arrive as JSON numbers or as numeric text.

*/

#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/result.hpp>

namespace mailfence::tools
{

using arguments = nlohmann::json;

namespace args_detail
{

[[nodiscard]] inline const nlohmann::json* member(const arguments& args, std::string_view name)
{
    if (!args.is_object())
        return nullptr;
    auto it = args.find(std::string(name));
    if (it == args.end() || it->is_null())
        return nullptr;
    return &*it;
}

[[nodiscard]] inline std::optional<std::int64_t> parse_integer_text(std::string_view text) noexcept
{
    text = mailfence::detail::trim_view(text);
    if (!text.empty() && text.front() == '+')
        text.remove_prefix(1);
    std::int64_t value = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || res.ec != std::errc{} || res.ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

[[nodiscard]] inline std::optional<std::int64_t> as_integer(const nlohmann::json& value) noexcept
{
    if (value.is_number_unsigned())
    {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::nullopt;
        return static_cast<std::int64_t>(u);
    }
    if (value.is_number_integer())
        return value.get<std::int64_t>();
    if (value.is_number_float())
    {
        // Fractions truncate toward zero; anything outside int64 is malformed.
        const double d = value.get<double>();
        constexpr double int64_bound = 9223372036854775808.0;
        if (!std::isfinite(d) || d < -int64_bound || d >= int64_bound)
            return std::nullopt;
        return static_cast<std::int64_t>(d);
    }
    if (value.is_string())
        return parse_integer_text(value.get_ref<const std::string&>());
    return std::nullopt;
}

} // namespace args_detail

/// A string argument if present and a string, regardless of content.
[[nodiscard]] inline std::optional<std::string> optional_string(const arguments& args, std::string_view name)
{
    const auto* v = args_detail::member(args, name);
    if (v == nullptr || !v->is_string())
        return std::nullopt;
    return v->get<std::string>();
}

/// A required, non-blank string argument; otherwise a `missing_argument` caller error.
[[nodiscard]] inline result<std::string> require_string(const arguments& args, std::string_view name)
{
    auto value = optional_string(args, name);
    if (!value || detail::is_blank(*value))
        return fail<std::string>(errc::missing_argument, "'" + std::string(name) + "' is required");
    return std::move(*value);
}

/// A required integer given as a number or numeric text.
[[nodiscard]] inline result<std::int64_t> require_integer(const arguments& args, std::string_view name)
{
    const auto* v = args_detail::member(args, name);
    if (v == nullptr || !(v->is_number() || v->is_string()))
        return fail<std::int64_t>(errc::missing_argument,
            "'" + std::string(name) + "' is required and must be an integer");

    auto value = args_detail::as_integer(*v);
    if (!value)
        return fail<std::int64_t>(errc::invalid_argument, "'" + std::string(name) + "' must be an integer");
    return *value;
}

/**
maxResults as requested, or `default_value` when absent or unparsable. Clamping is left to the caller.
**/
[[nodiscard]] inline std::int64_t parse_max_results(const arguments& args, std::int64_t default_value = 10)
{
    const auto* v = args_detail::member(args, "maxResults");
    if (v == nullptr)
        return default_value;
    return args_detail::as_integer(*v).value_or(default_value);
}

} // namespace mailfence::tools
