/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Locale-independent ASCII helpers. Bytes above 0x7f are never letters, digits or
spaces here, so UTF-8 sequences pass through untouched.

*/

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mailfence::detail
{

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
{
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

/// Space, tab, CR, LF, vertical tab and form feed.
[[nodiscard]] constexpr bool is_ascii_space(char c) noexcept
{
    return c == ' ' || (c >= '\t' && c <= '\r');
}

[[nodiscard]] constexpr char ascii_tolower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
            return false;
    }
    return true;
}

[[nodiscard]] constexpr bool istarts_with_ascii(std::string_view s, std::string_view prefix) noexcept
{
    return s.size() >= prefix.size() && iequals_ascii(s.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out += ascii_tolower(c);
    return out;
}

[[nodiscard]] constexpr std::string_view trim_view(std::string_view sv) noexcept
{
    std::size_t begin = 0;
    std::size_t end = sv.size();
    while (begin < end && is_ascii_space(sv[begin]))
        ++begin;
    while (end > begin && is_ascii_space(sv[end - 1]))
        --end;
    return sv.substr(begin, end - begin);
}

[[nodiscard]] inline std::string trim_copy(std::string_view sv)
{
    return std::string(trim_view(sv));
}

/// True for empty or whitespace-only text.
[[nodiscard]] constexpr bool is_blank(std::string_view sv) noexcept
{
    return trim_view(sv).empty();
}

} // namespace mailfence::detail
