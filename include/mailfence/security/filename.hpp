/*

filename.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/utf8.hpp>

namespace mailfence::security
{

inline constexpr std::string_view FALLBACK_FILENAME = "attachment";

inline constexpr std::size_t MAX_FILENAME_CHARS = 200;

/**
Reduce a sender-supplied filename to a name that is safe to create inside a single directory.

Keeps only the last path component (either separator), drops leading dots, maps every code point outside
`[A-Za-z0-9._-]` to `_` and clamps to `max_chars`. Blank or emptied names become `attachment`. Idempotent.
**/
[[nodiscard]] inline std::string sanitize_filename(std::string_view raw, std::size_t max_chars = MAX_FILENAME_CHARS)
{
    if (detail::is_blank(raw))
        return std::string(FALLBACK_FILENAME);

    const auto last_sep = raw.find_last_of("/\\");
    if (last_sep != std::string_view::npos)
        raw.remove_prefix(last_sep + 1);

    while (!raw.empty() && raw.front() == '.')
        raw.remove_prefix(1);

    std::string name;
    name.reserve(raw.size());
    detail::for_each_code_point(raw, [&name](std::string_view cp)
    {
        const char c = cp.front();
        const bool keep = cp.size() == 1 && (detail::is_ascii_alnum(c) || c == '.' || c == '_' || c == '-');
        name += keep ? c : '_';
    });

    if (name.size() > max_chars)
        name.resize(max_chars);

    if (name.empty())
        return std::string(FALLBACK_FILENAME);
    return name;
}

} // namespace mailfence::security
