/*

utf8.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

UTF-8 helpers. Length limits throughout mailfence count Unicode code points,
so truncation never splits a multi-byte sequence.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mailfence::detail
{

inline constexpr std::string_view REPLACEMENT_CHAR_UTF8 = "\xEF\xBF\xBD";

/**
Length of the well-formed UTF-8 sequence starting at `pos`, or 0 if the bytes there
do not form one (bad lead byte, truncated sequence, overlong form, surrogate or
value above U+10FFFF).
**/
[[nodiscard]] inline std::size_t utf8_sequence_length(std::string_view text, std::size_t pos) noexcept
{
    const auto b0 = static_cast<unsigned char>(text[pos]);
    if (b0 < 0x80)
        return 1;

    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0)
    {
        len = 2;
        cp = b0 & 0x1F;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        len = 3;
        cp = b0 & 0x0F;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        len = 4;
        cp = b0 & 0x07;
    }
    else
        return 0;

    if (pos + len > text.size())
        return 0;

    for (std::size_t i = 1; i < len; ++i)
    {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if ((b & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
        return 0;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

/// Decode bytes as UTF-8, replacing every malformed byte with U+FFFD.
[[nodiscard]] inline std::string utf8_decode_lossy(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size())
    {
        const std::size_t len = utf8_sequence_length(bytes, pos);
        if (len == 0)
        {
            out.append(REPLACEMENT_CHAR_UTF8);
            ++pos;
            continue;
        }
        out.append(bytes.substr(pos, len));
        pos += len;
    }
    return out;
}

/// Number of code points; a malformed byte counts as one.
[[nodiscard]] inline std::size_t utf8_length(std::string_view text) noexcept
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const std::size_t len = utf8_sequence_length(text, pos);
        pos += len == 0 ? 1 : len;
        ++count;
    }
    return count;
}

/// Byte offset where the code point with index `max_chars` begins, or npos if the text is not longer.
[[nodiscard]] inline std::size_t utf8_offset_of(std::string_view text, std::size_t max_chars) noexcept
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (count == max_chars)
            return pos;
        const std::size_t len = utf8_sequence_length(text, pos);
        pos += len == 0 ? 1 : len;
        ++count;
    }
    return std::string_view::npos;
}

/// Invoke `fn(sequence)` for every code point (malformed bytes are passed one at a time).
template<typename F>
void for_each_code_point(std::string_view text, F&& fn)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t len = utf8_sequence_length(text, pos);
        if (len == 0)
            len = 1;
        fn(text.substr(pos, len));
        pos += len;
    }
}

/// Append the UTF-8 encoding of a code point; invalid values become U+FFFD.
inline void utf8_append(std::string& out, std::uint32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF) || cp == 0)
    {
        out.append(REPLACEMENT_CHAR_UTF8);
        return;
    }
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace mailfence::detail
