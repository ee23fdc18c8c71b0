/*

html.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

HTML to plain text reduction for message bodies and text/html attachments.

*/

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/utf8.hpp>

namespace mailfence::mime
{

namespace html_detail
{

using mailfence::detail::ascii_tolower;
using mailfence::detail::is_ascii_alpha;
using mailfence::detail::is_ascii_alnum;
using mailfence::detail::is_ascii_digit;

inline constexpr std::array<std::string_view, 14> BREAK_TAGS{
    "br", "p", "div", "li", "tr", "h1", "h2", "h3", "h4", "h5", "h6", "blockquote", "table", "hr"};

inline constexpr std::array<std::pair<std::string_view, std::string_view>, 22> NAMED_ENTITIES{{
    {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}, {"nbsp", " "},
    {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"}, {"hellip", "\xE2\x80\xA6"},
    {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"}, {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
    {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}, {"laquo", "\xC2\xAB"}, {"raquo", "\xC2\xBB"},
    {"bull", "\xE2\x80\xA2"}, {"middot", "\xC2\xB7"}, {"euro", "\xE2\x82\xAC"}, {"shy", ""}}};

inline bool is_html_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

/// Collects text, collapsing whitespace runs and honouring explicit line breaks.
class text_sink
{
public:
    void text(std::string_view s)
    {
        for (char c : s)
        {
            if (is_html_space(c))
                space();
            else
                out_ += c;
        }
    }

    void space()
    {
        if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n')
            out_ += ' ';
    }

    void line_break()
    {
        while (!out_.empty() && out_.back() == ' ')
            out_.pop_back();
        out_ += '\n';
    }

    std::string finish()
    {
        std::string collapsed;
        collapsed.reserve(out_.size());
        std::size_t newlines = 0;
        for (char c : out_)
        {
            if (c == '\n')
            {
                if (++newlines > 2)
                    continue;
            }
            else
                newlines = 0;
            collapsed += c;
        }
        return mailfence::detail::trim_copy(collapsed);
    }

private:
    std::string out_;
};

/// Decode the entity starting at `pos` (which holds '&'); returns the bytes consumed, 0 if not an entity.
inline std::size_t decode_entity(std::string_view html, std::size_t pos, std::string& decoded)
{
    const auto semi = html.find(';', pos + 1);
    if (semi == std::string_view::npos || semi - pos > 12)
        return 0;
    const auto name = html.substr(pos + 1, semi - pos - 1);
    if (name.empty())
        return 0;

    if (name.front() == '#')
    {
        std::uint32_t cp = 0;
        const bool hex = name.size() > 1 && (name[1] == 'x' || name[1] == 'X');
        const auto digits = name.substr(hex ? 2 : 1);
        if (digits.empty())
            return 0;
        for (char c : digits)
        {
            int v = -1;
            if (is_ascii_digit(c))
                v = c - '0';
            else if (hex && ascii_tolower(c) >= 'a' && ascii_tolower(c) <= 'f')
                v = ascii_tolower(c) - 'a' + 10;
            if (v < 0)
                return 0;
            cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(v);
            if (cp > 0x10FFFF)
                cp = 0x110000;
        }
        mailfence::detail::utf8_append(decoded, cp);
        return semi - pos + 1;
    }

    for (const auto& [entity, text] : NAMED_ENTITIES)
    {
        if (name == entity)
        {
            decoded.append(text);
            return semi - pos + 1;
        }
    }
    return 0;
}

/// Position just past the '>' closing the tag opened at `pos`, skipping quoted attribute values.
inline std::size_t tag_end(std::string_view html, std::size_t pos) noexcept
{
    char quote = 0;
    for (std::size_t i = pos + 1; i < html.size(); ++i)
    {
        const char c = html[i];
        if (quote != 0)
        {
            if (c == quote)
                quote = 0;
        }
        else if (c == '"' || c == '\'')
            quote = c;
        else if (c == '>')
            return i + 1;
    }
    return html.size();
}

/// Offset of the case-insensitive `needle` at or after `from`, or npos.
inline std::size_t ifind(std::string_view hay, std::string_view needle, std::size_t from) noexcept
{
    if (needle.size() > hay.size())
        return std::string_view::npos;
    for (std::size_t i = from; i + needle.size() <= hay.size(); ++i)
    {
        if (mailfence::detail::iequals_ascii(hay.substr(i, needle.size()), needle))
            return i;
    }
    return std::string_view::npos;
}

/// Offset of the end tag `</name` at or after `from`, ignoring longer names such as `</scripts`.
inline std::size_t find_end_tag(std::string_view html, std::string_view name, std::size_t from)
{
    const std::string needle = "</" + std::string(name);
    for (auto at = ifind(html, needle, from); at != std::string_view::npos; at = ifind(html, needle, at + 1))
    {
        const std::size_t after = at + needle.size();
        if (after == html.size() || html[after] == '>' || html[after] == '/' || is_html_space(html[after]))
            return at;
    }
    return std::string_view::npos;
}

} // namespace html_detail

/**
Reduce HTML to readable plain text.

Tags are dropped; `<br>` and block elements such as `<p>` produce line breaks; `script` and `style` elements and
comments vanish with their content; entities are decoded; whitespace runs collapse to one space, more than two
consecutive line breaks collapse to two, and the result is trimmed.
**/
[[nodiscard]] inline std::string strip_html(std::string_view html)
{
    using namespace html_detail;

    text_sink sink;
    std::size_t pos = 0;
    while (pos < html.size())
    {
        const char c = html[pos];
        if (c == '&')
        {
            std::string decoded;
            const std::size_t used = decode_entity(html, pos, decoded);
            if (used > 0)
            {
                sink.text(decoded);
                pos += used;
                continue;
            }
            sink.text("&");
            ++pos;
            continue;
        }

        if (c != '<' || pos + 1 >= html.size())
        {
            sink.text(html.substr(pos, 1));
            ++pos;
            continue;
        }

        if (html.substr(pos, 4) == "<!--")
        {
            const auto close = html.find("-->", pos + 4);
            pos = close == std::string_view::npos ? html.size() : close + 3;
            continue;
        }

        const char next = html[pos + 1];
        if (next == '!' || next == '?')
        {
            pos = tag_end(html, pos);
            continue;
        }

        const bool closing = next == '/';
        const std::size_t name_start = pos + (closing ? 2 : 1);
        if (name_start >= html.size() || !is_ascii_alpha(html[name_start]))
        {
            sink.text("<");
            ++pos;
            continue;
        }

        std::size_t name_end = name_start;
        while (name_end < html.size() && is_ascii_alnum(html[name_end]))
            ++name_end;
        const std::string name = mailfence::detail::to_lower_copy(html.substr(name_start, name_end - name_start));
        pos = tag_end(html, pos);

        if (!closing && (name == "script" || name == "style"))
        {
            const auto close = find_end_tag(html, name, pos);
            pos = close == std::string_view::npos ? html.size() : tag_end(html, close);
            continue;
        }

        bool is_break = false;
        for (auto tag : BREAK_TAGS)
            is_break = is_break || name == tag;

        if (is_break)
            sink.line_break();
    }

    return sink.finish();
}

} // namespace mailfence::mime
