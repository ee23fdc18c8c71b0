/*

field_sanitizer.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Wraps the untrusted fields of message records with a response boundary.

*/

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <mailfence/detail/utf8.hpp>
#include <mailfence/settings.hpp>

namespace mailfence::security
{

using record = nlohmann::ordered_json;

/// Fields holding third-party text. Closed set: anything else passes through unwrapped.
inline constexpr std::array<std::string_view, 6> UNTRUSTED_FIELDS{
    "from", "subject", "snippet", "body", "filename", "content"};

inline constexpr std::string_view TRUNCATED_MARKER = "\n[TRUNCATED]";

inline constexpr std::string_view ATTACHMENTS_FIELD = "attachments";

[[nodiscard]] inline bool is_untrusted_field(std::string_view name) noexcept
{
    return std::find(UNTRUSTED_FIELDS.begin(), UNTRUSTED_FIELDS.end(), name) != UNTRUSTED_FIELDS.end();
}

/**
Cut text to at most `max_chars` code points, appending the `[TRUNCATED]` marker when anything was removed.
**/
[[nodiscard]] inline std::string truncate_text(std::string_view text, std::size_t max_chars)
{
    const std::size_t cut = mailfence::detail::utf8_offset_of(text, max_chars);
    if (cut == std::string_view::npos)
        return std::string(text);

    std::string out(text.substr(0, cut));
    out += TRUNCATED_MARKER;
    return out;
}

[[nodiscard]] inline std::string wrap_untrusted(std::string_view value, std::string_view boundary)
{
    std::string out;
    out.reserve(value.size() + 2 * boundary.size() + 2);
    out.append(boundary);
    out += '\n';
    out.append(value);
    out += '\n';
    out.append(boundary);
    return out;
}

inline void wrap_untrusted_fields(record& rec, std::string_view boundary)
{
    for (std::string_view field : UNTRUSTED_FIELDS)
    {
        auto it = rec.find(std::string(field));
        if (it == rec.end() || !it->is_string())
            continue;
        *it = wrap_untrusted(it->get_ref<const std::string&>(), boundary);
    }
}

/**
Sanitize one message record. The input is left untouched.

The body is truncated first, then every untrusted text field is wrapped. Records listed under `attachments` get their
untrusted fields wrapped with the same boundary; entries that are not records are dropped.
**/
[[nodiscard]] inline record sanitize_message(const record& message, std::string_view boundary,
    const size_limits& lim = {})
{
    if (!message.is_object())
        return message;

    record sanitized = message;

    if (auto body = sanitized.find("body"); body != sanitized.end() && body->is_string())
        *body = truncate_text(body->get_ref<const std::string&>(), lim.max_body_chars);

    wrap_untrusted_fields(sanitized, boundary);

    if (auto atts = sanitized.find(std::string(ATTACHMENTS_FIELD)); atts != sanitized.end() && atts->is_array())
    {
        record wrapped = record::array();
        for (const auto& att : *atts)
        {
            if (!att.is_object())
                continue;
            record copy = att;
            wrap_untrusted_fields(copy, boundary);
            wrapped.push_back(std::move(copy));
        }
        *atts = std::move(wrapped);
    }

    return sanitized;
}

/**
Sanitize a list of records with one boundary shared by the whole list.
**/
[[nodiscard]] inline record sanitize_messages(const record& messages, std::string_view boundary,
    const size_limits& lim = {})
{
    if (!messages.is_array())
        return sanitize_message(messages, boundary, lim);

    record out = record::array();
    for (const auto& msg : messages)
        out.push_back(sanitize_message(msg, boundary, lim));
    return out;
}

} // namespace mailfence::security
