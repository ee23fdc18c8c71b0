/*

part.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Message part tree as handed out by the mail service, in its JSON shape:

    { "mimeType": "...", "filename": "...", "headers": [{"name": "...", "value": "..."}],
      "body": {"size": 0, "data": "<base64url>", "attachmentId": "..."}, "parts": [ ... ] }

Every member is optional; absent data parses to empty values.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <mailfence/detail/ascii.hpp>

namespace mailfence::mime
{

struct header
{
    std::string name;
    std::string value;
};

struct part_body
{
    /// Declared size in bytes; advisory only.
    std::uint64_t size = 0;

    /// Inline content, base64url encoded.
    std::optional<std::string> data;

    /// Opaque reference for a secondary fetch of the content.
    std::optional<std::string> attachment_id;
};

struct message_part
{
    std::string mime_type;
    std::string filename;
    std::vector<header> headers;
    std::optional<part_body> body;
    std::vector<message_part> parts;

    [[nodiscard]] std::optional<std::string> header_value(std::string_view name) const
    {
        for (const auto& h : headers)
        {
            if (mailfence::detail::iequals_ascii(h.name, name))
                return h.value;
        }
        return std::nullopt;
    }
};

/// One message as returned by the mail service.
struct mail_message
{
    std::string id;
    std::string thread_id;
    std::optional<std::string> snippet;
    std::optional<std::vector<std::string>> label_ids;
    std::optional<message_part> payload;
};

struct mail_label
{
    std::string id;
    std::string name;
    std::string type;
};

namespace detail
{

[[nodiscard]] inline std::string string_member(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

[[nodiscard]] inline std::optional<std::string> optional_string_member(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

} // namespace detail

inline void from_json(const nlohmann::json& j, part_body& body)
{
    body = part_body{};
    if (!j.is_object())
        return;
    if (auto it = j.find("size"); it != j.end() && it->is_number_unsigned())
        body.size = it->get<std::uint64_t>();
    else if (it != j.end() && it->is_number_integer() && it->get<std::int64_t>() > 0)
        body.size = static_cast<std::uint64_t>(it->get<std::int64_t>());
    body.data = detail::optional_string_member(j, "data");
    body.attachment_id = detail::optional_string_member(j, "attachmentId");
}

inline void from_json(const nlohmann::json& j, message_part& part)
{
    part = message_part{};
    if (!j.is_object())
        return;

    part.mime_type = detail::string_member(j, "mimeType");
    part.filename = detail::string_member(j, "filename");

    if (auto it = j.find("headers"); it != j.end() && it->is_array())
    {
        for (const auto& h : *it)
        {
            if (h.is_object())
                part.headers.push_back({detail::string_member(h, "name"), detail::string_member(h, "value")});
        }
    }

    if (auto it = j.find("body"); it != j.end() && it->is_object())
        part.body = it->get<part_body>();

    if (auto it = j.find("parts"); it != j.end() && it->is_array())
    {
        for (const auto& child : *it)
            part.parts.push_back(child.get<message_part>());
    }
}

inline void from_json(const nlohmann::json& j, mail_message& msg)
{
    msg = mail_message{};
    if (!j.is_object())
        return;

    msg.id = detail::string_member(j, "id");
    msg.thread_id = detail::string_member(j, "threadId");
    msg.snippet = detail::optional_string_member(j, "snippet");

    if (auto it = j.find("labelIds"); it != j.end() && it->is_array())
    {
        std::vector<std::string> labels;
        for (const auto& l : *it)
        {
            if (l.is_string())
                labels.push_back(l.get<std::string>());
        }
        msg.label_ids = std::move(labels);
    }

    if (auto it = j.find("payload"); it != j.end() && it->is_object())
        msg.payload = it->get<message_part>();
}

inline void from_json(const nlohmann::json& j, mail_label& label)
{
    label.id = detail::string_member(j, "id");
    label.name = detail::string_member(j, "name");
    label.type = detail::string_member(j, "type");
}

} // namespace mailfence::mime
