/*

content.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Ordered, heterogeneous output of one tool invocation, in the shape the
tool-calling transport expects for a multi-part result.

*/

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mailfence::response
{

struct text_content
{
    std::string text;
};

/// Binary payload, base64 encoded, with its declared mime type.
struct image_content
{
    std::string data;
    std::string mime_type;
};

using content_part = std::variant<text_content, image_content>;

struct tool_result
{
    std::vector<content_part> content;
    bool is_error = false;

    [[nodiscard]] std::size_t size() const noexcept { return content.size(); }

    /// Text of the part at `i`; empty for non-text parts.
    [[nodiscard]] const std::string& text_at(std::size_t i) const
    {
        static const std::string empty;
        if (const auto* t = std::get_if<text_content>(&content.at(i)))
            return t->text;
        return empty;
    }
};

inline void to_json(nlohmann::ordered_json& j, const content_part& part)
{
    if (const auto* t = std::get_if<text_content>(&part))
        j = nlohmann::ordered_json{{"type", "text"}, {"text", t->text}};
    else if (const auto* img = std::get_if<image_content>(&part))
        j = nlohmann::ordered_json{{"type", "image"}, {"data", img->data}, {"mimeType", img->mime_type}};
}

inline void to_json(nlohmann::ordered_json& j, const tool_result& res)
{
    j = nlohmann::ordered_json::object();
    j["content"] = nlohmann::ordered_json::array();
    for (const auto& part : res.content)
        j["content"].push_back(nlohmann::ordered_json(part));
    j["isError"] = res.is_error;
}

} // namespace mailfence::response
