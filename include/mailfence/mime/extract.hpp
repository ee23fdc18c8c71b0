/*

extract.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Body text and attachment discovery over a message part tree.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailfence/codec/base64.hpp>
#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/detail/utf8.hpp>
#include <mailfence/mime/html.hpp>
#include <mailfence/mime/part.hpp>

namespace mailfence::mime
{

/**
Metadata of one attachment. The index is the position of the part in a depth-first, pre-order walk of the tree
counting only parts with a filename.
**/
struct attachment_descriptor
{
    std::size_t index = 0;
    std::string filename;
    std::string mime_type;
    std::uint64_t size_bytes = 0;

    /// Where the content lives; only the mail collaborator interprets it.
    part_body source;
};

/**
Decode base64url body data as UTF-8 text.
**/
[[nodiscard]] inline result<std::string> decode_text_data(std::string_view data)
{
    auto bytes = decode_base64url(data);
    if (!bytes)
        return fail<std::string>(std::move(bytes).error());
    return mailfence::detail::utf8_decode_lossy(*bytes);
}

/**
Depth-first search for the first part of exactly `mime_type` carrying inline data.

@return Decoded text, `std::nullopt` when no such part exists, or `codec_invalid_input` for undecodable data.
**/
[[nodiscard]] inline result<std::optional<std::string>> find_body_by_mime_type(const message_part& part,
    std::string_view mime_type)
{
    if (mailfence::detail::iequals_ascii(part.mime_type, mime_type) && part.body && part.body->data)
    {
        auto text = decode_text_data(*part.body->data);
        if (!text)
            return fail<std::optional<std::string>>(std::move(text).error());
        return std::optional<std::string>(std::move(*text));
    }

    for (const auto& child : part.parts)
    {
        auto found = find_body_by_mime_type(child, mime_type);
        if (!found || found->has_value())
            return found;
    }
    return std::optional<std::string>{};
}

/**
Readable body of a message: the first text/plain part, otherwise the first text/html part reduced to text.
**/
[[nodiscard]] inline result<std::optional<std::string>> extract_body(const message_part& root)
{
    auto plain = find_body_by_mime_type(root, "text/plain");
    if (!plain || plain->has_value())
        return plain;

    auto html = find_body_by_mime_type(root, "text/html");
    if (!html || !html->has_value())
        return html;
    return std::optional<std::string>(strip_html(**html));
}

namespace extract_detail
{

inline void collect_attachments(const message_part& part, std::vector<attachment_descriptor>& out)
{
    if (!part.filename.empty())
    {
        attachment_descriptor att;
        att.index = out.size();
        att.filename = part.filename;
        att.mime_type = part.mime_type;
        if (part.body)
        {
            att.size_bytes = part.body->size;
            att.source = *part.body;
        }
        out.push_back(std::move(att));
    }

    for (const auto& child : part.parts)
        collect_attachments(child, out);
}

} // namespace extract_detail

[[nodiscard]] inline std::vector<attachment_descriptor> extract_attachments(const message_part& root)
{
    std::vector<attachment_descriptor> out;
    extract_detail::collect_attachments(root, out);
    return out;
}

[[nodiscard]] inline std::vector<attachment_descriptor> extract_attachments(const std::optional<message_part>& root)
{
    if (!root)
        return {};
    return extract_attachments(*root);
}

} // namespace mailfence::mime
