/*

records.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Flattens mail service messages into the records handed to the sanitizer.

*/

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/mime/extract.hpp>
#include <mailfence/mime/part.hpp>

namespace mailfence::mime
{

using record = nlohmann::ordered_json;

/// Top-level headers copied into records, keyed by their lowercase name.
inline constexpr std::array<std::string_view, 4> METADATA_HEADERS{"From", "To", "Subject", "Date"};

namespace records_detail
{

inline void put_metadata_headers(record& rec, const std::optional<message_part>& payload)
{
    for (auto name : METADATA_HEADERS)
        rec[mailfence::detail::to_lower_copy(name)] = "";

    if (!payload)
        return;
    for (const auto& h : payload->headers)
    {
        for (auto name : METADATA_HEADERS)
        {
            if (mailfence::detail::iequals_ascii(h.name, name))
                rec[mailfence::detail::to_lower_copy(name)] = h.value;
        }
    }
}

} // namespace records_detail

/**
Listing entry: `{id, threadId, snippet, from, to, subject, date}`. Missing headers become empty strings.
**/
[[nodiscard]] inline record to_summary_record(const mail_message& msg)
{
    record rec;
    rec["id"] = msg.id;
    rec["threadId"] = msg.thread_id;
    if (msg.snippet)
        rec["snippet"] = *msg.snippet;
    else
        rec["snippet"] = nullptr;
    records_detail::put_metadata_headers(rec, msg.payload);
    return rec;
}

[[nodiscard]] inline record to_attachment_records(const std::vector<attachment_descriptor>& attachments)
{
    record list = record::array();
    for (const auto& att : attachments)
    {
        record entry;
        entry["index"] = att.index;
        entry["filename"] = att.filename;
        entry["mimeType"] = att.mime_type;
        entry["sizeBytes"] = att.size_bytes;
        list.push_back(std::move(entry));
    }
    return list;
}

/**
Full message: `{id, threadId, from, to, subject, date, body, labels?, attachments?}`. A message without a readable
body gets an empty one.

@return The record, or `codec_invalid_input` when body data cannot be decoded.
**/
[[nodiscard]] inline result<record> to_full_record(const mail_message& msg)
{
    record rec;
    rec["id"] = msg.id;
    rec["threadId"] = msg.thread_id;
    records_detail::put_metadata_headers(rec, msg.payload);

    std::string body;
    if (msg.payload)
    {
        auto extracted = extract_body(*msg.payload);
        if (!extracted)
            return fail<record>(std::move(extracted).error());
        body = std::move(*extracted).value_or(std::string{});
    }
    rec["body"] = body;

    if (msg.label_ids)
        rec["labels"] = *msg.label_ids;

    const auto attachments = extract_attachments(msg.payload);
    if (!attachments.empty())
        rec["attachments"] = to_attachment_records(attachments);

    return rec;
}

} // namespace mailfence::mime
