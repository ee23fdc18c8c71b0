/*

mail_source.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Interface to the remote mail service. Implementations own transport and
credentials; the pipeline only consumes what they return and must cope with
partial data.

*/

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailfence/codec/base64.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/mime/extract.hpp>
#include <mailfence/mime/part.hpp>

namespace mailfence::source
{

enum class message_format
{
    metadata,   ///< Identifiers, snippet and top-level headers only
    full        ///< Complete part tree with inline body data
};

class mail_source
{
public:
    virtual ~mail_source() = default;

    /// Ids of messages matching a search query (empty query lists the mailbox), newest first.
    virtual result<std::vector<std::string>> list_message_ids(std::string_view query, int max_results) = 0;

    virtual result<mime::mail_message> get_message(std::string_view id, message_format format) = 0;

    virtual result<std::vector<mime::mail_label>> list_labels() = 0;

    /// Base64url content of an attachment stored out of line, or nullopt if the service has none.
    virtual result<std::optional<std::string>> fetch_attachment_data(std::string_view message_id,
        std::string_view attachment_id) = 0;
};

/// Yields the raw bytes of one attachment; nullopt when the service returned nothing.
using fetch_bytes_fn = std::function<result<std::optional<std::string>>()>;

/**
Fetch capability for one attachment: inline data when the part carries it, else a secondary fetch by attachment id.
**/
[[nodiscard]] inline fetch_bytes_fn attachment_fetcher(mail_source& source, std::string message_id,
    const mime::attachment_descriptor& att)
{
    return [&source, message_id = std::move(message_id), body = att.source]() -> result<std::optional<std::string>>
    {
        std::optional<std::string> encoded = body.data;
        if (!encoded && body.attachment_id)
            encoded = MAILFENCE_TRY(source.fetch_attachment_data(message_id, *body.attachment_id));
        if (!encoded)
            return std::optional<std::string>{};
        return std::optional<std::string>(MAILFENCE_TRY(decode_base64url(*encoded)));
    };
}

} // namespace mailfence::source
