/*

classifier.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Decides how one attachment is surfaced: inline text, inline image or a
reference to a saved file.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailfence/codec/base64.hpp>
#include <mailfence/attachment/store.hpp>
#include <mailfence/attachment/types.hpp>
#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/detail/utf8.hpp>
#include <mailfence/mime/extract.hpp>
#include <mailfence/mime/html.hpp>
#include <mailfence/security/field_sanitizer.hpp>
#include <mailfence/settings.hpp>
#include <mailfence/source/mail_source.hpp>

namespace mailfence::attachment
{

/**
Pick the attachment at a caller-supplied index.

@return The descriptor, or `index_out_of_range` (a caller error) when the index is outside `[0, count)`.
**/
[[nodiscard]] inline result<mime::attachment_descriptor> select_attachment(
    const std::vector<mime::attachment_descriptor>& attachments, std::int64_t index)
{
    if (index < 0 || static_cast<std::uint64_t>(index) >= attachments.size())
    {
        return fail<mime::attachment_descriptor>(errc::index_out_of_range,
            "Attachment index " + std::to_string(index) + " out of range (0-"
                + std::to_string(static_cast<std::int64_t>(attachments.size()) - 1) + ")");
    }
    return attachments[static_cast<std::size_t>(index)];
}

[[nodiscard]] inline bool is_text_type(std::string_view mime_type) noexcept
{
    return detail::istarts_with_ascii(mime_type, "text/");
}

[[nodiscard]] inline bool is_image_type(std::string_view mime_type) noexcept
{
    return detail::istarts_with_ascii(mime_type, "image/");
}

[[nodiscard]] inline bool is_html_type(std::string_view mime_type) noexcept
{
    return detail::iequals_ascii(detail::trim_view(mime_type.substr(0, mime_type.find(';'))), "text/html");
}

class classifier
{
public:
    classifier(const attachment_store& store, size_limits limits)
        : store_(store), limits_(limits)
    {
    }

    /**
    Classify one attachment, calling `fetch_bytes` exactly once.

    Text types are decoded (HTML reduced to text) and truncated, with no disk write. Everything else is saved;
    images no larger than the inline ceiling are also returned base64 encoded. Missing content is treated as zero
    bytes.
    **/
    [[nodiscard]] result<attachment_result> classify(std::string_view message_id,
        const mime::attachment_descriptor& att, const source::fetch_bytes_fn& fetch_bytes) const
    {
        attachment_info info{std::string(message_id), att.index, att.filename, att.mime_type, att.size_bytes};

        auto fetched = fetch_bytes ? fetch_bytes() : result<std::optional<std::string>>(std::nullopt);
        if (!fetched)
            return fail<attachment_result>(std::move(fetched).error());
        const std::string bytes = std::move(*fetched).value_or(std::string{});

        if (is_text_type(att.mime_type))
        {
            std::string text = detail::utf8_decode_lossy(bytes);
            if (is_html_type(att.mime_type))
                text = mime::strip_html(text);
            text = security::truncate_text(text, limits_.max_attachment_chars);
            return attachment_result(text_attachment{std::move(info), std::move(text)});
        }

        auto saved = store_.save(message_id, att.filename, bytes);
        if (!saved)
            return fail<attachment_result>(std::move(saved).error());

        if (is_image_type(att.mime_type) && !bytes.empty() && bytes.size() <= limits_.max_inline_image_bytes)
        {
            base64 b64;
            return attachment_result(image_attachment{std::move(info), b64.encode_line(bytes), saved->string()});
        }

        return attachment_result(saved_file_attachment{std::move(info), saved->string()});
    }

private:
    const attachment_store& store_;
    size_limits limits_;
};

} // namespace mailfence::attachment
