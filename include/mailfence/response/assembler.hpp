/*

assembler.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builds tool results. Anything carrying untrusted fields leaves as
[security context, sanitized JSON] under one fresh boundary; images add the
raw payload as a third part.

*/

#pragma once

#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include <mailfence/attachment/types.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/response/content.hpp>
#include <mailfence/security/boundary.hpp>
#include <mailfence/security/field_sanitizer.hpp>
#include <mailfence/security/preamble.hpp>
#include <mailfence/settings.hpp>

namespace mailfence::response
{

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

[[nodiscard]] inline std::string serialize(const security::record& data)
{
    return data.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

/// Record form of an attachment outcome; image payloads are left out.
[[nodiscard]] inline security::record attachment_record(const attachment::attachment_result& res)
{
    const auto& info = attachment::info_of(res);
    security::record data;
    data["messageId"] = info.message_id;
    data["index"] = info.index;
    data["filename"] = info.filename;
    data["mimeType"] = info.mime_type;
    data["sizeBytes"] = info.size_bytes;

    std::visit(overloaded{
        [&data](const attachment::text_attachment& t) { data["content"] = t.content; },
        [&data](const attachment::image_attachment& i) { data["savedTo"] = i.saved_path; },
        [&data](const attachment::saved_file_attachment& s)
        {
            data["savedTo"] = s.saved_path;
            data["content"] = "Binary attachment saved to: " + s.saved_path;
        }},
        res);
    return data;
}

class assembler
{
public:
    assembler(const security::boundary_generator& boundaries, size_limits limits)
        : boundaries_(boundaries), limits_(limits)
    {
    }

    /**
    Sanitize a record or a list of records under one new boundary.

    @return Two parts, security context first; `random_source_unavailable` if no boundary can be generated.
    **/
    [[nodiscard]] result<tool_result> sanitized(const security::record& data) const
    {
        auto boundary = boundaries_.generate();
        if (!boundary)
            return fail<tool_result>(std::move(boundary).error());
        return sanitized_with(data, *boundary);
    }

    /// As sanitized(), with a caller-chosen boundary.
    [[nodiscard]] tool_result sanitized_with(const security::record& data, const std::string& boundary) const
    {
        const auto clean = data.is_array()
            ? security::sanitize_messages(data, boundary, limits_)
            : security::sanitize_message(data, boundary, limits_);

        tool_result out;
        out.content.emplace_back(text_content{security::build_security_context(boundary)});
        out.content.emplace_back(text_content{serialize(clean)});
        return out;
    }

    [[nodiscard]] result<tool_result> attachment(const attachment::attachment_result& res) const
    {
        auto boundary = boundaries_.generate();
        if (!boundary)
            return fail<tool_result>(std::move(boundary).error());
        return attachment_with(res, *boundary);
    }

    /// Text and saved files follow the two-part layout; images add the inline payload as a third part.
    [[nodiscard]] tool_result attachment_with(const attachment::attachment_result& res,
        const std::string& boundary) const
    {
        tool_result out = sanitized_with(attachment_record(res), boundary);
        if (const auto* image = std::get_if<attachment::image_attachment>(&res))
            out.content.emplace_back(image_content{image->base64_data, image->info.mime_type});
        return out;
    }

    /// Data without untrusted fields: one part, no security context.
    [[nodiscard]] static tool_result plain(const security::record& data)
    {
        tool_result out;
        out.content.emplace_back(text_content{serialize(data)});
        return out;
    }

    [[nodiscard]] static tool_result error(std::string message)
    {
        tool_result out;
        out.content.emplace_back(text_content{std::move(message)});
        out.is_error = true;
        return out;
    }

private:
    const security::boundary_generator& boundaries_;
    size_limits limits_;
};

} // namespace mailfence::response
