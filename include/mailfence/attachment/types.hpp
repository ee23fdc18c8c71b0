/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace mailfence::attachment
{

/// Fields common to every classification outcome.
struct attachment_info
{
    std::string message_id;
    std::size_t index = 0;
    std::string filename;
    std::string mime_type;

    /// Size declared by the mail service, not the fetched length.
    std::uint64_t size_bytes = 0;
};

/// Decoded text, returned inline; nothing is written to disk.
struct text_attachment
{
    attachment_info info;
    std::string content;
};

/// Image small enough to inline; also saved to disk.
struct image_attachment
{
    attachment_info info;
    std::string base64_data;
    std::string saved_path;
};

/// Any other content; only the saved location is returned.
struct saved_file_attachment
{
    attachment_info info;
    std::string saved_path;
};

using attachment_result = std::variant<text_attachment, image_attachment, saved_file_attachment>;

[[nodiscard]] inline const attachment_info& info_of(const attachment_result& res) noexcept
{
    return std::visit([](const auto& r) -> const attachment_info& { return r.info; }, res);
}

} // namespace mailfence::attachment
