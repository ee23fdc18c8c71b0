/*

store.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Persists fetched attachments as <base>/<messageId>/<sanitized filename>.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <mailfence/detail/error_detail.hpp>
#include <mailfence/detail/log.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/security/filename.hpp>

namespace mailfence::attachment
{

/// Message ids become directory names, so separators and dot-dot sequences are refused.
[[nodiscard]] inline bool is_safe_message_id(std::string_view id) noexcept
{
    return !id.empty() && id.find('/') == std::string_view::npos && id.find('\\') == std::string_view::npos
        && id.find("..") == std::string_view::npos;
}

class attachment_store
{
public:
    explicit attachment_store(std::filesystem::path base_dir, std::size_t max_filename_chars = security::MAX_FILENAME_CHARS)
        : base_dir_(std::move(base_dir)), max_filename_chars_(max_filename_chars)
    {
    }

    [[nodiscard]] const std::filesystem::path& base_dir() const noexcept
    {
        return base_dir_;
    }

    /// Final location for an attachment, without touching the filesystem.
    [[nodiscard]] std::filesystem::path path_for(std::string_view message_id, std::string_view raw_filename) const
    {
        return base_dir_ / std::string(message_id) / security::sanitize_filename(raw_filename, max_filename_chars_);
    }

    /**
    Write the bytes, replacing any earlier copy. Data goes to a temporary sibling first and is renamed into place,
    so a failed write never leaves a truncated file at the returned path.

    @return Saved path, `invalid_argument` for an unusable message id or `io_failed`.
    **/
    [[nodiscard]] result<std::filesystem::path> save(std::string_view message_id, std::string_view raw_filename,
        std::string_view bytes) const
    {
        if (!is_safe_message_id(message_id))
            return fail<std::filesystem::path>(errc::invalid_argument, "Invalid messageId");

        const auto target = path_for(message_id, raw_filename);
        const auto dir = target.parent_path();

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return fail<std::filesystem::path>(errc::io_failed, "cannot create attachment directory",
                detail::error_detail().add_path("path", dir).add_ec("ec", ec).str());

        restrict_permissions();

        const auto tmp = dir / ("." + target.filename().string() + "." + unique_suffix() + ".tmp");
        {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (ofs)
                ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (ofs)
                ofs.flush();
            if (!ofs)
            {
                ofs.close();
                std::filesystem::remove(tmp, ec);
                return fail<std::filesystem::path>(errc::io_failed, "cannot write attachment",
                    detail::error_detail().add_path("path", tmp).str());
            }
        }

        std::filesystem::rename(tmp, target, ec);
        if (ec)
        {
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            return fail<std::filesystem::path>(errc::io_failed, "cannot move attachment into place",
                detail::error_detail().add_path("path", target).add_ec("ec", ec).str());
        }

        MAILFENCE_DEBUG("saved attachment (" + std::to_string(bytes.size()) + " bytes) to " + target.string());
        return target;
    }

private:
    /// Owner-only access on the base directory; silently skipped where POSIX permissions do not apply.
    void restrict_permissions() const
    {
        std::error_code ec;
        std::filesystem::permissions(base_dir_, std::filesystem::perms::owner_all,
            std::filesystem::perm_options::replace, ec);
        if (ec)
            MAILFENCE_DEBUG("could not restrict permissions on " + base_dir_.string() + ": " + ec.message());
    }

    static std::string unique_suffix()
    {
        static std::atomic<std::uint64_t> counter{0};
        auto now = std::chrono::steady_clock::now().time_since_epoch();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
        return std::to_string(ns) + "." + std::to_string(++counter);
    }

    std::filesystem::path base_dir_;
    std::size_t max_filename_chars_;
};

} // namespace mailfence::attachment
