/*

settings.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <mailfence/detail/ascii.hpp>
#include <mailfence/detail/log.hpp>
#include <mailfence/detail/result.hpp>

namespace mailfence
{

/**
Size limits shared with consumers of the tool responses. Changing any of these breaks
interoperability with agents tuned to the current thresholds.
**/
struct size_limits
{
    /// Message body, in code points, before wrapping
    std::size_t max_body_chars = 50'000;

    /// Decoded text attachment, in code points
    std::size_t max_attachment_chars = 100'000;

    /// Largest image (actual fetched bytes) returned inline
    std::uint64_t max_inline_image_bytes = 10ull * 1024 * 1024;

    /// Sanitized filename length
    std::size_t max_filename_chars = 200;
};

/// Process-level configuration, resolved once at startup and passed explicitly into every pipeline entry point.
struct settings
{
    /// Root for credentials and saved data (~/.gmail-mcp)
    std::filesystem::path config_dir;

    /// Saved attachments land in <attachments_dir>/<messageId>/<filename>
    std::filesystem::path attachments_dir;

    /// maxResults used when the caller gives none or an unparsable one
    int default_max_results = 10;

    /// Upper clamp for maxResults
    int max_results_limit = 100;

    size_limits limits;

    /// Settings rooted at an explicit home directory
    static settings for_home(const std::filesystem::path& home)
    {
        settings cfg;
        cfg.config_dir = home / ".gmail-mcp";
        cfg.attachments_dir = cfg.config_dir / "attachments";
        return cfg;
    }

    /**
    Resolve settings from the process environment. Honours MAILFENCE_ATTACHMENTS_DIR and
    MAILFENCE_LOG_LEVEL. A missing home directory is fatal for startup.
    **/
    static result<settings> from_environment()
    {
        const char* home = std::getenv("HOME");
#ifdef _WIN32
        if (home == nullptr || detail::is_blank(home))
            home = std::getenv("USERPROFILE");
#endif
        if (home == nullptr || detail::is_blank(home))
            return fail<settings>(errc::config_missing, "home directory is not set");

        settings cfg = for_home(home);

        if (const char* dir = std::getenv("MAILFENCE_ATTACHMENTS_DIR"); dir != nullptr && !detail::is_blank(dir))
            cfg.attachments_dir = dir;

        if (const char* lvl = std::getenv("MAILFENCE_LOG_LEVEL"); lvl != nullptr)
        {
            if (auto parsed = log::level_from_string(lvl))
                log::logger::instance().set_level(*parsed);
            else
                MAILFENCE_WARN(std::string("ignoring unknown MAILFENCE_LOG_LEVEL: ") + log::logger::sanitize_untrusted(lvl));
        }

        return cfg;
    }
};

} // namespace mailfence
