/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder for error_info::detail. One `key=value` entry per line; third-party
values go through add_untrusted() so they cannot forge extra entries.

*/

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <mailfence/detail/log.hpp>

namespace mailfence::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        out_.append(key);
        out_ += '=';
        out_.append(value);
        out_ += '\n';
        return *this;
    }

    error_detail& add_untrusted(std::string_view key, std::string_view value)
    {
        return add(key, log::logger::sanitize_untrusted(value));
    }

    error_detail& add_path(std::string_view key, const std::filesystem::path& p)
    {
        return add(key, p.string());
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        return add(key, std::to_string(v));
    }

    /// `<value> <message>`, e.g. `ec=13 Permission denied`.
    error_detail& add_ec(std::string_view key, const std::error_code& ec)
    {
        std::string value = std::to_string(ec.value());
        if (const std::string msg = ec.message(); !msg.empty())
        {
            value += ' ';
            value += msg;
        }
        return add(key, value);
    }

    [[nodiscard]] const std::string& str() const& noexcept
    {
        return out_;
    }

    [[nodiscard]] std::string str() &&
    {
        return std::move(out_);
    }

private:
    std::string out_;
};

} // namespace mailfence::detail
