/*

boundary.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-response content boundaries. The random suffix comes from the OpenSSL
CSPRNG so a sender cannot predict, and pre-embed, the token that will
delimit their content.

*/

#pragma once

#include <array>
#include <climits>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <mailfence/detail/result.hpp>

namespace mailfence::security
{

inline constexpr std::string_view BOUNDARY_PREFIX = "----UNTRUSTED_CONTENT_";

/// Random bytes behind the hex suffix (16 hex characters).
inline constexpr std::size_t BOUNDARY_RANDOM_BYTES = 8;

inline constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

/// Fills the span with cryptographically secure random bytes.
using random_source = std::function<result_void(std::span<unsigned char>)>;

[[nodiscard]] inline random_source openssl_random_source()
{
    return [](std::span<unsigned char> out) -> result_void
    {
        if (out.size() > static_cast<std::size_t>(INT_MAX))
            return fail(errc::internal, "random request too large");
        if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1)
        {
            char buffer[256]{};
            ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
            return fail(errc::random_source_unavailable,
                "secure random source unavailable", std::string("openssl=") + buffer + "\n");
        }
        return ok();
    };
}

class boundary_generator
{
public:
    explicit boundary_generator(random_source source = openssl_random_source())
        : source_(std::move(source))
    {
    }

    /**
    Produce a fresh boundary: the fixed prefix followed by 16 lowercase hex digits.

    @return `random_source_unavailable` when the random source fails; the caller must treat it as fatal.
    **/
    [[nodiscard]] result<std::string> generate() const
    {
        if (!source_)
            return fail<std::string>(errc::random_source_unavailable, "no random source configured");

        std::array<unsigned char, BOUNDARY_RANDOM_BYTES> bytes{};
        auto filled = source_(bytes);
        if (!filled)
            return fail<std::string>(std::move(filled).error());

        std::string boundary(BOUNDARY_PREFIX);
        boundary.reserve(BOUNDARY_PREFIX.size() + 2 * BOUNDARY_RANDOM_BYTES);
        for (unsigned char b : bytes)
        {
            boundary += HEX_DIGITS[b >> 4];
            boundary += HEX_DIGITS[b & 0x0f];
        }
        return boundary;
    }

private:
    random_source source_;
};

} // namespace mailfence::security
