/*

throwing.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Exception bridge for startup code. Tool handlers never throw; a process that
cannot resolve its settings or reach the random source should stop, and
unwrap() is the short way to do it.

Define MAILFENCE_NO_EXCEPTIONS to make any inclusion of this header an error.

*/

#pragma once

#if defined(MAILFENCE_NO_EXCEPTIONS)
#error "MAILFENCE_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

#include <stdexcept>
#include <string>
#include <utility>

#include <mailfence/detail/result.hpp>

namespace mailfence
{

/// Carries the original error_info; what() is its one-line rendering.
class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(info.message.empty() ? std::string(to_string(info.code)) : info.message),
          info_(std::move(info))
    {
    }

    [[nodiscard]] const error_info& info() const noexcept { return info_; }

    [[nodiscard]] errc code() const noexcept { return info_.code; }

    [[nodiscard]] bool is_fatal() const noexcept { return info_.category() == error_category::fatal; }

private:
    error_info info_;
};

template<class T>
[[nodiscard]] T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r).error());
    return std::move(*r);
}

inline void unwrap(result_void&& r)
{
    if (!r)
        throw exception(std::move(r).error());
}

} // namespace mailfence
