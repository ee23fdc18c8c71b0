/*

test_result.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE result_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <system_error>

#include <mailfence/detail/error_detail.hpp>
#include <mailfence/detail/result.hpp>
#include <mailfence/throwing.hpp>

using namespace mailfence;

namespace
{

result<int> parse_positive(int v)
{
    if (v <= 0)
        return fail<int>(errc::invalid_argument, "not positive", "value=" + std::to_string(v) + "\n");
    return v;
}

result<int> doubled(int v)
{
    const int x = MAILFENCE_TRY(parse_positive(v));
    return x * 2;
}

} // namespace

BOOST_AUTO_TEST_CASE(codes_map_to_categories)
{
    BOOST_TEST((category_of(errc::ok) == error_category::none));
    BOOST_TEST((category_of(errc::missing_argument) == error_category::caller));
    BOOST_TEST((category_of(errc::index_out_of_range) == error_category::caller));
    BOOST_TEST((category_of(errc::message_not_found) == error_category::collaborator));
    BOOST_TEST((category_of(errc::codec_invalid_input) == error_category::collaborator));
    BOOST_TEST((category_of(errc::io_failed) == error_category::local));
    BOOST_TEST((category_of(errc::random_source_unavailable) == error_category::fatal));
    BOOST_TEST((category_of(errc::config_missing) == error_category::fatal));
}

BOOST_AUTO_TEST_CASE(code_names)
{
    BOOST_TEST(to_string(errc::index_out_of_range) == "index_out_of_range");
    BOOST_TEST(to_string(errc::io_failed) == "io_failed");
}

BOOST_AUTO_TEST_CASE(error_info_display)
{
    const error_info err{errc::io_failed, "cannot write attachment", "path=/tmp/x\n", {}};
    BOOST_TEST(err.to_string() == "[io_failed] cannot write attachment");
}

BOOST_AUTO_TEST_CASE(try_macro_propagates)
{
    auto good = doubled(4);
    BOOST_REQUIRE(good.has_value());
    BOOST_TEST(*good == 8);

    auto bad = doubled(-1);
    BOOST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().is(errc::invalid_argument));
    BOOST_TEST(bad.error().is_caller_error());
    BOOST_TEST(bad.error().detail == "value=-1\n");
    BOOST_TEST(bad.error().to_string().find("not positive") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(error_detail_lines)
{
    detail::error_detail d;
    d.add("path", "/tmp/x").add_int("size", 42).add_untrusted("name", "a\nb");
    BOOST_TEST(d.str() == "path=/tmp/x\nsize=42\nname=a.b\n");
}

BOOST_AUTO_TEST_CASE(error_detail_error_code)
{
    detail::error_detail d;
    d.add_ec("ec", std::make_error_code(std::errc::permission_denied));
    const std::string s = d.str();
    BOOST_TEST(s.rfind("ec=" + std::to_string(static_cast<int>(std::errc::permission_denied)), 0) == 0u);
    BOOST_TEST(s.back() == '\n');
}

BOOST_AUTO_TEST_CASE(unwrap_throws_with_info)
{
    BOOST_TEST(unwrap(parse_positive(3)) == 3);

    try
    {
        static_cast<void>(unwrap(parse_positive(0)));
        BOOST_FAIL("expected exception");
    }
    catch (const mailfence::exception& exc)
    {
        BOOST_TEST(std::string(exc.what()) == "not positive");
        BOOST_TEST(exc.info().is(errc::invalid_argument));
    }
}
