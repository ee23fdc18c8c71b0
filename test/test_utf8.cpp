/*

test_utf8.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE utf8_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mailfence/detail/utf8.hpp>

using namespace mailfence::detail;


BOOST_AUTO_TEST_CASE(length_counts_code_points)
{
    BOOST_TEST(utf8_length("") == 0u);
    BOOST_TEST(utf8_length("abc") == 3u);
    BOOST_TEST(utf8_length("caf\xC3\xA9") == 4u);
    BOOST_TEST(utf8_length("\xF0\x9F\x98\x80") == 1u);
    BOOST_TEST(utf8_length("\xFF\xFE") == 2u);
}

BOOST_AUTO_TEST_CASE(offset_of_stops_on_sequence_start)
{
    const std::string text = "\xC3\xA9\xE2\x82\xAC!";
    BOOST_TEST(utf8_offset_of(text, 0) == 0u);
    BOOST_TEST(utf8_offset_of(text, 1) == 2u);
    BOOST_TEST(utf8_offset_of(text, 2) == 5u);
    BOOST_TEST(utf8_offset_of(text, 3) == std::string::npos);
    BOOST_TEST(utf8_offset_of(text, 10) == std::string::npos);
}

BOOST_AUTO_TEST_CASE(lossy_decode_replaces_bad_bytes)
{
    BOOST_TEST(utf8_decode_lossy("ok") == "ok");
    BOOST_TEST(utf8_decode_lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // Truncated sequence, overlong form and encoded surrogate.
    BOOST_TEST(utf8_decode_lossy("\xE2\x82") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    BOOST_TEST(utf8_decode_lossy("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    BOOST_TEST(utf8_decode_lossy("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

BOOST_AUTO_TEST_CASE(for_each_visits_sequences)
{
    std::vector<std::string> seen;
    for_each_code_point("a\xC3\xA9\xFF", [&seen](std::string_view cp) { seen.emplace_back(cp); });
    BOOST_REQUIRE(seen.size() == 3u);
    BOOST_TEST(seen[0] == "a");
    BOOST_TEST(seen[1] == "\xC3\xA9");
    BOOST_TEST(seen[2] == "\xFF");
}

BOOST_AUTO_TEST_CASE(append_encodes_code_points)
{
    std::string out;
    utf8_append(out, 0x41);
    utf8_append(out, 0xE9);
    utf8_append(out, 0x20AC);
    utf8_append(out, 0x1F600);
    utf8_append(out, 0xD800);
    BOOST_TEST(out == "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80\xEF\xBF\xBD");
}
