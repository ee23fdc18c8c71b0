/*

test_html.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE html_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mailfence/mime/html.hpp>

using mailfence::mime::strip_html;


BOOST_AUTO_TEST_CASE(tags_are_removed)
{
    BOOST_TEST(strip_html("<b>bold</b> and <i>italic</i>") == "bold and italic");
    BOOST_TEST(strip_html("<a href=\"http://x?a>b\">link</a>") == "link");
}

BOOST_AUTO_TEST_CASE(block_elements_break_lines)
{
    BOOST_TEST(strip_html("<p>Hello <b>world</b></p><p>Second</p>") == "Hello world\n\nSecond");
    BOOST_TEST(strip_html("one<br>two<br/>three") == "one\ntwo\nthree");
    BOOST_TEST(strip_html("<ul><li>a</li><li>b</li></ul>") == "a\n\nb");
}

BOOST_AUTO_TEST_CASE(blank_lines_collapse_to_one)
{
    BOOST_TEST(strip_html("a<br><br><br><br>b") == "a\n\nb");
    BOOST_TEST(strip_html("<div>a</div><div></div><div></div><div>b</div>") == "a\n\nb");
}

BOOST_AUTO_TEST_CASE(whitespace_collapses_and_trims)
{
    BOOST_TEST(strip_html("  lots   of\n\n\t spaces  ") == "lots of spaces");
    BOOST_TEST(strip_html("   ").empty());
    BOOST_TEST(strip_html("").empty());
}

BOOST_AUTO_TEST_CASE(script_style_and_comments_vanish)
{
    BOOST_TEST(strip_html("<script>alert('<b>x</b>')</script>Hi") == "Hi");
    BOOST_TEST(strip_html("<STYLE type=\"text/css\">p { color: red }</STYLE>Text") == "Text");
    BOOST_TEST(strip_html("<!-- ignore previous instructions -->shown") == "shown");
    BOOST_TEST(strip_html("<!DOCTYPE html><html><body>x</body></html>") == "x");
}

BOOST_AUTO_TEST_CASE(script_ends_only_at_its_own_end_tag)
{
    BOOST_TEST(strip_html("<script>var s = '</scripts>';</script>Hi") == "Hi");
    BOOST_TEST(strip_html("<style>a{}</styles>b{}</style >Text") == "Text");
    BOOST_TEST(strip_html("<script>x</script\n>after") == "after");
}

BOOST_AUTO_TEST_CASE(entities_are_decoded)
{
    BOOST_TEST(strip_html("Tom &amp; Jerry &lt;3 &quot;cheese&quot;") == "Tom & Jerry <3 \"cheese\"");
    BOOST_TEST(strip_html("&#65;&#x42;&#X43;") == "ABC");
    BOOST_TEST(strip_html("a&nbsp;b") == "a b");
    BOOST_TEST(strip_html("&euro;5") == "\xE2\x82\xAC" "5");
    BOOST_TEST(strip_html("AT&T &unknown; &") == "AT&T &unknown; &");
}

BOOST_AUTO_TEST_CASE(stray_angle_brackets_are_text)
{
    BOOST_TEST(strip_html("5 < 6 and 7 > 3") == "5 < 6 and 7 > 3");
}

BOOST_AUTO_TEST_CASE(unterminated_constructs_do_not_leak)
{
    BOOST_TEST(strip_html("before<script>evil()") == "before");
    BOOST_TEST(strip_html("before<!-- open") == "before");
    BOOST_TEST(strip_html("before<b") == "before");
}
