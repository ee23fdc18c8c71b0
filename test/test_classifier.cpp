/*

test_classifier.cpp
-------------------

Validates how attachments are surfaced: inline text, inline image or saved
file.

*/

#define BOOST_TEST_MODULE classifier_test

#include <string>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <chrono>
#include <optional>
#include <variant>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailfence/attachment/classifier.hpp>
#include <mailfence/attachment/store.hpp>
#include <mailfence/codec/base64.hpp>

using namespace mailfence;
using attachment::attachment_result;
using attachment::attachment_store;
using attachment::classifier;
using attachment::image_attachment;
using attachment::saved_file_attachment;
using attachment::text_attachment;

namespace
{

std::filesystem::path make_temp_dir()
{
    auto base = std::filesystem::temp_directory_path() / "mailfence_classifier_test";
    std::filesystem::create_directories(base);
    auto dir = base / std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& p)
{
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

mime::attachment_descriptor descriptor(std::size_t index, std::string filename, std::string mime, std::uint64_t size)
{
    mime::attachment_descriptor att;
    att.index = index;
    att.filename = std::move(filename);
    att.mime_type = std::move(mime);
    att.size_bytes = size;
    return att;
}

source::fetch_bytes_fn returning(std::optional<std::string> bytes, int* calls = nullptr)
{
    return [bytes = std::move(bytes), calls]() -> result<std::optional<std::string>>
    {
        if (calls != nullptr)
            ++*calls;
        return bytes;
    };
}

struct fixture
{
    fixture() : dir(make_temp_dir()), store(dir), cls(store, size_limits{})
    {
    }

    ~fixture()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    attachment_store store;
    classifier cls;
};

} // namespace

BOOST_AUTO_TEST_CASE(select_by_index)
{
    const std::vector<mime::attachment_descriptor> atts{
        descriptor(0, "a.txt", "text/plain", 1), descriptor(1, "b.png", "image/png", 2)};

    auto second = attachment::select_attachment(atts, 1);
    BOOST_REQUIRE(second.has_value());
    BOOST_TEST(second->filename == "b.png");

    auto beyond = attachment::select_attachment(atts, 5);
    BOOST_REQUIRE(!beyond.has_value());
    BOOST_TEST(beyond.error().is(errc::index_out_of_range));
    BOOST_TEST(beyond.error().message == "Attachment index 5 out of range (0-1)");

    auto negative = attachment::select_attachment(atts, -1);
    BOOST_REQUIRE(!negative.has_value());
    BOOST_TEST(negative.error().is(errc::index_out_of_range));

    auto none = attachment::select_attachment({}, 0);
    BOOST_REQUIRE(!none.has_value());
    BOOST_TEST(none.error().message == "Attachment index 0 out of range (0--1)");
}

BOOST_AUTO_TEST_CASE(type_predicates)
{
    BOOST_TEST(attachment::is_text_type("text/plain"));
    BOOST_TEST(attachment::is_text_type("Text/CSV"));
    BOOST_TEST(!attachment::is_text_type("application/json"));
    BOOST_TEST(attachment::is_image_type("image/jpeg"));
    BOOST_TEST(attachment::is_html_type("text/html; charset=utf-8"));
    BOOST_TEST(!attachment::is_html_type("text/plain"));
}

BOOST_FIXTURE_TEST_CASE(text_is_returned_inline_without_disk_write, fixture)
{
    int calls = 0;
    auto res = cls.classify("m1", descriptor(0, "notes.txt", "text/plain", 11), returning("hello world", &calls));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(calls == 1);

    const auto* text = std::get_if<text_attachment>(&*res);
    BOOST_REQUIRE(text != nullptr);
    BOOST_TEST(text->content == "hello world");
    BOOST_TEST(text->info.message_id == "m1");
    BOOST_TEST(text->info.filename == "notes.txt");
    BOOST_TEST(text->info.size_bytes == 11u);
    BOOST_TEST(!std::filesystem::exists(dir / "m1"));
}

BOOST_FIXTURE_TEST_CASE(html_attachment_is_reduced_to_text, fixture)
{
    auto res = cls.classify("m1", descriptor(0, "page.html", "text/html", 0),
        returning("<html><body><p>Hi</p><script>x()</script></body></html>"));
    BOOST_REQUIRE(res.has_value());
    const auto* text = std::get_if<text_attachment>(&*res);
    BOOST_REQUIRE(text != nullptr);
    BOOST_TEST(text->content == "Hi");
}

BOOST_FIXTURE_TEST_CASE(long_text_is_truncated, fixture)
{
    auto res = cls.classify("m1", descriptor(0, "big.txt", "text/plain", 0), returning(std::string(100'005, 'q')));
    BOOST_REQUIRE(res.has_value());
    const auto* text = std::get_if<text_attachment>(&*res);
    BOOST_REQUIRE(text != nullptr);
    BOOST_TEST(text->content == std::string(100'000, 'q') + "\n[TRUNCATED]");
}

BOOST_FIXTURE_TEST_CASE(invalid_utf8_text_is_decoded_lossily, fixture)
{
    auto res = cls.classify("m1", descriptor(0, "x.txt", "text/plain", 0), returning(std::string("ok\xFF", 3)));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(std::get<text_attachment>(*res).content == "ok\xEF\xBF\xBD");
}

BOOST_FIXTURE_TEST_CASE(missing_text_content_is_empty, fixture)
{
    auto res = cls.classify("m1", descriptor(0, "x.txt", "text/plain", 0), returning(std::nullopt));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(std::get<text_attachment>(*res).content.empty());
}

BOOST_FIXTURE_TEST_CASE(small_image_is_inlined_and_saved, fixture)
{
    const std::string bytes("\x89PNG\x01\x02\x03", 7);
    auto res = cls.classify("m2", descriptor(1, "pic.png", "image/png", 7), returning(bytes));
    BOOST_REQUIRE(res.has_value());

    const auto* image = std::get_if<image_attachment>(&*res);
    BOOST_REQUIRE(image != nullptr);
    base64 codec;
    BOOST_TEST(image->base64_data == codec.encode_line(bytes));
    BOOST_TEST(image->saved_path == (dir / "m2" / "pic.png").string());
    BOOST_TEST(read_file(image->saved_path) == bytes);
    BOOST_TEST(image->info.index == 1u);
}

BOOST_FIXTURE_TEST_CASE(image_at_ceiling_is_inlined, fixture)
{
    const std::string bytes(10 * 1024 * 1024, '\x7f');
    auto res = cls.classify("m3", descriptor(0, "edge.jpg", "image/jpeg", 1), returning(bytes));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(std::holds_alternative<image_attachment>(*res));
}

BOOST_FIXTURE_TEST_CASE(image_over_ceiling_is_only_saved, fixture)
{
    const std::string bytes(10 * 1024 * 1024 + 1, '\x7f');
    // Declared size is deliberately small: the fetched length decides.
    auto res = cls.classify("m3", descriptor(0, "huge.jpg", "image/jpeg", 1), returning(bytes));
    BOOST_REQUIRE(res.has_value());

    const auto* saved = std::get_if<saved_file_attachment>(&*res);
    BOOST_REQUIRE(saved != nullptr);
    BOOST_TEST(saved->saved_path == (dir / "m3" / "huge.jpg").string());
    BOOST_TEST(std::filesystem::file_size(saved->saved_path) == bytes.size());
}

BOOST_FIXTURE_TEST_CASE(empty_image_is_only_saved, fixture)
{
    auto res = cls.classify("m3", descriptor(0, "empty.gif", "image/gif", 0), returning(std::nullopt));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(std::holds_alternative<saved_file_attachment>(*res));
}

BOOST_FIXTURE_TEST_CASE(binary_is_saved_with_sanitized_name, fixture)
{
    auto res = cls.classify("m4", descriptor(0, "../../evil (1).exe", "application/octet-stream", 3),
        returning(std::string("MZ\0", 3)));
    BOOST_REQUIRE(res.has_value());

    const auto* saved = std::get_if<saved_file_attachment>(&*res);
    BOOST_REQUIRE(saved != nullptr);
    BOOST_TEST(saved->saved_path == (dir / "m4" / "evil__1_.exe").string());
    BOOST_TEST(saved->info.filename == "../../evil (1).exe");
    BOOST_TEST(read_file(saved->saved_path) == std::string("MZ\0", 3));
}

BOOST_FIXTURE_TEST_CASE(fetch_failure_propagates, fixture)
{
    source::fetch_bytes_fn failing = []() -> result<std::optional<std::string>>
    {
        return fail<std::optional<std::string>>(errc::source_unavailable, "service down");
    };
    auto res = cls.classify("m5", descriptor(0, "a.pdf", "application/pdf", 1), failing);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(errc::source_unavailable));
    BOOST_TEST(!std::filesystem::exists(dir / "m5"));
}

BOOST_AUTO_TEST_CASE(inline_ceiling_is_configurable)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp);
    size_limits lim;
    lim.max_inline_image_bytes = 4;
    classifier cls(store, lim);

    auto small = cls.classify("m", descriptor(0, "a.png", "image/png", 0), returning(std::string("abcd")));
    auto large = cls.classify("m", descriptor(1, "b.png", "image/png", 0), returning(std::string("abcde")));
    BOOST_REQUIRE(small.has_value());
    BOOST_REQUIRE(large.has_value());
    BOOST_TEST(std::holds_alternative<image_attachment>(*small));
    BOOST_TEST(std::holds_alternative<saved_file_attachment>(*large));

    std::filesystem::remove_all(tmp);
}
