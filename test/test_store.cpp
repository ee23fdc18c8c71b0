/*

test_store.cpp
--------------

Validates saving attachments under the per-message directory.

*/

#define BOOST_TEST_MODULE store_test

#include <string>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <chrono>
#include <boost/test/unit_test.hpp>
#include <mailfence/attachment/store.hpp>

using mailfence::attachment::attachment_store;
using mailfence::attachment::is_safe_message_id;

static std::filesystem::path make_temp_dir()
{
    auto base = std::filesystem::temp_directory_path() / "mailfence_store_test";
    std::filesystem::create_directories(base);
    auto dir = base / std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);
    return dir;
}

static std::string read_file(const std::filesystem::path& p)
{
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_CASE(message_id_validation)
{
    BOOST_TEST(is_safe_message_id("18c2f0a9b3d4e5f6"));
    BOOST_TEST(!is_safe_message_id(""));
    BOOST_TEST(!is_safe_message_id("../etc"));
    BOOST_TEST(!is_safe_message_id("a/b"));
    BOOST_TEST(!is_safe_message_id("a\\b"));
    BOOST_TEST(!is_safe_message_id("a..b"));
}

BOOST_AUTO_TEST_CASE(save_writes_under_message_dir)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp / "attachments");

    const std::string bytes("\x89PNG\r\n\x1a\n\0\x01", 10);
    auto saved = store.save("msg-001", "photo.png", bytes);
    BOOST_REQUIRE(saved.has_value());
    BOOST_TEST(*saved == tmp / "attachments" / "msg-001" / "photo.png");
    BOOST_TEST(read_file(*saved) == bytes);

    std::filesystem::remove_all(tmp);
}

#ifndef _WIN32
BOOST_AUTO_TEST_CASE(save_restricts_base_dir_to_owner)
{
    namespace fs = std::filesystem;
    auto tmp = make_temp_dir();
    const auto base = tmp / "attachments";
    fs::create_directories(base);
    fs::permissions(base, fs::perms::all, fs::perm_options::replace);

    attachment_store store(base);
    BOOST_REQUIRE(store.save("msg-001", "a.bin", "x").has_value());

    const auto perms = fs::status(base).permissions();
    BOOST_TEST(((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none));
    BOOST_TEST(((perms & fs::perms::owner_all) == fs::perms::owner_all));

    fs::remove_all(tmp);
}
#endif

BOOST_AUTO_TEST_CASE(save_sanitizes_filename)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp);

    auto saved = store.save("m1", "../../../etc/passwd", "x");
    BOOST_REQUIRE(saved.has_value());
    BOOST_TEST(*saved == tmp / "m1" / "passwd");

    auto fallback = store.save("m1", "...", "y");
    BOOST_REQUIRE(fallback.has_value());
    BOOST_TEST(fallback->filename() == "attachment");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(save_overwrites_previous_copy)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp);

    BOOST_REQUIRE(store.save("m", "a.bin", "first version").has_value());
    auto saved = store.save("m", "a.bin", "second");
    BOOST_REQUIRE(saved.has_value());
    BOOST_TEST(read_file(*saved) == "second");

    std::size_t files = 0;
    for (const auto& de : std::filesystem::directory_iterator(tmp / "m"))
    {
        static_cast<void>(de);
        ++files;
    }
    BOOST_TEST(files == 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(save_rejects_unsafe_message_id)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp);

    auto saved = store.save("../outside", "a.txt", "x");
    BOOST_REQUIRE(!saved.has_value());
    BOOST_TEST(saved.error().is(mailfence::errc::invalid_argument));
    BOOST_TEST(!std::filesystem::exists(tmp.parent_path() / "outside"));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(save_reports_io_failure)
{
    auto tmp = make_temp_dir();
    // A regular file where the base directory should be.
    std::ofstream(tmp / "blocker") << "x";
    attachment_store store(tmp / "blocker");

    auto saved = store.save("m", "a.txt", "x");
    BOOST_REQUIRE(!saved.has_value());
    BOOST_TEST(saved.error().is(mailfence::errc::io_failed));
    BOOST_TEST(!saved.error().detail.empty());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(path_for_does_not_touch_disk)
{
    auto tmp = make_temp_dir();
    attachment_store store(tmp / "never");
    BOOST_TEST(store.path_for("m", "a b.txt") == tmp / "never" / "m" / "a_b.txt");
    BOOST_TEST(!std::filesystem::exists(tmp / "never"));
    std::filesystem::remove_all(tmp);
}
