/*

test_materializer.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE materializer_test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailvault/archive/materializer.hpp>


using namespace std::chrono;
using mailvault::archive::folder_relative_path;
using mailvault::archive::materializer;
using mailvault::archive::message_handle;
using mailvault::archive::sanitize_component;
using mailvault::archive::sanitize_file_name;

namespace
{

const std::string PLAIN_MESSAGE =
    "From: a@example.com\r\n"
    "Subject: Hello: World / again?\r\n"
    "\r\n"
    "Body\r\n";

const std::string TWO_ATTACHMENTS =
    "From: a@example.com\r\n"
    "Subject: =?UTF-8?B?UmVwb3J0IMOcYmVyc2ljaHQ=?=\r\n"
    "MIME-Version: 1.0\r\n"
    "Content-Type: multipart/mixed; boundary=\"XYZ\"\r\n"
    "\r\n"
    "--XYZ\r\n"
    "Content-Type: text/plain\r\n"
    "\r\n"
    "see attached\r\n"
    "--XYZ\r\n"
    "Content-Type: text/plain; name=\"notes.txt\"\r\n"
    "Content-Disposition: attachment; filename=\"notes.txt\"\r\n"
    "\r\n"
    "first\r\n"
    "--XYZ\r\n"
    "Content-Type: text/plain; name=\"notes.txt\"\r\n"
    "Content-Disposition: attachment; filename=\"notes.txt\"\r\n"
    "Content-Transfer-Encoding: base64\r\n"
    "\r\n"
    "c2Vjb25k\r\n"
    "--XYZ--\r\n";

std::filesystem::path make_temp_dir()
{
    auto base = std::filesystem::temp_directory_path() / "mailvault_materializer_test";
    std::filesystem::create_directories(base);
    auto dir = base / std::to_string(steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

message_handle handle(std::uint32_t uid, sys_seconds when, std::string folder = "INBOX")
{
    message_handle out;
    out.session_id = 1;
    out.folder = std::move(folder);
    out.uid = uid;
    out.internal_date = when;
    return out;
}

const sys_seconds NOON = sys_days{2024y / March / 5} + hours{12} + minutes{30} + seconds{15};

} // namespace


BOOST_AUTO_TEST_CASE(sanitize_component_rules)
{
    BOOST_TEST(sanitize_component("Hello: World / again?", 50, "no_subject") == "Hello_World_again");
    BOOST_TEST(sanitize_component("  ..hidden..  ", 50, "x") == "hidden");
    BOOST_TEST(sanitize_component("\xC3\x9C\xC3\x9C", 50, "no_subject") == "no_subject");
    BOOST_TEST(sanitize_component("", 50, "no_subject") == "no_subject");
    BOOST_TEST(sanitize_component("a__b", 50, "x") == "a_b");
    BOOST_TEST(sanitize_component(std::string(80, 'x'), 50, "x").size() == 50u);
}

BOOST_AUTO_TEST_CASE(sanitize_file_name_keeps_extension)
{
    BOOST_TEST(sanitize_file_name("report 2024.pdf") == "report_2024.pdf");
    BOOST_TEST(sanitize_file_name("..\\..\\evil.exe") == "evil.exe");
    BOOST_TEST(sanitize_file_name(".profile") == "profile");

    const std::string long_name = std::string(150, 'a') + ".docx";
    const std::string cut = sanitize_file_name(long_name);
    BOOST_TEST(cut.size() == 100u);
    BOOST_TEST(cut.ends_with(".docx"));
}

BOOST_AUTO_TEST_CASE(folder_relative_path_stays_inside)
{
    BOOST_TEST(folder_relative_path("INBOX") == "INBOX");
    BOOST_TEST(folder_relative_path("Archive/2024") == "Archive/2024");
    BOOST_TEST(folder_relative_path("../../x") == "__/__/x");
    BOOST_TEST(folder_relative_path("/") == "_");
    BOOST_TEST(folder_relative_path("") == "_");
}

BOOST_AUTO_TEST_CASE(materializer_writes_message_without_attachments)
{
    auto tmp = make_temp_dir();
    materializer local(tmp);

    auto plan = local.plan(PLAIN_MESSAGE, handle(7, NOON));
    BOOST_REQUIRE(plan.has_value());
    BOOST_TEST(plan->attachments.empty());

    auto written = local.commit(std::move(*plan));
    BOOST_REQUIRE(written.has_value());
    BOOST_TEST(written->name() == "20240305_123015_000_Hello_World_again");
    BOOST_TEST((written->directory.parent_path() == tmp / "INBOX"));
    BOOST_TEST(!written->reused);
    BOOST_TEST(written->files().size() == 1u);
    BOOST_TEST(read_file(written->raw_file) == PLAIN_MESSAGE);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_renames_duplicate_attachments)
{
    auto tmp = make_temp_dir();
    materializer local(tmp);

    auto plan = local.plan(TWO_ATTACHMENTS, handle(8, NOON));
    BOOST_REQUIRE(plan.has_value());
    BOOST_TEST(plan->subject == "Report_bersicht");

    auto written = local.commit(std::move(*plan));
    BOOST_REQUIRE(written.has_value());
    BOOST_REQUIRE(written->attachments.size() == 2u);
    BOOST_TEST((written->attachments[0].filename() == "notes.txt"));
    BOOST_TEST((written->attachments[1].filename() == "notes_1.txt"));
    BOOST_TEST(read_file(written->attachments[0]) == "first");
    BOOST_TEST(read_file(written->attachments[1]) == "second");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_same_second_gets_next_index)
{
    auto tmp = make_temp_dir();
    materializer local(tmp);

    auto first = local.plan(PLAIN_MESSAGE, handle(1, NOON));
    auto second = local.plan(PLAIN_MESSAGE, handle(2, NOON));
    auto other_folder = local.plan(PLAIN_MESSAGE, handle(3, NOON, "Sent"));
    BOOST_REQUIRE(first.has_value());
    BOOST_REQUIRE(second.has_value());
    BOOST_REQUIRE(other_folder.has_value());
    BOOST_TEST(first->index == 0u);
    BOOST_TEST(second->index == 1u);
    BOOST_TEST(other_folder->index == 0u);

    auto a = local.commit(std::move(*first));
    auto b = local.commit(std::move(*second));
    BOOST_REQUIRE(a.has_value());
    BOOST_REQUIRE(b.has_value());
    BOOST_TEST((a->directory != b->directory));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_reuses_complete_copy)
{
    auto tmp = make_temp_dir();
    {
        materializer first_run(tmp);
        auto plan = first_run.plan(TWO_ATTACHMENTS, handle(8, NOON));
        BOOST_REQUIRE(plan.has_value());
        BOOST_REQUIRE(first_run.commit(std::move(*plan)).has_value());
    }

    materializer second_run(tmp);
    auto plan = second_run.plan(TWO_ATTACHMENTS, handle(8, NOON));
    BOOST_REQUIRE(plan.has_value());
    auto again = second_run.commit(std::move(*plan));
    BOOST_REQUIRE(again.has_value());
    BOOST_TEST(again->reused);
    BOOST_TEST(again->name().starts_with("20240305_123015_000_"));

    std::size_t dirs = 0;
    for (const auto& entry : std::filesystem::directory_iterator(tmp / "INBOX"))
    {
        (void)entry;
        ++dirs;
    }
    BOOST_TEST(dirs == 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_skips_foreign_directory)
{
    auto tmp = make_temp_dir();
    std::filesystem::create_directories(tmp / "INBOX" / "20240305_123015_000_Hello_World_again");

    materializer local(tmp);
    auto plan = local.plan(PLAIN_MESSAGE, handle(7, NOON));
    BOOST_REQUIRE(plan.has_value());
    auto written = local.commit(std::move(*plan));
    BOOST_REQUIRE(written.has_value());
    BOOST_TEST(written->name() == "20240305_123015_001_Hello_World_again");
    BOOST_TEST(!written->reused);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_same_stamp_never_shares_directory)
{
    const std::string first = "From: a@example.com\r\nSubject: Same\r\n\r\nAAAA\r\n";
    const std::string second = "From: a@example.com\r\nSubject: Same\r\n\r\nBBBB\r\n";
    auto tmp = make_temp_dir();
    std::filesystem::create_directories(tmp / "INBOX" / "20240305_123015_000_Same");

    materializer dry(tmp);
    auto d1 = dry.plan(first, handle(1, NOON));
    auto d2 = dry.plan(second, handle(2, NOON));
    BOOST_REQUIRE(d1.has_value());
    BOOST_REQUIRE(d2.has_value());
    auto v1 = dry.preview(std::move(*d1));
    auto v2 = dry.preview(std::move(*d2));
    BOOST_REQUIRE(v1.has_value());
    BOOST_REQUIRE(v2.has_value());
    BOOST_TEST((v1->directory != v2->directory));

    materializer local(tmp);
    auto p1 = local.plan(first, handle(1, NOON));
    auto p2 = local.plan(second, handle(2, NOON));
    BOOST_REQUIRE(p1.has_value());
    BOOST_REQUIRE(p2.has_value());
    auto a = local.commit(std::move(*p1));
    auto b = local.commit(std::move(*p2));
    BOOST_REQUIRE(a.has_value());
    BOOST_REQUIRE(b.has_value());

    BOOST_TEST(a->name() == "20240305_123015_001_Same");
    BOOST_TEST(b->name() == "20240305_123015_002_Same");
    BOOST_TEST(!b->reused);
    BOOST_TEST(read_file(a->raw_file) == first);
    BOOST_TEST(read_file(b->raw_file) == second);
    BOOST_TEST((v1->directory == a->directory));
    BOOST_TEST((v2->directory == b->directory));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_does_not_reuse_copy_with_other_bytes)
{
    const std::string first = "From: a@example.com\r\nSubject: Same\r\n\r\nAAAA\r\n";
    const std::string second = "From: a@example.com\r\nSubject: Same\r\n\r\nBBBB\r\n";
    auto tmp = make_temp_dir();
    {
        materializer earlier(tmp);
        auto plan = earlier.plan(first, handle(1, NOON));
        BOOST_REQUIRE(plan.has_value());
        BOOST_REQUIRE(earlier.commit(std::move(*plan)).has_value());
    }

    materializer local(tmp);
    auto plan = local.plan(second, handle(2, NOON));
    BOOST_REQUIRE(plan.has_value());
    auto written = local.commit(std::move(*plan));
    BOOST_REQUIRE(written.has_value());
    BOOST_TEST(!written->reused);
    BOOST_TEST(written->name() == "20240305_123015_001_Same");
    BOOST_TEST(read_file(written->raw_file) == second);
    BOOST_TEST(read_file(tmp / "INBOX" / "20240305_123015_000_Same" / "email.raw") == first);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_preview_matches_commit)
{
    auto tmp = make_temp_dir();

    materializer dry(tmp);
    auto p1 = dry.plan(PLAIN_MESSAGE, handle(1, NOON));
    auto p2 = dry.plan(TWO_ATTACHMENTS, handle(2, NOON));
    BOOST_REQUIRE(p1.has_value());
    BOOST_REQUIRE(p2.has_value());
    auto v1 = dry.preview(std::move(*p1));
    auto v2 = dry.preview(std::move(*p2));
    BOOST_REQUIRE(v1.has_value());
    BOOST_REQUIRE(v2.has_value());
    BOOST_TEST(!std::filesystem::exists(tmp / "INBOX"));

    materializer real(tmp);
    auto r1 = real.plan(PLAIN_MESSAGE, handle(1, NOON));
    auto r2 = real.plan(TWO_ATTACHMENTS, handle(2, NOON));
    BOOST_REQUIRE(r1.has_value());
    BOOST_REQUIRE(r2.has_value());
    auto c1 = real.commit(std::move(*r1));
    auto c2 = real.commit(std::move(*r2));
    BOOST_REQUIRE(c1.has_value());
    BOOST_REQUIRE(c2.has_value());

    BOOST_TEST((v1->directory == c1->directory));
    BOOST_TEST((v2->directory == c2->directory));
    BOOST_TEST((v2->attachments == c2->attachments));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_rejects_malformed_message)
{
    auto tmp = make_temp_dir();
    materializer local(tmp);

    auto plan = local.plan("Content-Type: multipart/mixed\r\n\r\nno boundary\r\n", handle(9, NOON));
    BOOST_REQUIRE(!plan.has_value());
    BOOST_TEST((plan.error().code == mailvault::errc::mime_parse_error));
    BOOST_TEST(plan.error().detail.find("INBOX:9") != std::string::npos);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(materializer_remove_deletes_directory)
{
    auto tmp = make_temp_dir();
    materializer local(tmp);
    auto plan = local.plan(PLAIN_MESSAGE, handle(7, NOON));
    BOOST_REQUIRE(plan.has_value());
    auto written = local.commit(std::move(*plan));
    BOOST_REQUIRE(written.has_value());

    BOOST_REQUIRE(materializer::remove(*written).has_value());
    BOOST_TEST(!std::filesystem::exists(written->directory));

    std::filesystem::remove_all(tmp);
}
