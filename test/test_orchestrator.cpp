/*

test_orchestrator.cpp
---------------------

Runs the archive state machine against in-memory mail and share fakes.


Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#define BOOST_TEST_MODULE orchestrator_test

#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailvault/archive/orchestrator.hpp>

using namespace std::chrono;
using mailvault::errc;
using mailvault::error_info;
using mailvault::fail;
using mailvault::result;
using mailvault::result_void;
using namespace mailvault::archive;

namespace
{

struct fake_message
{
    std::uint32_t uid = 0;
    sys_seconds date{};
    std::string raw;
};

/// Server side state shared by every session of a fake_transport.
struct fake_mailbox
{
    std::map<std::string, std::vector<fake_message>> folders;
    std::map<std::string, errc> list_errors;
    std::map<std::uint32_t, std::deque<errc>> fetch_errors;
    std::optional<errc> connect_error;
    std::optional<errc> delete_error;
    std::optional<errc> reopen_error;

    unsigned int connects = 0;
    unsigned int reopens = 0;
    unsigned int closes = 0;
    unsigned int fetches = 0;
    std::vector<std::uint32_t> deleted;
};

class fake_session final : public mail_session
{
public:
    explicit fake_session(fake_mailbox& box) : box_(box) {}

    session_info info() const override
    {
        return session_info{3, true};
    }

    result<std::vector<folder_summary>> list_folders() override
    {
        std::vector<folder_summary> out;
        for (const auto& [name, messages] : box_.folders)
            out.push_back(folder_summary{name, '/', static_cast<std::uint32_t>(messages.size()), 0u});
        return out;
    }

    result<std::vector<message_handle>> list_messages(std::string_view folder, std::optional<sys_seconds> before) override
    {
        if (auto it = box_.list_errors.find(std::string(folder)); it != box_.list_errors.end())
            return fail<std::vector<message_handle>>(it->second, "Cannot select folder.");
        auto it = box_.folders.find(std::string(folder));
        if (it == box_.folders.end())
            return fail<std::vector<message_handle>>(errc::imap_tagged_no, "No such folder.");

        std::vector<message_handle> out;
        std::uint32_t seq = 0;
        for (const auto& msg : it->second)
        {
            ++seq;
            // Day granularity on the server: hand out a superset like SEARCH BEFORE would.
            if (before && msg.date >= floor<days>(*before) + days{2})
                continue;
            message_handle handle;
            handle.session_id = 42;
            handle.folder = std::string(folder);
            handle.uid = msg.uid;
            handle.seq = seq;
            handle.internal_date = msg.date;
            handle.size = msg.raw.size();
            out.push_back(handle);
        }
        return out;
    }

    result<std::string> fetch_raw(const message_handle& handle) override
    {
        ++box_.fetches;
        auto& pending = box_.fetch_errors[handle.uid];
        if (!pending.empty())
        {
            const errc code = pending.front();
            pending.pop_front();
            return fail<std::string>(code, "Fetch failed.");
        }
        for (const auto& msg : box_.folders[handle.folder])
        {
            if (msg.uid == handle.uid)
                return msg.raw;
        }
        return fail<std::string>(errc::imap_parse_error, "FETCH returned no message body.");
    }

    result<std::size_t> delete_messages(std::string_view folder, std::span<const message_handle> handles) override
    {
        if (box_.delete_error)
            return fail<std::size_t>(*box_.delete_error, "Delete failed.");
        auto& messages = box_.folders[std::string(folder)];
        std::size_t removed = 0;
        for (const auto& handle : handles)
        {
            auto it = std::find_if(messages.begin(), messages.end(),
                [&](const fake_message& msg) { return msg.uid == handle.uid; });
            if (it == messages.end())
                continue;
            box_.deleted.push_back(handle.uid);
            messages.erase(it);
            ++removed;
        }
        return removed;
    }

    result_void reopen() override
    {
        ++box_.reopens;
        if (box_.reopen_error)
            return fail<void>(*box_.reopen_error, "Reconnect failed.");
        return mailvault::ok();
    }

    result_void close() override
    {
        ++box_.closes;
        return mailvault::ok();
    }

private:
    fake_mailbox& box_;
};

class fake_transport final : public mail_transport
{
public:
    explicit fake_transport(fake_mailbox& box) : box_(box) {}

    result<std::unique_ptr<mail_session>> connect(const connection_profile&) override
    {
        ++box_.connects;
        if (box_.connect_error)
            return fail<std::unique_ptr<mail_session>>(*box_.connect_error, "Connect failed.");
        return std::unique_ptr<mail_session>(std::make_unique<fake_session>(box_));
    }

private:
    fake_mailbox& box_;
};

/// Share contents keyed by path.
struct fake_share_state
{
    std::map<std::string, std::string> files;
    std::set<std::string> dirs;
    std::string fail_on;
    errc fail_code = errc::storage_io_failed;
    unsigned int attempts = 0;
    unsigned int writes = 0;
    unsigned int closes = 0;
};

class fake_share_session final : public storage_session
{
public:
    explicit fake_share_session(fake_share_state& state) : state_(state) {}

    result<bool> exists(std::string_view path) override
    {
        const std::string key(path);
        return state_.files.count(key) != 0 || state_.dirs.count(key) != 0;
    }

    result_void ensure_dir(std::string_view path) override
    {
        state_.dirs.insert(std::string(path));
        return mailvault::ok();
    }

    result<write_result> write_file(std::string_view path, std::string_view bytes, bool overwrite) override
    {
        const std::string key(path);
        ++state_.attempts;
        if (!state_.fail_on.empty() && key.find(state_.fail_on) != std::string::npos)
            return fail<write_result>(state_.fail_code, "Share write failed.");
        if (!overwrite && state_.files.count(key) != 0)
            return write_result::skipped;
        ++state_.writes;
        state_.files[key] = std::string(bytes);
        return write_result::written;
    }

    result_void close() override
    {
        ++state_.closes;
        return mailvault::ok();
    }

private:
    fake_share_state& state_;
};

class fake_storage final : public remote_storage
{
public:
    explicit fake_storage(fake_share_state& state) : state_(state) {}

    result<std::unique_ptr<storage_session>> connect(const nas_profile&) override
    {
        return std::unique_ptr<storage_session>(std::make_unique<fake_share_session>(state_));
    }

private:
    fake_share_state& state_;
};

std::string plain(const std::string& subject)
{
    return "From: a@example.com\r\nSubject: " + subject + "\r\n\r\nbody of " + subject + "\r\n";
}

const std::string WITH_PDF =
    "From: a@example.com\r\n"
    "Subject: Invoice\r\n"
    "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
    "\r\n"
    "--b1\r\n"
    "Content-Type: text/plain\r\n"
    "\r\n"
    "see attachment\r\n"
    "--b1\r\n"
    "Content-Type: application/pdf; name=\"report.pdf\"\r\n"
    "Content-Disposition: attachment; filename=\"report.pdf\"\r\n"
    "Content-Transfer-Encoding: base64\r\n"
    "\r\n"
    "JVBERi0xLjQK\r\n"
    "--b1--\r\n";

const std::string MALFORMED = "Subject: broken\r\nContent-Type: multipart/mixed\r\n\r\nno boundary\r\n";

sys_seconds on(year_month_day ymd)
{
    return sys_days{ymd} + hours{9};
}

const sys_seconds NOW = sys_days{2024y / July / 1};

std::filesystem::path make_temp_dir()
{
    auto base = std::filesystem::temp_directory_path() / "mailvault_orchestrator_test";
    std::filesystem::create_directories(base);
    auto dir = base / std::to_string(steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);
    return dir;
}

connection_profile account()
{
    connection_profile profile;
    profile.provider = "test";
    profile.host = "imap.example.com";
    profile.email = "alice@example.com";
    profile.password = "secret";
    return profile;
}

nas_profile share_profile()
{
    nas_profile profile;
    profile.mount = "/unused";
    return profile;
}

const nas_profile SHARE_PROFILE = share_profile();

fake_mailbox two_messages()
{
    fake_mailbox box;
    box.folders["INBOX"] = {
        fake_message{1, on(2023y / January / 1), plain("First")},
        fake_message{2, on(2023y / June / 1), WITH_PDF}};
    return box;
}

run_options base_options(const std::filesystem::path& out)
{
    run_options opts;
    opts.output_dir = out;
    opts.folders = {"INBOX"};
    return opts;
}

std::size_t count_entries(const std::filesystem::path& dir)
{
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec))
        return 0;
    std::size_t n = 0;
    for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it)
        ++n;
    return n;
}

} // namespace


BOOST_AUTO_TEST_CASE(download_writes_messages_and_attachments)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    const auto outcome = engine.run(account(), nullptr, base_options(tmp));

    BOOST_CHECK(outcome.ok());
    BOOST_CHECK_EQUAL(outcome.listed, 2u);
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);
    BOOST_CHECK_EQUAL(outcome.attachments, 1u);
    BOOST_CHECK_EQUAL(outcome.deleted_remote, 0u);
    BOOST_REQUIRE_EQUAL(outcome.downloaded_ids.size(), 2u);
    BOOST_CHECK_EQUAL(outcome.downloaded_ids[0], "INBOX:1");
    BOOST_REQUIRE_EQUAL(outcome.folders.size(), 1u);
    BOOST_CHECK(outcome.folders[0].state == run_state::done);
    BOOST_CHECK_EQUAL(count_entries(tmp / "INBOX"), 2u);
    BOOST_CHECK(std::filesystem::exists(tmp / "INBOX" / "20230601_090000_000_Invoice" / "report.pdf"));
    BOOST_CHECK_EQUAL(box.closes, 1u);
    BOOST_CHECK(box.deleted.empty());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(preview_reports_what_a_real_run_does)
{
    auto tmp = make_temp_dir();
    auto since = parse_retention("1Y");
    BOOST_REQUIRE(since.has_value());

    run_options opts = base_options(tmp);
    opts.mirror = true;
    opts.clean = true;
    opts.since = *since;
    opts.deletion_confirmed = true;

    fake_mailbox preview_box = two_messages();
    preview_box.folders["INBOX"].push_back(fake_message{3, on(2024y / June / 1), plain("Recent")});
    fake_mailbox real_box = preview_box;

    fake_share_state preview_share;
    fake_transport preview_mail(preview_box);
    fake_storage preview_storage(preview_share);
    orchestrator preview_engine(preview_mail, &preview_storage, [] { return NOW; });

    run_options dry = opts;
    dry.preview = true;
    dry.deletion_confirmed = false;
    const auto previewed = preview_engine.run(account(), &SHARE_PROFILE, dry);

    BOOST_CHECK(previewed.ok());
    BOOST_CHECK(previewed.preview);
    BOOST_CHECK(!std::filesystem::exists(tmp / "INBOX"));
    BOOST_CHECK(preview_share.files.empty());
    BOOST_CHECK(preview_share.dirs.empty());
    BOOST_CHECK(preview_box.deleted.empty());
    BOOST_CHECK_EQUAL(preview_box.folders["INBOX"].size(), 3u);

    fake_share_state real_share;
    fake_transport real_mail(real_box);
    fake_storage real_storage(real_share);
    orchestrator real_engine(real_mail, &real_storage, [] { return NOW; });
    const auto real = real_engine.run(account(), &SHARE_PROFILE, opts);

    BOOST_CHECK(real.ok());
    BOOST_CHECK(real.downloaded_ids == previewed.downloaded_ids);
    BOOST_CHECK(real.mirrored_ids == previewed.mirrored_ids);
    BOOST_CHECK(real.deleted_remote_ids == previewed.deleted_remote_ids);
    BOOST_CHECK_EQUAL(real.uploaded, previewed.uploaded);
    BOOST_CHECK_EQUAL(real.deleted_remote, previewed.deleted_remote);

    BOOST_CHECK_EQUAL(real.uploaded, 4u);
    BOOST_REQUIRE_EQUAL(real.deleted_remote_ids.size(), 2u);
    BOOST_CHECK_EQUAL(real.deleted_remote_ids[0], "INBOX:1");
    BOOST_CHECK_EQUAL(real.deleted_remote_ids[1], "INBOX:2");
    BOOST_CHECK(real_share.files.count("alice/INBOX/20230601_090000_000_Invoice/report.pdf") == 1u);
    BOOST_CHECK_EQUAL(real_share.files["alice/INBOX/20230601_090000_000_Invoice/report.pdf"], "%PDF-1.4\n");
    BOOST_CHECK_EQUAL(real_box.folders["INBOX"].size(), 1u);
    BOOST_CHECK_EQUAL(real_share.closes, 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(second_mirror_skips_existing_files)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    fake_share_state share;
    fake_transport mail(box);
    fake_storage storage(share);
    orchestrator engine(mail, &storage, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.mirror = true;

    const auto first = engine.run(account(), &SHARE_PROFILE, opts);
    BOOST_CHECK(first.ok());
    BOOST_CHECK_EQUAL(first.uploaded, 3u);
    BOOST_CHECK_EQUAL(first.skipped_existing, 0u);

    const auto second = engine.run(account(), &SHARE_PROFILE, opts);
    BOOST_CHECK(second.ok());
    BOOST_CHECK_EQUAL(second.uploaded, 0u);
    BOOST_CHECK_EQUAL(second.skipped_existing, 3u);
    BOOST_CHECK_EQUAL(share.writes, 3u);
    BOOST_CHECK_EQUAL(count_entries(tmp / "INBOX"), 2u);

    opts.overwrite = true;
    const auto forced = engine.run(account(), &SHARE_PROFILE, opts);
    BOOST_CHECK_EQUAL(forced.uploaded, 3u);
    BOOST_CHECK_EQUAL(share.writes, 6u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(local_copy_kept_when_upload_fails)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    fake_share_state share;
    share.fail_on = "report.pdf";
    fake_transport mail(box);
    fake_storage storage(share);
    orchestrator engine(mail, &storage, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.mirror = true;
    opts.delete_local = true;
    opts.clean = true;
    opts.clean_all = true;
    opts.deletion_confirmed = true;

    const auto outcome = engine.run(account(), &SHARE_PROFILE, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_CHECK(!outcome.fatal.has_value());
    BOOST_CHECK_EQUAL(outcome.failed, 1u);
    BOOST_REQUIRE_EQUAL(outcome.errors.size(), 1u);
    BOOST_CHECK(outcome.errors[0].kind == failure_kind::write);
    BOOST_CHECK_EQUAL(outcome.errors[0].item, "INBOX:2");

    BOOST_REQUIRE_EQUAL(outcome.deleted_local_ids.size(), 1u);
    BOOST_CHECK_EQUAL(outcome.deleted_local_ids[0], "INBOX:1");
    BOOST_CHECK(!std::filesystem::exists(tmp / "INBOX" / "20230101_090000_000_First"));
    BOOST_CHECK(std::filesystem::exists(tmp / "INBOX" / "20230601_090000_000_Invoice" / "email.raw"));

    BOOST_REQUIRE_EQUAL(box.deleted.size(), 1u);
    BOOST_CHECK_EQUAL(box.deleted[0], 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(unreachable_share_stops_run)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.folders["Sent"] = {fake_message{9, on(2023y / March / 3), plain("Sent one")}};
    fake_share_state share;
    share.fail_on = "email.raw";
    share.fail_code = errc::storage_connect_failed;
    fake_transport mail(box);
    fake_storage storage(share);
    orchestrator engine(mail, &storage, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.folders = {"INBOX", "Sent"};
    opts.mirror = true;
    opts.delete_local = true;
    opts.clean = true;
    opts.clean_all = true;
    opts.deletion_confirmed = true;
    const auto outcome = engine.run(account(), &SHARE_PROFILE, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(outcome.fatal->code == errc::storage_connect_failed);
    BOOST_CHECK_EQUAL(share.attempts, 1u);
    BOOST_CHECK_EQUAL(share.writes, 0u);
    BOOST_REQUIRE_EQUAL(outcome.folders.size(), 1u);
    BOOST_CHECK(outcome.folders[0].state == run_state::failed);
    BOOST_CHECK(outcome.mirrored_ids.empty());
    BOOST_CHECK(outcome.deleted_local_ids.empty());
    BOOST_CHECK(box.deleted.empty());
    BOOST_CHECK_EQUAL(count_entries(tmp / "INBOX"), 2u);
    BOOST_CHECK_EQUAL(share.closes, 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(clean_only_applies_exact_retention_cutoff)
{
    auto tmp = make_temp_dir();
    fake_mailbox box;
    box.folders["INBOX"] = {
        fake_message{1, sys_days{2023y / January / 1}, plain("Old")},
        fake_message{2, sys_days{2023y / June / 1}, plain("Older than a year")},
        fake_message{3, sys_days{2023y / July / 1} + hours{12}, plain("Just inside")},
        fake_message{4, sys_days{2024y / June / 1}, plain("Recent")}};
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.download = false;
    opts.clean = true;
    opts.since = *parse_retention("1Y");
    opts.deletion_confirmed = true;

    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(outcome.ok());
    BOOST_CHECK_EQUAL(box.fetches, 0u);
    BOOST_CHECK_EQUAL(outcome.listed, 2u);
    BOOST_CHECK_EQUAL(outcome.deleted_remote, 2u);
    BOOST_REQUIRE_EQUAL(box.deleted.size(), 2u);
    BOOST_CHECK_EQUAL(box.deleted[0], 1u);
    BOOST_CHECK_EQUAL(box.deleted[1], 2u);
    BOOST_CHECK_EQUAL(box.folders["INBOX"].size(), 2u);
    BOOST_CHECK(!std::filesystem::exists(tmp / "INBOX"));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(fetch_retried_once_on_network_error)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.fetch_errors[1] = {errc::net_timeout};
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    const auto outcome = engine.run(account(), nullptr, base_options(tmp));

    BOOST_CHECK(outcome.ok());
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);
    BOOST_CHECK_EQUAL(box.fetches, 3u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(fetch_timeout_skips_message_and_continues)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.folders["Sent"] = {fake_message{9, on(2023y / March / 3), plain("Sent one")}};
    box.fetch_errors[1] = {errc::net_timeout, errc::net_timeout};
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.folders = {"INBOX", "Sent"};
    opts.clean = true;
    opts.clean_all = true;
    opts.deletion_confirmed = true;
    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_CHECK(!outcome.fatal.has_value());
    BOOST_CHECK_EQUAL(box.reopens, 1u);
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);
    BOOST_REQUIRE_EQUAL(outcome.errors.size(), 1u);
    BOOST_CHECK(outcome.errors[0].kind == failure_kind::fetch);
    BOOST_CHECK_EQUAL(outcome.errors[0].item, "INBOX:1");
    BOOST_REQUIRE_EQUAL(outcome.folders.size(), 2u);
    BOOST_CHECK(outcome.folders[0].state == run_state::done);
    BOOST_CHECK(outcome.folders[1].state == run_state::done);
    BOOST_CHECK(std::find(box.deleted.begin(), box.deleted.end(), 1u) == box.deleted.end());
    BOOST_CHECK(std::find(box.deleted.begin(), box.deleted.end(), 9u) != box.deleted.end());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(connection_lost_during_fetch_stops_run)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.folders["Sent"] = {fake_message{9, on(2023y / March / 3), plain("Sent one")}};
    box.fetch_errors[1] = {errc::net_connection_reset, errc::net_connection_reset};
    box.reopen_error = errc::net_connect_failed;
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.folders = {"INBOX", "Sent"};
    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(outcome.fatal->code == errc::net_connect_failed);
    BOOST_CHECK_EQUAL(box.reopens, 1u);
    BOOST_CHECK_EQUAL(outcome.downloaded, 0u);
    BOOST_CHECK_EQUAL(outcome.failed, 1u);
    BOOST_REQUIRE_EQUAL(outcome.folders.size(), 1u);
    BOOST_CHECK(outcome.folders[0].state == run_state::failed);
    BOOST_CHECK_EQUAL(box.fetches, 2u);
    BOOST_CHECK_EQUAL(box.closes, 1u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(parse_error_is_recorded_and_not_deleted)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.folders["INBOX"].push_back(fake_message{3, on(2023y / February / 2), MALFORMED});
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.clean = true;
    opts.clean_all = true;
    opts.deletion_confirmed = true;
    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_CHECK(!outcome.fatal.has_value());
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);
    BOOST_REQUIRE_EQUAL(outcome.errors.size(), 1u);
    BOOST_CHECK(outcome.errors[0].kind == failure_kind::parse);
    BOOST_CHECK_EQUAL(outcome.errors[0].item, "INBOX:3");
    BOOST_CHECK_EQUAL(box.deleted.size(), 2u);
    BOOST_CHECK(std::find(box.deleted.begin(), box.deleted.end(), 3u) == box.deleted.end());
    BOOST_CHECK(outcome.folders[0].state == run_state::done);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(unconfirmed_deletion_is_skipped)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.clean = true;
    opts.clean_all = true;
    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(outcome.deletion_skipped);
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);
    BOOST_CHECK_EQUAL(outcome.deleted_remote, 0u);
    BOOST_CHECK(box.deleted.empty());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(invalid_options_rejected_before_connecting)
{
    fake_mailbox box = two_messages();
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options clean_everything = base_options("unused");
    clean_everything.clean = true;
    auto outcome = engine.run(account(), nullptr, clean_everything);
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(outcome.fatal->code == errc::invalid_argument);

    run_options no_nas = base_options("unused");
    no_nas.mirror = true;
    outcome = engine.run(account(), nullptr, no_nas);
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(outcome.fatal->code == errc::config_missing);

    run_options local_only = base_options("unused");
    local_only.delete_local = true;
    outcome = engine.run(account(), nullptr, local_only);
    BOOST_REQUIRE(outcome.fatal.has_value());

    run_options too_old = base_options("unused");
    too_old.clean = true;
    too_old.since = retention_expression{40000, age_unit::year};
    outcome = engine.run(account(), nullptr, too_old);
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(outcome.fatal->code == errc::invalid_argument);

    run_options nothing = base_options("unused");
    nothing.folders.clear();
    outcome = engine.run(account(), nullptr, nothing);
    BOOST_REQUIRE(outcome.fatal.has_value());

    BOOST_CHECK_EQUAL(box.connects, 0u);
}

BOOST_AUTO_TEST_CASE(connect_failure_is_fatal)
{
    fake_mailbox box = two_messages();
    box.connect_error = errc::imap_auth_failed;
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    const auto outcome = engine.run(account(), nullptr, base_options("unused"));
    BOOST_CHECK(!outcome.ok());
    BOOST_REQUIRE(outcome.fatal.has_value());
    BOOST_CHECK(classify_connection_error(outcome.fatal->code) == connection_error_kind::auth_rejected);
    BOOST_CHECK(outcome.folders.empty());

    auto probe = engine.test_mail(account());
    BOOST_REQUIRE(!probe.has_value());
    BOOST_CHECK(probe.error().code == errc::imap_auth_failed);
}

BOOST_AUTO_TEST_CASE(missing_folder_fails_and_run_continues)
{
    auto tmp = make_temp_dir();
    fake_mailbox box = two_messages();
    box.list_errors["Gone"] = errc::imap_tagged_no;
    fake_transport mail(box);
    orchestrator engine(mail, nullptr, [] { return NOW; });

    run_options opts = base_options(tmp);
    opts.folders = {"Gone", "INBOX"};
    const auto outcome = engine.run(account(), nullptr, opts);

    BOOST_CHECK(!outcome.ok());
    BOOST_CHECK(!outcome.fatal.has_value());
    BOOST_REQUIRE_EQUAL(outcome.folders.size(), 2u);
    BOOST_CHECK(outcome.folders[0].state == run_state::failed);
    BOOST_CHECK(outcome.folders[0].failure.has_value());
    BOOST_CHECK(outcome.folders[1].state == run_state::done);
    BOOST_CHECK_EQUAL(outcome.downloaded, 2u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(probes_and_folder_listing)
{
    fake_mailbox box = two_messages();
    box.folders["Sent"] = {};
    fake_share_state share;
    fake_transport mail(box);
    fake_storage storage(share);
    orchestrator engine(mail, &storage, [] { return NOW; });

    auto probe = engine.test_mail(account());
    BOOST_REQUIRE(probe.has_value());
    BOOST_CHECK_EQUAL(probe->folders, 2u);
    BOOST_CHECK_EQUAL(probe->inbox_messages.value_or(0), 2u);
    BOOST_CHECK(probe->session.tls);

    auto folders = engine.list_folders(account());
    BOOST_REQUIRE(folders.has_value());
    BOOST_CHECK_EQUAL(folders->size(), 2u);
    BOOST_CHECK_EQUAL(box.closes, 2u);
    BOOST_CHECK(box.deleted.empty());

    BOOST_CHECK(engine.test_storage(share_profile()).has_value());
    BOOST_CHECK_EQUAL(share.closes, 1u);

    orchestrator without_share(mail, nullptr, [] { return NOW; });
    auto no_share = without_share.test_storage(share_profile());
    BOOST_REQUIRE(!no_share.has_value());
    BOOST_CHECK(no_share.error().code == errc::config_missing);
}
