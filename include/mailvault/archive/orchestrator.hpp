/*

orchestrator.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailvault/archive/mail_transport.hpp>
#include <mailvault/archive/materializer.hpp>
#include <mailvault/archive/profile.hpp>
#include <mailvault/archive/remote_storage.hpp>
#include <mailvault/archive/report.hpp>
#include <mailvault/archive/retention.hpp>
#include <mailvault/archive/scoped_session.hpp>
#include <mailvault/archive/types.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/detail/retry.hpp>

namespace mailvault::archive
{

/**
What one run does.

`download` and `mirror` select the phases; `clean` adds server side deletion.
With `clean` and without `download` the run is clean-only: the server search
is narrowed to the retention cutoff and no message body is fetched.
**/
struct run_options
{
    std::filesystem::path output_dir = "./downloads";
    std::vector<std::string> folders;

    bool download = true;
    bool mirror = false;
    bool overwrite = false;
    bool delete_local = false;
    bool preview = false;

    bool clean = false;
    std::optional<retention_expression> since;

    /// Required to clean without `since`: every listed message is then deleted.
    bool clean_all = false;

    /// Pre-resolved answer of the caller's confirmation prompt.
    bool deletion_confirmed = false;

    /// Account directory on the share; the local part of the address when empty.
    std::string account;

    mailvault::detail::retry_policy fetch_retry = mailvault::detail::retry_policy::single_retry();
};

/// Outcome of the `--test-mail` probe.
struct mail_probe
{
    session_info session;
    std::size_t folders = 0;
    std::optional<std::uint32_t> inbox_messages;
};

/**
Drives the per-folder state machine

    Listing -> Downloading -> Mirroring -> LocalCleanup -> RetentionDeleting -> Done

with `Failed` for a folder that cannot be processed at all. Per message
failures are recorded in the outcome and the run moves on; a lost connection
ends the run. Both sessions are closed on every path.

The orchestrator never prompts. In preview mode every read-only call is made
(listing, fetching with PEEK, existence checks) and every mutating one is
replaced by bookkeeping, so the ids reported match those a real run acts on.
**/
class orchestrator
{
public:
    using clock_fn = std::function<std::chrono::sys_seconds()>;

    /**
    @param mail    Mail transport, must outlive the orchestrator.
    @param storage Share transport; only needed for mirroring and the storage probe.
    @param now     Clock used for retention; the system clock by default.
    **/
    explicit orchestrator(mail_transport& mail, remote_storage* storage = nullptr, clock_fn now = {})
        : mail_(mail), storage_(storage), now_(std::move(now))
    {
        if (!now_)
            now_ = []() { return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()); };
    }

    /// Folder table of the account.
    result<std::vector<folder_summary>> list_folders(const connection_profile& profile)
    {
        std::unique_ptr<mail_session> connected;
        MAILVAULT_TRY_ASSIGN(connected, mail_.connect(profile));
        scoped_session<mail_session> session(std::move(connected), "mail");
        std::vector<folder_summary> folders;
        MAILVAULT_TRY_ASSIGN(folders, session->list_folders());
        MAILVAULT_TRY_VOID(session.close());
        return folders;
    }

    /// Connect, count folders and INBOX messages, disconnect. Messages are not touched.
    result<mail_probe> test_mail(const connection_profile& profile)
    {
        std::unique_ptr<mail_session> connected;
        MAILVAULT_TRY_ASSIGN(connected, mail_.connect(profile));
        scoped_session<mail_session> session(std::move(connected), "mail");

        mail_probe probe;
        probe.session = session->info();
        std::vector<folder_summary> folders;
        MAILVAULT_TRY_ASSIGN(folders, session->list_folders());
        probe.folders = folders.size();
        for (const auto& folder : folders)
        {
            if (mailvault::detail::iequals_ascii(folder.name, "INBOX"))
                probe.inbox_messages = folder.total;
        }
        MAILVAULT_TRY_VOID(session.close());
        return probe;
    }

    /// Connect to the share and create the base path.
    result_void test_storage(const nas_profile& profile)
    {
        if (storage_ == nullptr)
            return fail<void>(errc::config_missing, "No NAS storage configured.");
        std::unique_ptr<storage_session> connected;
        MAILVAULT_TRY_ASSIGN(connected, storage_->connect(profile));
        scoped_session<storage_session> session(std::move(connected), "nas");
        MAILVAULT_TRY_VOID(session->ensure_dir(""));
        return session.close();
    }

    /**
    Process every folder of `options.folders` in order.

    @param nas Share profile, required when `options.mirror` is set.
    @return The outcome; `fatal` is set when the run stopped early.
    **/
    run_outcome run(const connection_profile& profile, const nas_profile* nas, const run_options& options)
    {
        run_outcome outcome;
        outcome.preview = options.preview;

        auto valid = validate(nas, options);
        if (!valid)
        {
            MAILVAULT_ERROR(valid.error().to_string());
            outcome.fatal = std::move(valid).error();
            return outcome;
        }

        auto mail = mail_.connect(profile);
        if (!mail)
        {
            MAILVAULT_ERROR(std::format("Mail connection failed: {}", mail.error().to_string()));
            outcome.fatal = std::move(mail).error();
            return outcome;
        }
        scoped_session<mail_session> mail_session_guard(std::move(*mail), "mail");

        scoped_session<storage_session> share_guard;
        if (options.mirror)
        {
            auto share = storage_->connect(*nas);
            if (!share)
            {
                MAILVAULT_ERROR(std::format("NAS connection failed: {}", share.error().to_string()));
                outcome.fatal = std::move(share).error();
                return outcome;
            }
            share_guard = scoped_session<storage_session>(std::move(*share), "nas");
        }

        materializer local(options.output_dir);
        run_context ctx{options, outcome, *mail_session_guard, share_guard.get(), local,
            options.account.empty() ? profile.account_identifier() : options.account, now_()};

        if (options.preview)
            MAILVAULT_INFO("Preview mode: nothing will be written or deleted");
        for (const auto& folder : options.folders)
        {
            process_folder(ctx, folder);
            if (outcome.fatal)
                break;
        }

        if (auto closed = share_guard.close(); !closed)
            MAILVAULT_WARN(std::format("nas: close failed: {}", closed.error().to_string()));
        if (auto closed = mail_session_guard.close(); !closed)
            MAILVAULT_WARN(std::format("mail: close failed: {}", closed.error().to_string()));

        MAILVAULT_INFO(std::format("Run finished: {} listed, {} downloaded, {} uploaded, {} skipped, {} deleted remotely, {} failed",
            outcome.listed, outcome.downloaded, outcome.uploaded, outcome.skipped_existing, outcome.deleted_remote, outcome.failed));
        return outcome;
    }

private:
    struct run_context
    {
        const run_options& options;
        run_outcome& outcome;
        mail_session& mail;
        storage_session* share;
        materializer& local;
        std::string account;
        std::chrono::sys_seconds now;
    };

    /// Progress of one listed message through the phases.
    struct message_work
    {
        message_handle handle;
        std::optional<materialized_message> local;
        bool downloaded = false;
        bool mirrored = false;
    };

    /// Errors after which the session is unusable.
    [[nodiscard]] static constexpr bool is_connection_loss(errc code) noexcept
    {
        return is_network_error(code) || is_tls_error(code) || code == errc::imap_bye || code == errc::imap_auth_failed;
    }

    /// Share errors after which no further upload can succeed.
    [[nodiscard]] static constexpr bool is_share_loss(errc code) noexcept
    {
        return code == errc::storage_connect_failed || code == errc::storage_auth_failed ||
            is_network_error(code) || is_tls_error(code);
    }

    result_void validate(const nas_profile* nas, const run_options& options) const
    {
        if (options.folders.empty())
            return fail<void>(errc::invalid_argument, "No folder selected.");
        if (options.mirror && !options.download)
            return fail<void>(errc::invalid_argument, "Mirroring requires downloading.");
        if (options.mirror && (storage_ == nullptr || nas == nullptr))
            return fail<void>(errc::config_missing, "Mirroring requested but no NAS is configured.");
        if (options.delete_local && !options.mirror)
            return fail<void>(errc::invalid_argument, "Deleting local copies requires mirroring them first.");
        if (options.since && !options.since->in_range())
            return fail<void>(errc::invalid_argument, "Retention age out of range.",
                std::format("since={}", options.since->to_string()));
        if (options.clean && !options.since && !options.clean_all)
            return fail<void>(errc::invalid_argument,
                "Cleaning without an age limit deletes every message; pass an age or the explicit opt-in.");
        if (!options.clean && !options.download)
            return fail<void>(errc::invalid_argument, "Nothing to do: neither download nor clean requested.");
        return ok();
    }

    void enter(const std::string& folder, folder_report& report, run_state state) const
    {
        report.state = state;
        MAILVAULT_INFO(std::format("{}: {}", folder, to_string(state)));
    }

    static void record(run_context& ctx, std::string_view folder, std::string item, failure_kind phase, const error_info& err)
    {
        item_error entry;
        entry.folder = std::string(folder);
        entry.item = std::move(item);
        entry.kind = classify_failure(err.code, phase);
        entry.code = err.code;
        entry.reason = err.to_string();
        entry.detail = err.detail;
        if (entry.detail.empty())
            MAILVAULT_ERROR(entry.to_string());
        else
            MAILVAULT_ERROR(std::format("{} ({})", entry.to_string(), entry.detail));
        ctx.outcome.record(std::move(entry));
    }

    /// Stop the run after the connection went away.
    static void abort_run(run_context& ctx, folder_report& report, error_info err)
    {
        MAILVAULT_ERROR(std::format("{}: connection lost, stopping: {}", report.name, err.to_string()));
        report.state = run_state::failed;
        report.failure = err.to_string();
        ctx.outcome.fatal = std::move(err);
    }

    void process_folder(run_context& ctx, const std::string& folder)
    {
        const run_options& opts = ctx.options;
        folder_report report;
        report.name = folder;

        enter(folder, report, run_state::listing);
        const bool clean_only = opts.clean && !opts.download;
        std::optional<std::chrono::sys_seconds> before;
        if (clean_only && opts.since)
            before = retention_cutoff(ctx.now, *opts.since);

        auto listed = ctx.mail.list_messages(folder, before);
        if (!listed)
        {
            if (is_connection_loss(listed.error().code))
                abort_run(ctx, report, std::move(listed).error());
            else
            {
                MAILVAULT_ERROR(std::format("{}: cannot open folder: {}", folder, listed.error().to_string()));
                report.state = run_state::failed;
                report.failure = listed.error().to_string();
            }
            ctx.outcome.folders.push_back(std::move(report));
            return;
        }

        std::vector<message_work> work;
        work.reserve(listed->size());
        for (auto& handle : *listed)
        {
            // The server search has day granularity; the exact cutoff is applied here.
            if (clean_only && !should_delete(handle.internal_date, ctx.now, opts.since))
                continue;
            work.push_back(message_work{std::move(handle), std::nullopt, false, false});
        }
        report.listed = work.size();
        ctx.outcome.listed += work.size();
        MAILVAULT_INFO(std::format("{}: {} message(s)", folder, work.size()));

        if (opts.download)
        {
            enter(folder, report, run_state::downloading);
            download(ctx, report, work);
        }
        if (!ctx.outcome.fatal && opts.mirror)
        {
            enter(folder, report, run_state::mirroring);
            mirror(ctx, report, work);
        }
        if (!ctx.outcome.fatal && opts.delete_local)
        {
            enter(folder, report, run_state::local_cleanup);
            cleanup_local(ctx, folder, work);
        }
        if (!ctx.outcome.fatal && opts.clean)
        {
            enter(folder, report, run_state::retention_deleting);
            delete_expired(ctx, report, work);
        }
        if (!ctx.outcome.fatal)
            enter(folder, report, run_state::done);
        ctx.outcome.folders.push_back(std::move(report));
    }

    void download(run_context& ctx, folder_report& report, std::vector<message_work>& work)
    {
        const run_options& opts = ctx.options;
        for (auto& item : work)
        {
            const std::string id = item.handle.id();
            unsigned int tries = 0;
            auto raw = opts.fetch_retry.run([&]() { return ctx.mail.fetch_raw(item.handle); }, &tries);
            if (!raw)
            {
                record(ctx, report.name, id, failure_kind::fetch, raw.error());
                if (is_connection_loss(raw.error().code))
                {
                    // One slow or broken message is skipped; an unreachable server ends the run.
                    auto reopened = ctx.mail.reopen();
                    if (!reopened)
                    {
                        abort_run(ctx, report, std::move(reopened).error());
                        return;
                    }
                }
                continue;
            }
            if (tries > 1)
                MAILVAULT_INFO(std::format("{}: fetched after {} attempts", id, tries));

            auto plan = ctx.local.plan(std::move(*raw), item.handle);
            if (!plan)
            {
                record(ctx, report.name, id, failure_kind::parse, plan.error());
                continue;
            }
            const std::size_t attachments = plan->attachments.size();

            auto stored = opts.preview ? ctx.local.preview(std::move(*plan)) : ctx.local.commit(std::move(*plan));
            if (!stored)
            {
                record(ctx, report.name, id, failure_kind::write, stored.error());
                continue;
            }
            MAILVAULT_DEBUG(std::format("{}: {} {}", id, opts.preview ? "would write" : (stored->reused ? "kept" : "wrote"),
                stored->directory.string()));

            item.local = std::move(*stored);
            item.downloaded = true;
            ++ctx.outcome.downloaded;
            ctx.outcome.attachments += attachments;
            ctx.outcome.downloaded_ids.push_back(id);
        }
    }

    void mirror(run_context& ctx, folder_report& report, std::vector<message_work>& work)
    {
        const run_options& opts = ctx.options;
        const std::string& folder = report.name;
        const std::string folder_dir = folder_relative_path(folder);
        for (auto& item : work)
        {
            if (!item.downloaded)
                continue;
            const std::string id = item.handle.id();
            const std::string dir = join_remote_path({ctx.account, folder_dir, item.local->name()});

            if (!opts.preview)
            {
                auto made = ctx.share->ensure_dir(dir);
                if (!made)
                {
                    record(ctx, folder, id, failure_kind::write, made.error());
                    if (is_share_loss(made.error().code))
                    {
                        abort_run(ctx, report, std::move(made).error());
                        return;
                    }
                    continue;
                }
            }

            bool complete = true;
            for (const auto& file : item.local->files())
            {
                const std::string remote = join_remote_path({dir, file.filename().string()});
                auto stored = opts.preview ? would_write(ctx, remote) : upload(ctx, file, remote);
                if (!stored)
                {
                    record(ctx, folder, id, failure_kind::write, stored.error());
                    if (!opts.preview && is_share_loss(stored.error().code))
                    {
                        abort_run(ctx, report, std::move(stored).error());
                        return;
                    }
                    complete = false;
                    break;
                }
                if (*stored == write_result::written)
                    ++ctx.outcome.uploaded;
                else
                    ++ctx.outcome.skipped_existing;
                MAILVAULT_DEBUG(std::format("nas: {} {}", to_string(*stored), remote));
            }
            if (!complete)
                continue;
            item.mirrored = true;
            ctx.outcome.mirrored_ids.push_back(id);
        }
    }

    /// Preview of write_file(): same skip decision, no transfer.
    static result<write_result> would_write(run_context& ctx, std::string_view remote)
    {
        if (ctx.options.overwrite)
            return write_result::written;
        auto present = ctx.share->exists(remote);
        if (!present)
        {
            // The directory usually does not exist yet, which some servers report as an error.
            MAILVAULT_DEBUG(std::format("nas: cannot check {}: {}", remote, present.error().to_string()));
            return write_result::written;
        }
        return *present ? write_result::skipped : write_result::written;
    }

    static result<write_result> upload(run_context& ctx, const std::filesystem::path& file, std::string_view remote)
    {
        std::string bytes;
        MAILVAULT_TRY_ASSIGN(bytes, read_file(file));
        return ctx.share->write_file(remote, bytes, ctx.options.overwrite);
    }

    static result<std::string> read_file(const std::filesystem::path& file)
    {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs)
            return fail<std::string>(errc::fs_io_failed, "Cannot open local file.", std::format("path={}", file.string()));
        std::ostringstream buffer;
        buffer << ifs.rdbuf();
        if (ifs.bad())
            return fail<std::string>(errc::fs_io_failed, "Cannot read local file.", std::format("path={}", file.string()));
        return buffer.str();
    }

    static void cleanup_local(run_context& ctx, const std::string& folder, std::vector<message_work>& work)
    {
        for (auto& item : work)
        {
            if (!item.mirrored)
                continue;
            const std::string id = item.handle.id();
            if (!ctx.options.preview)
            {
                auto removed = materializer::remove(*item.local);
                if (!removed)
                {
                    record(ctx, folder, id, failure_kind::write, removed.error());
                    continue;
                }
            }
            ++ctx.outcome.deleted_local;
            ctx.outcome.deleted_local_ids.push_back(id);
        }
    }

    /**
    Delete the messages the retention rule selects.

    A message whose download or required upload failed is never deleted.
    Without confirmation a real run skips the phase and says so; a preview
    reports what would be deleted.
    **/
    static void delete_expired(run_context& ctx, folder_report& report, const std::vector<message_work>& work)
    {
        const run_options& opts = ctx.options;
        if (!opts.preview && !opts.deletion_confirmed)
        {
            MAILVAULT_WARN(std::format("{}: deletion not confirmed, skipping", report.name));
            ctx.outcome.deletion_skipped = true;
            return;
        }

        std::vector<message_handle> expired;
        for (const auto& item : work)
        {
            if (opts.download && !item.downloaded)
                continue;
            if (opts.mirror && !item.mirrored)
                continue;
            if (!should_delete(item.handle.internal_date, ctx.now, opts.since))
                continue;
            expired.push_back(item.handle);
        }
        if (opts.since)
            MAILVAULT_INFO(std::format("{}: {} message(s) older than {}", report.name, expired.size(),
                std::format("{:%Y-%m-%d}", retention_cutoff(ctx.now, *opts.since))));
        if (expired.empty())
            return;

        if (!opts.preview)
        {
            auto deleted = ctx.mail.delete_messages(report.name, expired);
            if (!deleted)
            {
                record(ctx, report.name, std::format("{} message(s)", expired.size()), failure_kind::deletion, deleted.error());
                if (is_connection_loss(deleted.error().code))
                    abort_run(ctx, report, std::move(deleted).error());
                return;
            }
            if (*deleted != expired.size())
                MAILVAULT_WARN(std::format("{}: server removed {} of {} message(s)", report.name, *deleted, expired.size()));
        }
        ctx.outcome.deleted_remote += expired.size();
        for (const auto& handle : expired)
            ctx.outcome.deleted_remote_ids.push_back(handle.id());
    }

    mail_transport& mail_;
    remote_storage* storage_;
    clock_fn now_;
};

} // namespace mailvault::archive
