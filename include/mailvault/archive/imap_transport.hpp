/*

imap_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailvault/archive/mail_transport.hpp>
#include <mailvault/archive/report.hpp>
#include <mailvault/detail/asio_decl.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/imap/client.hpp>
#include <mailvault/imap/types.hpp>

namespace mailvault::archive
{

/**
Blocking mail session on top of the coroutine IMAP client.

Each session owns its io_context and runs it only for the duration of one
call, so callers see plain blocking functions.
**/
class imap_session final : public mail_session
{
public:
    imap_session(std::uint64_t id, const connection_profile& profile)
        : id_(id), profile_(profile), tls_ctx_(mailvault::asio::ssl::context::tls_client),
          client_(io_, make_options(profile))
    {
    }

    imap_session(const imap_session&) = delete;
    imap_session& operator=(const imap_session&) = delete;

    ~imap_session() override
    {
        auto res = close();
        if (!res)
            MAILVAULT_WARN(std::format("imap: closing session failed: {}", res.error().to_string()));
    }

    /// Connect, negotiate TLS, read capabilities and log in.
    result_void open()
    {
        if (profile_.host.empty())
            return fail<void>(errc::config_missing, "IMAP host is not configured.");
        if (profile_.email.empty() || profile_.password.empty())
            return fail<void>(errc::config_missing, "MAIL_EMAIL and MAIL_PASSWORD are required.");

        mailvault::asio::ssl::context* ctx =
            profile_.security == mailvault::net::tls_mode::none ? nullptr : &tls_ctx_;
        MAILVAULT_INFO(std::format("Connecting to {}", profile_.describe()));
        auto res = run_blocking<void>([&]() -> mailvault::asio::awaitable<result_void>
        {
            MAILVAULT_CO_TRY_VOID(co_await client_.connect(profile_.host, profile_.port, profile_.security, ctx));
            MAILVAULT_CO_TRY_VOID(co_await client_.capability());
            MAILVAULT_CO_TRY_VOID(co_await client_.login(profile_.email, profile_.password));
            MAILVAULT_CO_TRY_VOID(co_await client_.capability());
            co_return ok();
        });
        if (!res)
            return res;
        open_ = true;
        MAILVAULT_INFO(std::format("Logged in as {}", profile_.email));
        return ok();
    }

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

    [[nodiscard]] session_info info() const override
    {
        return session_info{client_.capabilities().size(), client_.is_tls()};
    }

    result<std::vector<folder_summary>> list_folders() override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        return run_blocking<std::vector<folder_summary>>(
            [&]() -> mailvault::asio::awaitable<result<std::vector<folder_summary>>>
        {
            std::vector<mailvault::imap::mailbox_folder> folders;
            MAILVAULT_CO_TRY_ASSIGN(folders, co_await client_.list("", "*"));

            std::vector<folder_summary> out;
            out.reserve(folders.size());
            for (auto& folder : folders)
            {
                folder_summary summary;
                summary.name = std::move(folder.name);
                summary.delimiter = folder.delimiter;
                if (folder.selectable())
                {
                    auto counts = co_await client_.status(summary.name);
                    if (counts)
                    {
                        summary.total = counts->messages;
                        summary.unseen = counts->unseen;
                    }
                    else if (is_network_error(counts.error().code))
                        co_return fail<std::vector<folder_summary>>(std::move(counts).error());
                    else
                        MAILVAULT_DEBUG(std::format("imap: STATUS {} failed: {}", summary.name, counts.error().to_string()));
                }
                out.push_back(std::move(summary));
            }
            co_return ok(std::move(out));
        });
    }

    result<std::vector<message_handle>> list_messages(std::string_view folder,
        std::optional<std::chrono::sys_seconds> before) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        std::string criteria = "ALL";
        if (before.has_value())
        {
            // Internal dates carry their own zone, so the server's day may be one
            // ahead of the UTC day; the caller re-checks each handle exactly.
            using namespace std::chrono;
            const year_month_day day{floor<days>(*before) + days{2}};
            criteria = "BEFORE " + mailvault::imap::format_search_date(day);
        }

        return run_blocking<std::vector<message_handle>>(
            [&]() -> mailvault::asio::awaitable<result<std::vector<message_handle>>>
        {
            mailvault::imap::mailbox_stat stat;
            MAILVAULT_CO_TRY_ASSIGN(stat, co_await client_.select(folder, true));
            validity_.insert_or_assign(std::string(folder), stat.uid_validity);
            std::vector<std::uint32_t> uids;
            MAILVAULT_CO_TRY_ASSIGN(uids, co_await client_.uid_search(criteria));
            std::vector<message_handle> handles;
            if (uids.empty())
                co_return ok(std::move(handles));

            std::vector<mailvault::imap::fetch_summary> summaries;
            MAILVAULT_CO_TRY_ASSIGN(summaries, co_await client_.uid_fetch_summary(uids));
            handles.reserve(summaries.size());
            for (const auto& summary : summaries)
            {
                message_handle handle;
                handle.session_id = id_;
                handle.folder = std::string(folder);
                handle.uid = summary.uid;
                handle.seq = summary.seq;
                handle.internal_date = summary.internal_date;
                handle.size = summary.size;
                handles.push_back(std::move(handle));
            }
            co_return ok(std::move(handles));
        });
    }

    result<std::string> fetch_raw(const message_handle& handle) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        MAILVAULT_TRY_VOID(check_handle(handle, handle.folder));
        return run_blocking<std::string>([&]() -> mailvault::asio::awaitable<result<std::string>>
        {
            if (client_.selected() != handle.folder)
                MAILVAULT_CO_TRY_VOID(co_await select_same_generation(handle.folder, true));
            co_return co_await client_.uid_fetch_body(handle.uid);
        });
    }

    result<std::size_t> delete_messages(std::string_view folder, std::span<const message_handle> handles) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        if (handles.empty())
            return std::size_t{0};
        std::vector<std::uint32_t> uids;
        uids.reserve(handles.size());
        for (const auto& handle : handles)
        {
            MAILVAULT_TRY_VOID(check_handle(handle, folder));
            uids.push_back(handle.uid);
        }

        return run_blocking<std::size_t>([&]() -> mailvault::asio::awaitable<result<std::size_t>>
        {
            if (client_.selected() != folder || client_.selected_read_only())
                MAILVAULT_CO_TRY_VOID(co_await select_same_generation(folder, false));
            MAILVAULT_CO_TRY_VOID(co_await client_.uid_store_deleted(uids));
            MAILVAULT_CO_TRY_VOID(co_await client_.expunge(uids));
            co_return ok(uids.size());
        });
    }

    result_void reopen() override
    {
        if (!open_ && !broken_)
            return fail<void>(errc::imap_invalid_state, "Mail session is not open.");
        if (broken_ || !client_.is_connected())
            return reconnect();
        return ok();
    }

    result_void close() override
    {
        broken_ = false;
        if (!client_.is_connected())
        {
            open_ = false;
            return ok();
        }
        open_ = false;
        auto res = run_blocking<void>([&]() -> mailvault::asio::awaitable<result_void>
        {
            co_return co_await client_.logout();
        });
        MAILVAULT_DEBUG("imap: session closed");
        return res;
    }

private:
    static mailvault::imap::options make_options(const connection_profile& profile)
    {
        mailvault::imap::options opts;
        opts.timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(profile.timeout);
        opts.allow_cleartext_auth = profile.allow_cleartext_auth;
        opts.tls.verify_peer = profile.verify_peer;
        opts.tls.ca_file = profile.ca_file;
        return opts;
    }

    result_void ensure_open()
    {
        if (broken_)
            return reconnect();
        if (!open_ || !client_.is_connected())
            return fail<void>(errc::imap_invalid_state, "Mail session is not open.");
        return ok();
    }

    /**
    Replace a connection that failed at the network level.

    Handles stay valid: the session id is kept and every folder is re-opened
    through select_same_generation(), which refuses a changed UIDVALIDITY.
    **/
    result_void reconnect()
    {
        MAILVAULT_WARN(std::format("imap: connection to {} lost, reconnecting", profile_.host));
        auto dropped = run_blocking<void>([&]() -> mailvault::asio::awaitable<result_void>
        {
            co_return co_await client_.logout();
        });
        if (!dropped)
            MAILVAULT_DEBUG(std::format("imap: dropping broken connection: {}", dropped.error().to_string()));
        open_ = false;
        MAILVAULT_TRY_VOID(open());
        broken_ = false;
        return ok();
    }

    mailvault::asio::awaitable<result_void> select_same_generation(std::string_view folder, bool read_only)
    {
        mailvault::imap::mailbox_stat stat;
        MAILVAULT_CO_TRY_ASSIGN(stat, co_await client_.select(folder, read_only));
        const auto known = validity_.find(folder);
        if (known != validity_.end() && known->second != stat.uid_validity)
            co_return fail<void>(errc::imap_invalid_state, "Folder UIDVALIDITY changed; message handles are stale.",
                std::format("folder={} was={} now={}", folder, known->second, stat.uid_validity));
        co_return ok();
    }

    result_void check_handle(const message_handle& handle, std::string_view folder) const
    {
        if (handle.session_id != id_)
            return fail<void>(errc::imap_invalid_state, "Message handle belongs to another session.",
                std::format("handle_session={} session={} uid={}", handle.session_id, id_, handle.uid));
        if (handle.folder != folder)
            return fail<void>(errc::invalid_argument, "Message handle belongs to another folder.",
                std::format("handle_folder={} folder={} uid={}", handle.folder, folder, handle.uid));
        return ok();
    }

    /// Run one coroutine to completion on the session's io_context. A network failure marks the connection for reconnect().
    template<typename T, typename Fn>
    result<T> run_blocking(Fn&& fn)
    {
        std::optional<result<T>> out;
        std::exception_ptr failure;
        io_.restart();
        mailvault::asio::co_spawn(io_,
            [&]() -> mailvault::asio::awaitable<void>
            {
                out.emplace(co_await fn());
            },
            [&](std::exception_ptr ep)
            {
                failure = ep;
            });
        io_.run();

        if (failure)
        {
            try
            {
                std::rethrow_exception(failure);
            }
            catch (const std::exception& exc)
            {
                return fail<T>(errc::internal_error, std::format("Unexpected exception: {}", exc.what()));
            }
        }
        if (!out.has_value())
            return fail<T>(errc::internal_error, "Mail operation did not complete.");
        if (!out->has_value() && is_network_error(out->error().code) && open_)
            broken_ = true;
        return std::move(*out);
    }

    std::uint64_t id_;
    connection_profile profile_;
    mailvault::asio::io_context io_;
    mailvault::asio::ssl::context tls_ctx_;
    mailvault::imap::client client_;
    std::map<std::string, std::uint32_t, std::less<>> validity_;
    bool open_ = false;
    bool broken_ = false;
};

/// mail_transport speaking IMAP.
class imap_transport final : public mail_transport
{
public:
    result<std::unique_ptr<mail_session>> connect(const connection_profile& profile) override
    {
        auto session = std::make_unique<imap_session>(next_id(), profile);
        auto res = session->open();
        if (!res)
        {
            MAILVAULT_ERROR(std::format("Mail connection failed ({}): {}",
                to_string(classify_connection_error(res.error().code)), res.error().to_string()));
            return fail<std::unique_ptr<mail_session>>(std::move(res).error());
        }
        return std::unique_ptr<mail_session>(std::move(session));
    }

private:
    static std::uint64_t next_id()
    {
        static std::atomic<std::uint64_t> counter{0};
        return ++counter;
    }
};

} // namespace mailvault::archive
