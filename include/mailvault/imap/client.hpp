/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailvault/detail/append.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/asio_decl.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/redact.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/detail/sanitize.hpp>
#include <mailvault/imap/error_mapping.hpp>
#include <mailvault/imap/types.hpp>
#include <mailvault/net/dialog.hpp>
#include <mailvault/net/error_mapping.hpp>
#include <mailvault/net/tls_mode.hpp>
#include <mailvault/net/upgradable_stream.hpp>

namespace mailvault::imap
{

using mailvault::asio::any_io_executor;
using mailvault::asio::awaitable;
using mailvault::asio::io_context;
using mailvault::asio::tcp;
using mailvault::result;
using mailvault::result_void;
namespace ssl = mailvault::asio::ssl;

/**
Coroutine IMAP client covering the commands needed to archive a mailbox:
capability, login, list, status, examine/select, uid search/fetch/store and
expunge.

One client owns one connection; it is not safe to issue commands from two
coroutines at once.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using dialog_type = mailvault::net::dialog<mailvault::net::upgradable_stream>;

    /// UIDs per FETCH/STORE command, keeps command lines short.
    static constexpr std::size_t UID_BATCH = 500;

    explicit client(executor_type executor, options opts = {})
        : executor_(std::move(executor)), options_(std::move(opts))
    {
    }

    explicit client(io_context& context, options opts = {})
        : client(context.get_executor(), std::move(opts))
    {
    }

    executor_type get_executor() const { return executor_; }

    [[nodiscard]] bool is_connected() const noexcept { return dialog_.has_value(); }

    [[nodiscard]] bool is_tls() const noexcept { return dialog_.has_value() && dialog_->stream().is_tls(); }

    /**
    Connect, read the greeting and negotiate TLS according to `mode`.

    @param tls_ctx Required for tls_mode::implicit and tls_mode::starttls.
    **/
    awaitable<result_void> connect(const std::string& host, unsigned short port,
        mailvault::net::tls_mode mode, ssl::context* tls_ctx)
    {
        if (dialog_.has_value())
            co_return fail<void>(errc::imap_invalid_state, "Connection is already established.",
                imap_detail({}, "CONNECT", {}, 0, 0));
        MAILVAULT_CO_TRY_VOID(mailvault::detail::ensure_single_line(host, "host"));
        if (mode != mailvault::net::tls_mode::none && tls_ctx == nullptr)
            co_return fail<void>(errc::imap_invalid_state, "TLS context is required.",
                imap_detail({}, "CONNECT", {}, 0, 0));
        remote_host_ = host;
        const std::string service = std::to_string(port);

        MAILVAULT_DEBUG(std::format("imap: connecting to {}:{} ({})", host, port, mailvault::net::to_string(mode)));

        mailvault::asio::error_code ec;
        tcp::resolver resolver(executor_);
        auto endpoints = co_await resolver.async_resolve(host, service, mailvault::asio::nothrow_awaitable(ec));
        if (ec)
            co_return mailvault::net::net_fail<void>(mailvault::net::io_stage::resolve, ec, false,
                mailvault::net::make_net_detail("imap", host, service, mailvault::net::io_stage::resolve, "resolve"));

        mailvault::net::upgradable_stream stream(executor_);
        co_await mailvault::asio::async_connect(stream.lowest_layer(), endpoints, mailvault::asio::nothrow_awaitable(ec));
        if (ec)
            co_return mailvault::net::net_fail<void>(mailvault::net::io_stage::connect, ec, false,
                mailvault::net::make_net_detail("imap", host, service, mailvault::net::io_stage::connect, "connect"));

        if (mode == mailvault::net::tls_mode::implicit)
            MAILVAULT_CO_TRY_VOID(co_await stream.start_tls(*tls_ctx, host, options_.tls));

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        dialog_->set_trace_protocol("IMAP");
        tag_counter_ = 0;
        capabilities_.clear();

        response greeting;
        MAILVAULT_CO_TRY_ASSIGN(greeting, co_await read_greeting_impl());
        preauth_ = greeting.st == status::preauth;

        if (mode == mailvault::net::tls_mode::starttls)
            MAILVAULT_CO_TRY_VOID(co_await start_tls_impl(*tls_ctx));

        co_return ok();
    }

    awaitable<result<response>> capability()
    {
        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl("CAPABILITY"));
        capabilities_.clear();
        for (const auto& line : resp.untagged_lines)
            parse_capability_line(line);
        capabilities_known_ = true;
        co_return ok(std::move(resp));
    }

    [[nodiscard]] bool has_capability(std::string_view name) const
    {
        for (const auto& cap : capabilities_)
        {
            if (mailvault::detail::iequals_ascii(cap, name))
                return true;
        }
        return false;
    }

    [[nodiscard]] const std::vector<std::string>& capabilities() const noexcept { return capabilities_; }

    /// LOGIN; a tagged NO is reported as errc::imap_auth_failed.
    awaitable<result<response>> login(std::string_view username, std::string_view password)
    {
        if (preauth_)
            co_return ok(response{});
        MAILVAULT_CO_TRY_VOID(enforce_auth_tls_policy());
        std::string user;
        MAILVAULT_CO_TRY_ASSIGN(user, to_astring(username));
        std::string pass;
        MAILVAULT_CO_TRY_ASSIGN(pass, to_astring(password));
        std::string cmd;
        mailvault::detail::append_sv(cmd, "LOGIN");
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, user);
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, pass);

        auto resp = co_await command_impl(cmd);
        if (resp)
            capabilities_known_ = false;
        co_return resp;
    }

    awaitable<result<std::vector<mailbox_folder>>> list(std::string_view reference, std::string_view pattern)
    {
        std::string ref;
        MAILVAULT_CO_TRY_ASSIGN(ref, to_mailbox(reference));
        std::string pat;
        MAILVAULT_CO_TRY_ASSIGN(pat, to_mailbox(pattern));

        std::string cmd;
        mailvault::detail::append_sv(cmd, "LIST");
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, ref);
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, pat);

        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        std::vector<mailbox_folder> folders;
        folders.reserve(resp.untagged_lines.size());
        for (const auto& line : resp.untagged_lines)
        {
            mailbox_folder folder;
            if (parse_list_line(line, folder))
                folders.push_back(std::move(folder));
        }
        co_return ok(std::move(folders));
    }

    awaitable<result<status_counts>> status(std::string_view mailbox)
    {
        std::string box;
        MAILVAULT_CO_TRY_ASSIGN(box, to_mailbox(mailbox));
        std::string cmd;
        mailvault::detail::append_sv(cmd, "STATUS");
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, box);
        mailvault::detail::append_sv(cmd, " (MESSAGES UNSEEN)");

        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        status_counts counts;
        for (const auto& line : resp.untagged_lines)
        {
            if (parse_status_line(line, counts))
                break;
        }
        co_return ok(counts);
    }

    /// SELECT, or EXAMINE when `read_only` is set.
    awaitable<result<mailbox_stat>> select(std::string_view mailbox, bool read_only)
    {
        std::string box;
        MAILVAULT_CO_TRY_ASSIGN(box, to_mailbox(mailbox));
        std::string cmd;
        mailvault::detail::append_sv(cmd, read_only ? "EXAMINE" : "SELECT");
        mailvault::detail::append_space(cmd);
        mailvault::detail::append_sv(cmd, box);

        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        mailbox_stat stat;
        for (const auto& line : resp.untagged_lines)
            parse_mailbox_stat(line, stat);
        selected_ = std::string(mailbox);
        read_only_ = read_only;
        co_return ok(stat);
    }

    [[nodiscard]] const std::optional<std::string>& selected() const noexcept { return selected_; }
    [[nodiscard]] bool selected_read_only() const noexcept { return read_only_; }

    awaitable<result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria)
    {
        std::string cmd;
        mailvault::detail::append_sv(cmd, "UID SEARCH");
        if (!criteria.empty())
        {
            mailvault::detail::append_space(cmd);
            mailvault::detail::append_sv(cmd, criteria);
        }

        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        std::vector<std::uint32_t> ids;
        for (const auto& line : resp.untagged_lines)
        {
            auto parsed = parse_search_ids(line);
            ids.insert(ids.end(), parsed.begin(), parsed.end());
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        co_return ok(std::move(ids));
    }

    /// UID, INTERNALDATE and RFC822.SIZE for the given UIDs, ordered by sequence number.
    awaitable<result<std::vector<fetch_summary>>> uid_fetch_summary(std::span<const std::uint32_t> uids)
    {
        std::vector<fetch_summary> out;
        out.reserve(uids.size());
        for (std::size_t offset = 0; offset < uids.size(); offset += UID_BATCH)
        {
            const auto chunk = uids.subspan(offset, std::min(UID_BATCH, uids.size() - offset));
            std::string cmd;
            mailvault::detail::append_sv(cmd, "UID FETCH ");
            mailvault::detail::append_sequence_set(cmd, chunk);
            mailvault::detail::append_sv(cmd, " (UID INTERNALDATE RFC822.SIZE)");

            response resp;
            MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
            for (const auto& line : resp.untagged_lines)
            {
                fetch_summary summary;
                if (parse_fetch_summary(line, summary))
                    out.push_back(summary);
                else if (mailvault::detail::starts_with_ci(line, "* ") && line.find("FETCH") != std::string::npos)
                    MAILVAULT_WARN(std::format("imap: unparsable FETCH line ignored: {}", log::logger::sanitize_trace(line)));
            }
        }
        std::sort(out.begin(), out.end(), [](const fetch_summary& a, const fetch_summary& b)
        {
            return a.seq < b.seq;
        });
        co_return ok(std::move(out));
    }

    /// Full message source through BODY.PEEK[] so the \Seen flag is left alone.
    awaitable<result<std::string>> uid_fetch_body(std::uint32_t uid)
    {
        std::string cmd;
        mailvault::detail::append_sv(cmd, "UID FETCH ");
        mailvault::detail::append_uint(cmd, uid);
        mailvault::detail::append_sv(cmd, " (BODY.PEEK[])");

        response resp;
        MAILVAULT_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        auto literal = select_fetch_literal(resp, "BODY[]");
        if (!literal.has_value())
        {
            const failure_context where{remote_host_, resp.tag, cmd, tagged_line_or_text(resp),
                resp.untagged_lines.size(), resp.literals.size(), uid};
            co_return fail<std::string>(errc::imap_parse_error, "FETCH returned no message body.", where.detail());
        }
        co_return ok(std::move(*literal));
    }

    /// UID STORE +FLAGS.SILENT (\Deleted) in batches.
    awaitable<result_void> uid_store_deleted(std::span<const std::uint32_t> uids)
    {
        for (std::size_t offset = 0; offset < uids.size(); offset += UID_BATCH)
        {
            const auto chunk = uids.subspan(offset, std::min(UID_BATCH, uids.size() - offset));
            std::string cmd;
            mailvault::detail::append_sv(cmd, "UID STORE ");
            mailvault::detail::append_sequence_set(cmd, chunk);
            mailvault::detail::append_sv(cmd, " +FLAGS.SILENT (\\Deleted)");
            MAILVAULT_CO_TRY_VOID(co_await command_impl(cmd));
        }
        co_return ok();
    }

    /**
    Permanently remove messages flagged \Deleted.

    With UIDPLUS only `uids` are expunged; otherwise a plain EXPUNGE removes
    every message flagged \Deleted in the mailbox.
    **/
    awaitable<result_void> expunge(std::span<const std::uint32_t> uids)
    {
        if (!capabilities_known_)
            MAILVAULT_CO_TRY_VOID(co_await capability());

        if (has_capability("UIDPLUS"))
        {
            for (std::size_t offset = 0; offset < uids.size(); offset += UID_BATCH)
            {
                const auto chunk = uids.subspan(offset, std::min(UID_BATCH, uids.size() - offset));
                std::string cmd;
                mailvault::detail::append_sv(cmd, "UID EXPUNGE ");
                mailvault::detail::append_sequence_set(cmd, chunk);
                MAILVAULT_CO_TRY_VOID(co_await command_impl(cmd));
            }
            co_return ok();
        }
        MAILVAULT_CO_TRY_VOID(co_await command_impl("EXPUNGE"));
        co_return ok();
    }

    awaitable<result<response>> noop()
    {
        co_return co_await command_impl("NOOP");
    }

    /// LOGOUT then close the socket; the client can connect again afterwards.
    awaitable<result_void> logout()
    {
        if (!dialog_.has_value())
            co_return ok();
        auto resp = co_await command_impl("LOGOUT");
        co_await dialog_->stream().shutdown();
        dialog_.reset();
        selected_.reset();
        if (!resp && resp.error().code != errc::imap_bye && !is_network_error(resp.error().code))
            co_return fail<void>(std::move(resp).error());
        co_return ok();
    }

private:
    [[nodiscard]] mailvault::detail::error_detail imap_detail(
        std::string_view tag,
        std::string_view command,
        std::string_view tagged_line,
        std::size_t untagged_count,
        std::size_t literals_count) const
    {
        return failure_context{remote_host_, tag, command, tagged_line, untagged_count, literals_count, std::nullopt}.detail();
    }

    [[nodiscard]] mailvault::detail::error_detail imap_detail(
        std::string_view tag,
        std::string_view command,
        std::string_view tagged_line,
        const response& resp) const
    {
        return imap_detail(tag, command, tagged_line, resp.untagged_lines.size(), resp.literals.size());
    }

    template<typename T>
    [[nodiscard]] result<T> imap_fail(
        error_kind kind,
        std::string_view message,
        std::string_view tag,
        std::string_view command,
        std::string_view tagged_line,
        const response& resp) const
    {
        return fail<T>(map_imap_error(kind), std::string(message), imap_detail(tag, command, tagged_line, resp));
    }

    [[nodiscard]] static std::string_view tagged_line_or_text(const response& resp) noexcept
    {
        if (!resp.tagged_lines.empty())
            return resp.tagged_lines.back();
        return resp.text;
    }

    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return fail<dialog_type*>(errc::imap_invalid_state, "Connection is not established.",
                imap_detail({}, "CONNECT", {}, 0, 0));
        return ok(&*dialog_);
    }

    result_void enforce_auth_tls_policy()
    {
        dialog_type* dlg = nullptr;
        MAILVAULT_TRY_ASSIGN(dlg, dialog_ptr());
        if (dlg->stream().is_tls())
            return ok();
        if (options_.allow_cleartext_auth)
        {
            MAILVAULT_WARN("imap: LOGIN without TLS allowed by configuration.");
            return ok();
        }
        return fail<void>(errc::tls_required,
            "TLS required for authentication; use tls_mode::implicit or tls_mode::starttls.",
            imap_detail({}, "LOGIN", "tls required", 0, 0));
    }

    awaitable<result<response>> read_greeting_impl()
    {
        dialog_type* dlg = nullptr;
        MAILVAULT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        std::string line;
        MAILVAULT_CO_TRY_ASSIGN(line, co_await dlg->read_line());
        response resp;
        handle_line(resp, line, std::string_view{});
        parse_capability_line(line);
        if (resp.st == status::bye)
            co_return imap_fail<response>(error_kind::bye, "Server refused the connection.", {}, "GREETING", line, resp);
        if (resp.st != status::ok && resp.st != status::preauth)
            co_return imap_fail<response>(error_kind::parse, "Unexpected IMAP greeting.", {}, "GREETING", line, resp);
        co_return ok(std::move(resp));
    }

    awaitable<result_void> start_tls_impl(ssl::context& context)
    {
        MAILVAULT_CO_TRY_VOID(co_await command_impl("STARTTLS"));

        dialog_type* dlg = nullptr;
        MAILVAULT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        const std::size_t max_len = dlg->max_line_length();
        const auto timeout = dlg->timeout();

        mailvault::net::upgradable_stream stream = std::move(dlg->stream());
        dialog_.reset();

        MAILVAULT_CO_TRY_VOID(co_await stream.start_tls(context, remote_host_, options_.tls));

        dialog_.emplace(std::move(stream), max_len, timeout);
        dialog_->set_trace_protocol("IMAP");
        capabilities_.clear();
        capabilities_known_ = false;
        co_return ok();
    }

    awaitable<result<response>> command_impl(std::string_view cmd)
    {
        MAILVAULT_CO_TRY_VOID(mailvault::detail::ensure_single_line(cmd, "command"));

        std::string tag = "A" + std::to_string(++tag_counter_);
        std::string line = tag;
        mailvault::detail::append_space(line);
        mailvault::detail::append_sv(line, cmd);

        dialog_type* dlg = nullptr;
        MAILVAULT_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILVAULT_CO_TRY_VOID(co_await dlg->write_line(line));

        response resp;
        resp.tag = tag;
        MAILVAULT_CO_TRY_VOID(co_await read_response_until_tag(*dlg, resp, tag, cmd));
        co_return finalize_response(std::move(resp), cmd);
    }

    awaitable<result_void> read_response_until_tag(dialog_type& dlg, response& resp, const std::string& tag,
        std::string_view command)
    {
        while (true)
        {
            std::string line;
            MAILVAULT_CO_TRY_ASSIGN(line, co_await dlg.read_line());
            handle_line(resp, line, tag);

            std::size_t literal_size = 0;
            if (extract_literal_size(line, literal_size))
            {
                if (literal_size > options_.max_literal_size)
                    co_return imap_fail<void>(error_kind::parse, "IMAP literal exceeds the configured limit.",
                        tag, command, line, resp);
                std::string literal;
                MAILVAULT_CO_TRY_ASSIGN(literal, co_await dlg.read_exactly(literal_size));
                resp.literals.push_back(std::move(literal));
            }

            if (is_tagged_line(line, tag))
                break;
        }
        co_return ok();
    }

    static bool extract_literal_size(std::string_view line, std::size_t& out)
    {
        if (line.size() < 3 || line.back() != '}')
            return false;

        const auto brace = line.rfind('{');
        if (brace == std::string_view::npos)
            return false;

        std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
        if (!inner.empty() && inner.back() == '+')
            inner.remove_suffix(1);
        if (inner.empty())
            return false;

        std::size_t value = 0;
        for (char ch : inner)
        {
            if (ch < '0' || ch > '9')
                return false;
            value = value * 10 + static_cast<std::size_t>(ch - '0');
        }

        out = value;
        return true;
    }

    static bool is_tagged_line(std::string_view line, std::string_view tag)
    {
        if (tag.empty() || line.size() <= tag.size())
            return false;
        return line.starts_with(tag) && line[tag.size()] == ' ';
    }

    static imap::status parse_status_word(std::string_view word)
    {
        using mailvault::detail::iequals_ascii;
        if (iequals_ascii(word, "OK"))
            return status::ok;
        if (iequals_ascii(word, "NO"))
            return status::no;
        if (iequals_ascii(word, "BAD"))
            return status::bad;
        if (iequals_ascii(word, "PREAUTH"))
            return status::preauth;
        if (iequals_ascii(word, "BYE"))
            return status::bye;
        return status::unknown;
    }

    static void handle_line(response& resp, const std::string& line, std::string_view tag)
    {
        if (!tag.empty() && is_tagged_line(line, tag))
        {
            resp.tagged_lines.push_back(line);
            auto [word, tail] = mailvault::detail::split_token(std::string_view(line).substr(tag.size()));
            resp.st = parse_status_word(word);
            resp.text.assign(tail.begin(), tail.end());
            return;
        }

        if (!line.empty() && line[0] == '*')
        {
            resp.untagged_lines.push_back(line);
            auto [word, tail] = mailvault::detail::split_token(std::string_view(line).substr(1));
            const imap::status st = parse_status_word(word);
            if (st == status::bye)
                resp.saw_bye = true;
            if (tag.empty() && st != status::unknown)
            {
                resp.st = st;
                resp.text.assign(tail.begin(), tail.end());
            }
            return;
        }

        if (!line.empty() && line[0] == '+')
        {
            resp.continuation.push_back(line);
            return;
        }

        resp.untagged_lines.push_back(line);
    }

    result<response> finalize_response(response&& resp, std::string_view command)
    {
        if (resp.st == status::no || resp.st == status::bad || resp.st == status::unknown)
        {
            const error_kind kind = rejection_kind(resp.st, resp.saw_bye, command);
            return imap_fail<response>(kind, rejection_message(kind), resp.tag, command, tagged_line_or_text(resp), resp);
        }
        return ok(std::move(resp));
    }

    // Literals are matched to the untagged lines that announced them, in order.
    static std::optional<std::string> select_fetch_literal(const response& resp, std::string_view marker)
    {
        std::size_t literal_index = 0;
        for (const auto& line : resp.untagged_lines)
        {
            std::size_t literal_size = 0;
            if (!extract_literal_size(line, literal_size))
                continue;
            if (literal_index >= resp.literals.size())
                break;
            const std::string upper_line = mailvault::detail::to_upper_copy(line);
            if (upper_line.find(mailvault::detail::to_upper_copy(marker)) != std::string::npos)
                return resp.literals[literal_index];
            ++literal_index;
        }
        return std::nullopt;
    }

    void parse_capability_line(std::string_view line)
    {
        const std::string upper = mailvault::detail::to_upper_copy(line);
        auto pos = upper.find("CAPABILITY");
        if (pos == std::string::npos)
            return;
        std::string_view rest = std::string_view(line).substr(pos + std::string_view("CAPABILITY").size());
        const auto bracket = rest.find(']');
        if (bracket != std::string_view::npos)
            rest = rest.substr(0, bracket);

        std::vector<std::string_view> tokens;
        mailvault::detail::split_tokens(rest, tokens);
        for (auto token : tokens)
        {
            if (!has_capability(token))
                capabilities_.push_back(mailvault::detail::to_upper_copy(token));
        }
        if (!tokens.empty())
            capabilities_known_ = true;
    }

    executor_type executor_;
    options options_;
    std::optional<dialog_type> dialog_;
    std::string remote_host_;
    std::uint32_t tag_counter_ = 0;
    std::vector<std::string> capabilities_;
    bool capabilities_known_ = false;
    bool preauth_ = false;
    std::optional<std::string> selected_;
    bool read_only_ = true;
};

} // namespace mailvault::imap
