/*

error_mapping.hpp
-----------------

Turns a failed IMAP exchange into an errc and a detail block.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <mailvault/detail/error_detail.hpp>
#include <mailvault/detail/redact.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/imap/types.hpp>

namespace mailvault::imap
{

enum class error_kind
{
    tagged_no,
    tagged_bad,
    bye,
    auth_rejected,
    continuation_expected,
    parse
};

[[nodiscard]] constexpr errc map_imap_error(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::tagged_no: return errc::imap_tagged_no;
        case error_kind::tagged_bad: return errc::imap_tagged_bad;
        case error_kind::bye: return errc::imap_bye;
        case error_kind::auth_rejected: return errc::imap_auth_failed;
        case error_kind::continuation_expected: return errc::imap_continuation_expected;
        case error_kind::parse: return errc::imap_parse_error;
    }
    return errc::imap_parse_error;
}

/**
Kind of a completed response that did not end in OK.

A NO to LOGIN is a refused credential, not a refused command; a response
without a tagged status either followed a BYE or could not be parsed.
**/
[[nodiscard]] constexpr error_kind rejection_kind(status st, bool saw_bye, std::string_view command) noexcept
{
    switch (st)
    {
        case status::no:
            return command.starts_with("LOGIN ") || command == "LOGIN" ? error_kind::auth_rejected : error_kind::tagged_no;
        case status::bad:
            return error_kind::tagged_bad;
        case status::bye:
            return error_kind::bye;
        default:
            return saw_bye ? error_kind::bye : error_kind::parse;
    }
}

[[nodiscard]] constexpr std::string_view rejection_message(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::tagged_no: return "IMAP tagged NO.";
        case error_kind::tagged_bad: return "IMAP tagged BAD.";
        case error_kind::bye: return "IMAP server closed the session.";
        case error_kind::auth_rejected: return "IMAP authentication rejected.";
        case error_kind::continuation_expected: return "IMAP continuation expected.";
        case error_kind::parse: return "IMAP parse error.";
    }
    return "IMAP parse error.";
}

/// Where an IMAP exchange failed; credentials in `command` never reach the detail.
struct failure_context
{
    std::string_view host;
    std::string_view tag;
    std::string_view command;
    std::string_view server_line;
    std::size_t untagged = 0;
    std::size_t literals = 0;
    std::optional<std::uint32_t> uid;

    [[nodiscard]] mailvault::detail::error_detail detail() const
    {
        mailvault::detail::error_detail out;
        out.add("proto", "imap");
        if (!host.empty())
            out.add("host", host);
        if (!tag.empty())
            out.add("tag", tag);
        out.add("command", mailvault::detail::redact_line(command));
        if (!server_line.empty())
            out.add("server", server_line);
        out.add("untagged", untagged);
        out.add("literals", literals);
        if (uid.has_value())
            out.add("uid", *uid);
        return out;
    }
};

} // namespace mailvault::imap
