/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

IMAP response model and the line parsers the client relies on.

*/

#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailvault/detail/append.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/sanitize.hpp>
#include <mailvault/imap/utf7.hpp>
#include <mailvault/net/dialog.hpp>
#include <mailvault/net/tls_mode.hpp>
#include <mailvault/net/tls_options.hpp>

namespace mailvault::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

struct credentials
{
    std::string username;
    std::string secret;
};

/// Quote a string for use as an IMAP astring.
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    MAILVAULT_TRY_VOID(mailvault::detail::ensure_single_line(text, "astring"));
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return ok(std::move(out));
}

/// Quote a UTF-8 mailbox name after converting it to modified UTF-7.
[[nodiscard]] inline result<std::string> to_mailbox(std::string_view utf8_mailbox)
{
    std::string encoded;
    MAILVAULT_TRY_ASSIGN(encoded, encode_modified_utf7(utf8_mailbox));
    return to_astring(encoded);
}

struct mailbox_stat
{
    std::uint32_t messages_no = 0;
    std::uint32_t recent = 0;
    std::uint32_t uid_next = 0;
    std::uint32_t uid_validity = 0;
};

/// Result of `STATUS mailbox (MESSAGES UNSEEN)`; absent items stay empty.
struct status_counts
{
    std::optional<std::uint32_t> messages;
    std::optional<std::uint32_t> unseen;
};

struct mailbox_folder
{
    std::string name;        ///< UTF-8, decoded from modified UTF-7
    std::string wire_name;   ///< as sent by the server
    char delimiter = '/';
    std::vector<std::string> attributes;

    [[nodiscard]] bool selectable() const noexcept
    {
        for (const auto& attr : attributes)
        {
            if (detail::iequals_ascii(attr, "\\Noselect") || detail::iequals_ascii(attr, "\\NonExistent"))
                return false;
        }
        return true;
    }
};

/// Metadata returned by `UID FETCH (UID INTERNALDATE RFC822.SIZE)`.
struct fetch_summary
{
    std::uint32_t seq = 0;
    std::uint32_t uid = 0;
    std::chrono::sys_seconds internal_date{};
    std::uint64_t size = 0;
};

struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<std::string> untagged_lines;
    std::vector<std::string> continuation;
    std::vector<std::string> tagged_lines;
    std::vector<std::string> literals;
    bool saw_bye = false;
};

struct options
{
    std::size_t max_line_length = mailvault::net::DEFAULT_MAX_LINE_LENGTH;
    std::size_t max_literal_size = 512 * 1024 * 1024;
    std::optional<std::chrono::steady_clock::duration> timeout = std::nullopt;
    bool allow_cleartext_auth = false;
    mailvault::net::tls_options tls;
};

namespace detail
{
    using mailvault::detail::iequals_ascii;
    using mailvault::detail::ltrim;
    using mailvault::detail::split_token;

    [[nodiscard]] inline bool parse_uint32(std::string_view token, std::uint32_t& out) noexcept
    {
        if (token.empty())
            return false;
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    [[nodiscard]] inline bool parse_uint64(std::string_view token, std::uint64_t& out) noexcept
    {
        if (token.empty())
            return false;
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    inline constexpr std::array<std::string_view, 12> MONTHS{
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    [[nodiscard]] inline int month_index(std::string_view name) noexcept
    {
        for (std::size_t i = 0; i < MONTHS.size(); ++i)
        {
            if (iequals_ascii(name, MONTHS[i]))
                return static_cast<int>(i) + 1;
        }
        return 0;
    }

    /// Quoted string or atom; leaves `text` positioned after the token.
    [[nodiscard]] inline bool parse_quoted_or_atom(std::string_view& text, std::string& out)
    {
        text = ltrim(text);
        if (text.empty())
            return false;
        out.clear();
        if (text.front() != '"')
        {
            auto pos = text.find_first_of(" )");
            std::string_view token = pos == std::string_view::npos ? text : text.substr(0, pos);
            out.assign(token.begin(), token.end());
            text = pos == std::string_view::npos ? std::string_view{} : ltrim(text.substr(pos));
            return true;
        }
        text.remove_prefix(1);
        while (!text.empty())
        {
            char ch = text.front();
            text.remove_prefix(1);
            if (ch == '"')
            {
                text = ltrim(text);
                return true;
            }
            if (ch == '\\' && !text.empty())
            {
                out.push_back(text.front());
                text.remove_prefix(1);
                continue;
            }
            out.push_back(ch);
        }
        return false;
    }
} // namespace detail

/**
Parse an IMAP date-time such as `01-Jan-2023 10:00:00 +0100` into UTC.

Day may be space padded (` 1-Jan-2023`) as servers are allowed to send it.
**/
[[nodiscard]] inline std::optional<std::chrono::sys_seconds> parse_internal_date(std::string_view text)
{
    using namespace std::chrono;
    text = mailvault::detail::trim(text);
    std::string padded;
    if (text.size() == 25 && text[1] == '-')
    {
        padded = "0";
        padded.append(text);
        text = padded;
    }
    if (text.size() < 26)
        return std::nullopt;

    std::uint32_t day = 0, yr = 0, hh = 0, mm = 0, ss = 0, off_h = 0, off_m = 0;
    if (!detail::parse_uint32(text.substr(0, 2), day) || text[2] != '-' || text[6] != '-' || text[11] != ' ')
        return std::nullopt;
    const int mon = detail::month_index(text.substr(3, 3));
    if (mon == 0)
        return std::nullopt;
    if (!detail::parse_uint32(text.substr(7, 4), yr) ||
        !detail::parse_uint32(text.substr(12, 2), hh) || text[14] != ':' ||
        !detail::parse_uint32(text.substr(15, 2), mm) || text[17] != ':' ||
        !detail::parse_uint32(text.substr(18, 2), ss) || text[20] != ' ')
        return std::nullopt;
    const char sign = text[21];
    if ((sign != '+' && sign != '-') ||
        !detail::parse_uint32(text.substr(22, 2), off_h) ||
        !detail::parse_uint32(text.substr(24, 2), off_m))
        return std::nullopt;

    const year_month_day ymd{year{static_cast<int>(yr)}, month{static_cast<unsigned>(mon)}, std::chrono::day{day}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60)
        return std::nullopt;

    sys_seconds local = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss};
    const seconds offset = hours{off_h} + minutes{off_m};
    return sign == '+' ? local - offset : local + offset;
}

/// Format a date for SEARCH criteria: `1-Jul-2023`.
[[nodiscard]] inline std::string format_search_date(std::chrono::year_month_day ymd)
{
    std::string out;
    mailvault::detail::append_uint(out, static_cast<unsigned>(ymd.day()));
    out.push_back('-');
    out.append(detail::MONTHS[static_cast<unsigned>(ymd.month()) - 1]);
    out.push_back('-');
    mailvault::detail::append_uint(out, static_cast<std::uint64_t>(static_cast<int>(ymd.year())));
    return out;
}

[[nodiscard]] inline bool parse_exists(std::string_view line, std::uint32_t& out)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [num, rest2] = detail::split_token(rest);
    if (!detail::parse_uint32(num, out))
        return false;
    auto [keyword, rest3] = detail::split_token(rest2);
    (void)rest3;
    return detail::iequals_ascii(keyword, "EXISTS");
}

[[nodiscard]] inline bool parse_ok_item(std::string_view line, std::string_view key, std::uint32_t& out)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [ok_word, rest2] = detail::split_token(rest);
    if (!detail::iequals_ascii(ok_word, "OK"))
        return false;
    if (rest2.empty() || rest2.front() != '[')
        return false;
    auto close = rest2.find(']');
    if (close == std::string_view::npos)
        return false;
    std::string_view inner = rest2.substr(1, close - 1);
    auto [inner_key, inner_rest] = detail::split_token(inner);
    if (!detail::iequals_ascii(inner_key, key))
        return false;
    auto [value_token, ignored] = detail::split_token(inner_rest);
    (void)ignored;
    return detail::parse_uint32(value_token, out);
}

inline void parse_mailbox_stat(std::string_view line, mailbox_stat& stat)
{
    std::uint32_t value = 0;
    if (parse_exists(line, value))
    {
        stat.messages_no = value;
        return;
    }
    if (parse_ok_item(line, "UIDNEXT", value))
    {
        stat.uid_next = value;
        return;
    }
    if (parse_ok_item(line, "UIDVALIDITY", value))
    {
        stat.uid_validity = value;
        return;
    }
}

[[nodiscard]] inline std::vector<std::uint32_t> parse_search_ids(std::string_view line)
{
    std::vector<std::uint32_t> ids;
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return ids;
    auto [keyword, rest2] = detail::split_token(rest);
    if (!detail::iequals_ascii(keyword, "SEARCH"))
        return ids;
    while (!rest2.empty())
    {
        auto [id_token, remaining] = detail::split_token(rest2);
        std::uint32_t value = 0;
        if (!detail::parse_uint32(id_token, value))
            break;
        ids.push_back(value);
        rest2 = remaining;
    }
    return ids;
}

/// Parse `* LIST (\HasNoChildren) "/" "INBOX"`.
[[nodiscard]] inline bool parse_list_line(std::string_view line, mailbox_folder& folder)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [keyword, rest2] = detail::split_token(rest);
    if (!detail::iequals_ascii(keyword, "LIST"))
        return false;
    if (rest2.empty() || rest2.front() != '(')
        return false;
    auto close = rest2.find(')');
    if (close == std::string_view::npos)
        return false;

    folder.attributes.clear();
    std::vector<std::string_view> attrs;
    mailvault::detail::split_tokens(rest2.substr(1, close - 1), attrs);
    for (auto attr : attrs)
        folder.attributes.emplace_back(attr);

    rest2 = detail::ltrim(rest2.substr(close + 1));
    std::string delimiter_token;
    if (!detail::parse_quoted_or_atom(rest2, delimiter_token))
        return false;
    if (!delimiter_token.empty() && !detail::iequals_ascii(delimiter_token, "NIL"))
        folder.delimiter = delimiter_token.front();
    else
        folder.delimiter = '\0';

    std::string name_token;
    if (!detail::parse_quoted_or_atom(rest2, name_token))
        return false;
    folder.wire_name = name_token;
    auto decoded = decode_modified_utf7(name_token);
    folder.name = decoded ? std::move(*decoded) : std::move(name_token);
    return true;
}

/// Parse `* STATUS "INBOX" (MESSAGES 3 UNSEEN 1)`.
[[nodiscard]] inline bool parse_status_line(std::string_view line, status_counts& counts)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [keyword, rest2] = detail::split_token(rest);
    if (!detail::iequals_ascii(keyword, "STATUS"))
        return false;
    const auto open = rest2.rfind('(');
    const auto close = rest2.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open)
        return false;

    std::vector<std::string_view> items;
    mailvault::detail::split_tokens(rest2.substr(open + 1, close - open - 1), items);
    for (std::size_t i = 0; i + 1 < items.size(); i += 2)
    {
        std::uint32_t value = 0;
        if (!detail::parse_uint32(items[i + 1], value))
            continue;
        if (detail::iequals_ascii(items[i], "MESSAGES"))
            counts.messages = value;
        else if (detail::iequals_ascii(items[i], "UNSEEN"))
            counts.unseen = value;
    }
    return true;
}

/// Parse `* 4 FETCH (UID 10 INTERNALDATE "..." RFC822.SIZE 1234)`.
[[nodiscard]] inline bool parse_fetch_summary(std::string_view line, fetch_summary& out)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return false;
    auto [seq, rest2] = detail::split_token(rest);
    if (!detail::parse_uint32(seq, out.seq))
        return false;
    auto [keyword, rest3] = detail::split_token(rest2);
    if (!detail::iequals_ascii(keyword, "FETCH"))
        return false;
    if (rest3.empty() || rest3.front() != '(')
        return false;
    rest3.remove_prefix(1);

    bool have_uid = false;
    bool have_date = false;
    while (!rest3.empty() && rest3.front() != ')')
    {
        std::string name;
        if (!detail::parse_quoted_or_atom(rest3, name))
            break;
        rest3 = detail::ltrim(rest3);
        if (!rest3.empty() && rest3.front() == '(')
        {
            // Parenthesized item (FLAGS) is not needed here.
            const auto group_end = rest3.find(')');
            if (group_end == std::string_view::npos)
                return false;
            rest3 = detail::ltrim(rest3.substr(group_end + 1));
            continue;
        }
        std::string value;
        if (!detail::parse_quoted_or_atom(rest3, value))
            return false;
        if (detail::iequals_ascii(name, "UID"))
        {
            have_uid = detail::parse_uint32(value, out.uid);
        }
        else if (detail::iequals_ascii(name, "INTERNALDATE"))
        {
            auto parsed = parse_internal_date(value);
            if (parsed)
            {
                out.internal_date = *parsed;
                have_date = true;
            }
        }
        else if (detail::iequals_ascii(name, "RFC822.SIZE"))
        {
            if (!detail::parse_uint64(value, out.size))
                return false;
        }
    }
    return have_uid && have_date;
}

} // namespace mailvault::imap
