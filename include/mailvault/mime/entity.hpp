/*

entity.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Read-only MIME entity parser: headers, parameters, multipart structure and
transfer decoding of leaf bodies.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>

#include <mailvault/codec/base64.hpp>
#include <mailvault/codec/encoded_word.hpp>
#include <mailvault/codec/quoted_printable.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::mime
{

/// Nesting depth beyond which a message is rejected as malformed.
inline constexpr int MAX_NESTING_DEPTH = 32;

struct header_field
{
    std::string name;
    std::string value;   ///< unfolded, raw (not RFC 2047 decoded)
};

/// Parameter map keyed by lower case name; values are unquoted and RFC 2231 decoded.
using parameters = std::map<std::string, std::string>;

/**
Split `type/subtype; key=value; ...` into the leading value and its parameters.

RFC 2231 continuations (`name*0`, `name*1*`) are joined and extended values
(`name*=charset''text`) decoded.
**/
inline std::string parse_parameterized(std::string_view header_value, parameters& params)
{
    params.clear();
    std::map<std::string, std::map<int, std::pair<std::string, bool>>> sections;

    auto next_separator = [](std::string_view text) -> std::size_t
    {
        bool quoted = false;
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '\\' && quoted)
            {
                ++i;
                continue;
            }
            if (text[i] == '"')
                quoted = !quoted;
            else if (text[i] == ';' && !quoted)
                return i;
        }
        return std::string_view::npos;
    };

    std::size_t sep = next_separator(header_value);
    std::string value(detail::trim(header_value.substr(0, sep)));
    while (sep != std::string_view::npos)
    {
        header_value = header_value.substr(sep + 1);
        sep = next_separator(header_value);
        const std::string_view item = detail::trim(header_value.substr(0, sep));
        const auto eq = item.find('=');
        if (eq == std::string_view::npos)
            continue;

        std::string key = detail::to_lower_copy(detail::trim(item.substr(0, eq)));
        std::string_view raw = detail::trim(item.substr(eq + 1));
        std::string val;
        if (!raw.empty() && raw.front() == '"')
        {
            for (std::size_t i = 1; i < raw.size() && raw[i] != '"'; ++i)
            {
                if (raw[i] == '\\' && i + 1 < raw.size())
                    ++i;
                val.push_back(raw[i]);
            }
        }
        else
        {
            val.assign(raw.begin(), raw.end());
        }

        bool extended = false;
        if (!key.empty() && key.back() == '*')
        {
            extended = true;
            key.pop_back();
        }
        int index = -1;
        if (const auto star = key.find('*'); star != std::string::npos)
        {
            const std::string digits = key.substr(star + 1);
            if (!digits.empty() && std::all_of(digits.begin(), digits.end(), detail::is_digit_ascii))
            {
                index = std::stoi(digits);
                key.resize(star);
            }
        }

        if (index < 0)
        {
            params[key] = extended ? codec::decode_extended_value(val) : val;
            continue;
        }
        sections[key][index] = {std::move(val), extended};
    }

    for (auto& [key, parts] : sections)
    {
        // Only the first section carries charset'language'; later ones are percent-encoded text.
        std::string joined;
        bool any_extended = false;
        for (auto& [index, part] : parts)
        {
            any_extended |= part.second;
            joined += part.first;
        }
        params[key] = any_extended ? codec::decode_extended_value(joined) : joined;
    }
    return value;
}

/**
Parse an RFC 5322 date such as `Tue, 1 Jul 2003 10:52:37 +0200` into UTC.

The day of week is optional; obsolete zone names (GMT, UT, EST...) are
accepted. Returns nothing when the value cannot be interpreted.
**/
[[nodiscard]] inline std::optional<std::chrono::sys_seconds> parse_date(std::string_view text)
{
    using namespace std::chrono;
    std::vector<std::string_view> tokens;
    std::string cleaned(text);
    std::replace(cleaned.begin(), cleaned.end(), ',', ' ');
    std::replace(cleaned.begin(), cleaned.end(), '\t', ' ');
    detail::split_tokens(cleaned, tokens);
    if (!tokens.empty() && !tokens.front().empty() && !detail::is_digit_ascii(tokens.front().front()))
        tokens.erase(tokens.begin());
    if (tokens.size() < 4)
        return std::nullopt;

    static constexpr std::string_view months[] = {"jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"};
    auto to_int = [](std::string_view s, int& out)
    {
        if (s.empty() || !std::all_of(s.begin(), s.end(), detail::is_digit_ascii))
            return false;
        out = std::stoi(std::string(s));
        return true;
    };

    int d = 0, y = 0, hh = 0, mm = 0, ss = 0;
    if (!to_int(tokens[0], d) || !to_int(tokens[2], y))
        return std::nullopt;
    unsigned mon = 0;
    for (unsigned i = 0; i < 12; ++i)
    {
        if (detail::iequals_ascii(tokens[1].substr(0, 3), months[i]))
            mon = i + 1;
    }
    if (mon == 0)
        return std::nullopt;
    if (y < 50)
        y += 2000;
    else if (y < 100)
        y += 1900;

    std::vector<std::string> hms;
    boost::algorithm::split(hms, std::string(tokens[3]), boost::algorithm::is_any_of(":"));
    if (hms.size() < 2 || !to_int(hms[0], hh) || !to_int(hms[1], mm) || (hms.size() > 2 && !to_int(hms[2], ss)))
        return std::nullopt;

    const year_month_day ymd{year{y}, month{mon}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60)
        return std::nullopt;
    sys_seconds stamp = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss};

    if (tokens.size() > 4)
    {
        const std::string_view zone = tokens[4];
        int offset_minutes = 0;
        if ((zone.front() == '+' || zone.front() == '-') && zone.size() == 5)
        {
            int hhmm = 0;
            if (!to_int(zone.substr(1), hhmm))
                return std::nullopt;
            offset_minutes = (hhmm / 100) * 60 + hhmm % 100;
            if (zone.front() == '-')
                offset_minutes = -offset_minutes;
        }
        else
        {
            static constexpr std::pair<std::string_view, int> zones[] = {{"EDT", -4 * 60}, {"EST", -5 * 60},
                {"CDT", -5 * 60}, {"CST", -6 * 60}, {"MDT", -6 * 60}, {"MST", -7 * 60}, {"PDT", -7 * 60},
                {"PST", -8 * 60}};
            for (const auto& [name, minutes_east] : zones)
            {
                if (detail::iequals_ascii(zone, name))
                    offset_minutes = minutes_east;
            }
        }
        stamp -= minutes{offset_minutes};
    }
    return stamp;
}

/**
One MIME entity: a message or a body part.

The entity keeps its own copy of its raw body; leaf bodies are transfer
decoded on demand through decoded_body().
**/
class entity
{
public:
    /**
    Parse a raw message or body part.

    @param raw   Bytes of the entity, CRLF or LF line endings.
    @param depth Current nesting depth.
    @return      Parsed entity or errc::mime_parse_error.
    **/
    [[nodiscard]] static result<entity> parse(std::string_view raw, int depth = 0)
    {
        if (depth > MAX_NESTING_DEPTH)
            return fail<entity>(errc::mime_parse_error, "MIME nesting too deep.");
        if (depth == 0 && detail::trim(raw).empty())
            return fail<entity>(errc::mime_parse_error, "Empty message.");

        entity ent;
        std::string_view rest = raw;
        std::string current;
        while (!rest.empty())
        {
            const auto eol = rest.find('\n');
            std::string_view line = rest.substr(0, eol);
            rest = eol == std::string_view::npos ? std::string_view{} : rest.substr(eol + 1);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            if (line.empty())
                break;
            if ((line.front() == ' ' || line.front() == '\t') && !current.empty())
            {
                current.push_back(' ');
                current.append(detail::trim(line));
                continue;
            }
            if (!current.empty())
                ent.add_header_line(current);
            current.assign(line.begin(), line.end());
        }
        if (!current.empty())
            ent.add_header_line(current);
        ent.body_.assign(rest.begin(), rest.end());

        ent.media_type_ = "text/plain";
        if (auto ct = ent.header("Content-Type"))
        {
            std::string type = detail::to_lower_copy(parse_parameterized(*ct, ent.content_type_params_));
            if (type.find('/') != std::string::npos)
                ent.media_type_ = std::move(type);
        }
        if (auto cd = ent.header("Content-Disposition"))
            ent.disposition_ = detail::to_lower_copy(parse_parameterized(*cd, ent.disposition_params_));
        if (auto cte = ent.header("Content-Transfer-Encoding"))
            ent.transfer_encoding_ = detail::to_lower_copy(detail::trim(*cte));

        if (ent.is_multipart())
            MAILVAULT_TRY_VOID(ent.split_parts(depth));
        return ok(std::move(ent));
    }

    [[nodiscard]] const std::vector<header_field>& headers() const noexcept { return headers_; }

    /// First header with the given name (case insensitive), unfolded and undecoded.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const
    {
        for (const auto& field : headers_)
        {
            if (detail::iequals_ascii(field.name, name))
                return std::string_view(field.value);
        }
        return std::nullopt;
    }

    /// Lower case `type/subtype`; text/plain when absent.
    [[nodiscard]] const std::string& media_type() const noexcept { return media_type_; }

    [[nodiscard]] std::optional<std::string> content_type_param(std::string_view name) const
    {
        return find_param(content_type_params_, name);
    }

    /// Lower case disposition type (attachment, inline) or empty.
    [[nodiscard]] const std::string& disposition() const noexcept { return disposition_; }

    [[nodiscard]] std::optional<std::string> disposition_param(std::string_view name) const
    {
        return find_param(disposition_params_, name);
    }

    [[nodiscard]] const std::string& transfer_encoding() const noexcept { return transfer_encoding_; }

    [[nodiscard]] bool is_multipart() const
    {
        return boost::algorithm::istarts_with(media_type_, "multipart/");
    }

    [[nodiscard]] const std::vector<entity>& parts() const noexcept { return parts_; }

    [[nodiscard]] const std::string& raw_body() const noexcept { return body_; }

    /// Body with the Content-Transfer-Encoding removed.
    [[nodiscard]] result<std::string> decoded_body() const
    {
        if (transfer_encoding_ == "base64")
        {
            auto decoded = codec::decode_base64(body_);
            if (!decoded)
            {
                auto err = std::move(decoded).error();
                err.code = errc::mime_parse_error;
                err.message = "Malformed base64 body.";
                return fail<std::string>(std::move(err));
            }
            return decoded;
        }
        if (transfer_encoding_ == "quoted-printable")
            return ok(codec::decode_quoted_printable(body_));
        return ok(body_);
    }

    /// Decoded Subject header, empty when absent.
    [[nodiscard]] std::string subject() const
    {
        auto value = header("Subject");
        return value ? codec::decode_header_value(*value) : std::string{};
    }

    /// Date header interpreted in UTC.
    [[nodiscard]] std::optional<std::chrono::sys_seconds> date() const
    {
        auto value = header("Date");
        if (!value)
            return std::nullopt;
        return parse_date(*value);
    }

    /// File name from Content-Disposition `filename`, else Content-Type `name`, decoded.
    [[nodiscard]] std::optional<std::string> filename() const
    {
        auto name = disposition_param("filename");
        if (!name || name->empty())
            name = content_type_param("name");
        if (!name || name->empty())
            return std::nullopt;
        return codec::decode_header_value(*name);
    }

    /// Attachment: disposition attachment or inline, with a file name.
    [[nodiscard]] bool is_attachment() const
    {
        if (is_multipart())
            return false;
        if (disposition_ != "attachment" && disposition_ != "inline")
            return false;
        return filename().has_value();
    }

    /// Depth-first walk collecting attachment leaves.
    void collect_attachments(std::vector<const entity*>& out) const
    {
        if (is_attachment())
            out.push_back(this);
        for (const auto& part : parts_)
            part.collect_attachments(out);
    }

private:
    static std::optional<std::string> find_param(const parameters& params, std::string_view name)
    {
        auto it = params.find(detail::to_lower_copy(name));
        if (it == params.end())
            return std::nullopt;
        return it->second;
    }

    void add_header_line(std::string_view line)
    {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return;
        headers_.push_back(header_field{
            std::string(detail::trim(line.substr(0, colon))),
            std::string(detail::trim(line.substr(colon + 1)))});
    }

    result_void split_parts(int depth)
    {
        auto boundary = content_type_param("boundary");
        if (!boundary || boundary->empty())
            return fail<void>(errc::mime_parse_error, "Multipart entity without boundary.");

        const std::string delimiter = "--" + *boundary;
        std::string_view body = body_;
        std::vector<std::string_view> chunks;
        std::size_t part_start = std::string_view::npos;
        bool closed = false;

        std::size_t pos = 0;
        while (pos < body.size())
        {
            const auto eol = body.find('\n', pos);
            const std::size_t line_end = eol == std::string_view::npos ? body.size() : eol;
            std::string_view line = body.substr(pos, line_end - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            const std::size_t next = eol == std::string_view::npos ? body.size() : eol + 1;

            if (line.starts_with(delimiter))
            {
                std::string_view tail = detail::trim(line.substr(delimiter.size()));
                const bool is_close = tail.starts_with("--");
                if (is_close || tail.empty())
                {
                    if (part_start != std::string_view::npos)
                    {
                        // The line break before the delimiter belongs to the delimiter.
                        std::size_t end = pos;
                        if (end > part_start && body[end - 1] == '\n')
                            --end;
                        if (end > part_start && body[end - 1] == '\r')
                            --end;
                        chunks.push_back(body.substr(part_start, end - part_start));
                    }
                    if (is_close)
                    {
                        closed = true;
                        break;
                    }
                    part_start = next;
                }
            }
            pos = next;
        }
        if (!closed && part_start != std::string_view::npos && part_start <= body.size())
            chunks.push_back(body.substr(part_start));
        if (chunks.empty())
            return fail<void>(errc::mime_parse_error, "Multipart entity without parts.", *boundary);

        for (auto chunk : chunks)
        {
            entity part;
            MAILVAULT_TRY_ASSIGN(part, parse(chunk, depth + 1));
            parts_.push_back(std::move(part));
        }
        return ok();
    }

    std::vector<header_field> headers_;
    std::string media_type_;
    parameters content_type_params_;
    std::string disposition_;
    parameters disposition_params_;
    std::string transfer_encoding_;
    std::string body_;
    std::vector<entity> parts_;
};

} // namespace mailvault::mime
