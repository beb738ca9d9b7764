/*

encoded_word.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header value decoding: RFC 2047 encoded words and RFC 2231 extended
parameter values.

*/


#pragma once

#include <string>
#include <string_view>
#include <boost/algorithm/string.hpp>

#include <mailvault/codec/base64.hpp>
#include <mailvault/codec/quoted_printable.hpp>

namespace mailvault::codec
{

/**
Convert text in `charset` to UTF-8.

UTF-8 and US-ASCII pass through; ISO-8859-1 and its Windows superset are
widened byte by byte. Other charsets are returned unchanged, since the result
only feeds display and file name sanitizing.
**/
[[nodiscard]] inline std::string to_utf8(std::string_view text, std::string_view charset)
{
    const bool latin1 = boost::algorithm::iequals(charset, "iso-8859-1") ||
        boost::algorithm::iequals(charset, "latin1") ||
        boost::algorithm::iequals(charset, "windows-1252") ||
        boost::algorithm::iequals(charset, "cp1252");
    if (!latin1)
        return std::string(text);

    std::string out;
    out.reserve(text.size() * 2);
    for (char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80)
        {
            out.push_back(ch);
            continue;
        }
        out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
        out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
    return out;
}

namespace encoded_word_detail
{

/// Decode one `=?charset?E?text?=` token; returns false when `token` is not a valid encoded word.
inline bool decode_word(std::string_view token, std::string& out)
{
    if (token.size() < 8 || !token.starts_with("=?") || !token.ends_with("?="))
        return false;
    std::string_view inner = token.substr(2, token.size() - 4);
    const auto q1 = inner.find('?');
    if (q1 == std::string_view::npos || q1 + 2 >= inner.size() || inner[q1 + 2] != '?')
        return false;
    std::string_view charset = inner.substr(0, q1);
    // RFC 2231 language suffix: charset*lang
    if (const auto star = charset.find('*'); star != std::string_view::npos)
        charset = charset.substr(0, star);
    const char encoding = inner[q1 + 1];
    const std::string_view payload = inner.substr(q1 + 3);

    std::string decoded;
    if (encoding == 'B' || encoding == 'b')
    {
        auto res = decode_base64(payload);
        if (!res)
            return false;
        decoded = std::move(*res);
    }
    else if (encoding == 'Q' || encoding == 'q')
    {
        decoded = decode_quoted_printable(payload, true);
    }
    else
    {
        return false;
    }
    out += to_utf8(decoded, charset);
    return true;
}

} // namespace encoded_word_detail

/**
Decode every RFC 2047 encoded word in a header value.

Whitespace between two adjacent encoded words is dropped; malformed encoded
words are kept as literal text.
**/
[[nodiscard]] inline std::string decode_header_value(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    bool last_was_word = false;

    while (pos < value.size())
    {
        const auto start = value.find("=?", pos);
        if (start == std::string_view::npos)
        {
            out.append(value.substr(pos));
            break;
        }

        // Locate the end "?=" after charset and encoding sections.
        std::size_t end = std::string_view::npos;
        const auto q1 = value.find('?', start + 2);
        if (q1 != std::string_view::npos && q1 + 2 < value.size() && value[q1 + 2] == '?')
            end = value.find("?=", q1 + 3);

        std::string_view between = value.substr(pos, start - pos);
        if (end == std::string_view::npos)
        {
            out.append(value.substr(pos));
            break;
        }

        const std::string_view token = value.substr(start, end + 2 - start);
        std::string decoded;
        const bool blank_between = between.find_first_not_of(" \t\r\n") == std::string_view::npos;
        if (encoded_word_detail::decode_word(token, decoded))
        {
            if (!(last_was_word && blank_between))
                out.append(between);
            out += decoded;
            last_was_word = true;
        }
        else
        {
            out.append(between);
            out.append(token);
            last_was_word = false;
        }
        pos = end + 2;
    }
    return out;
}

/**
Decode an RFC 2231 extended value: `charset'language'percent-encoded`.

Values without the two quote separators are only percent-decoded.
**/
[[nodiscard]] inline std::string decode_extended_value(std::string_view value)
{
    std::string_view charset;
    const auto first = value.find('\'');
    if (first != std::string_view::npos)
    {
        const auto second = value.find('\'', first + 1);
        if (second != std::string_view::npos)
        {
            charset = value.substr(0, first);
            value = value.substr(second + 1);
        }
    }

    std::string raw;
    raw.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size())
        {
            const int hi = hex_value(value[i + 1]);
            const int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                raw.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        raw.push_back(value[i]);
    }
    return charset.empty() ? raw : to_utf8(raw, charset);
}

} // namespace mailvault::codec
