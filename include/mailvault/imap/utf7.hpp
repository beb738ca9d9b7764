/*

utf7.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Modified UTF-7 mailbox names (RFC 3501 section 5.1.3).

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailvault/detail/result.hpp>

namespace mailvault::imap
{

namespace utf7_detail
{

inline constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

inline int base64_value(char ch) noexcept
{
    if (ch >= 'A' && ch <= 'Z')
        return ch - 'A';
    if (ch >= 'a' && ch <= 'z')
        return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9')
        return ch - '0' + 52;
    if (ch == '+')
        return 62;
    if (ch == ',')
        return 63;
    return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Decode one UTF-8 sequence starting at `i`; returns false on malformed input.
inline bool next_code_point(std::string_view text, std::size_t& i, std::uint32_t& cp) noexcept
{
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    if (lead < 0x80)
    {
        cp = lead;
    }
    else if ((lead & 0xE0) == 0xC0)
    {
        cp = lead & 0x1F;
        extra = 1;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        cp = lead & 0x0F;
        extra = 2;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        cp = lead & 0x07;
        extra = 3;
    }
    else
    {
        return false;
    }
    if (i + extra >= text.size())
        return false;
    for (std::size_t k = 1; k <= extra; ++k)
    {
        const auto cont = static_cast<unsigned char>(text[i + k]);
        if ((cont & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (cont & 0x3F);
    }
    i += extra + 1;
    return true;
}

inline void flush_shifted(std::string& out, const std::vector<std::uint16_t>& units)
{
    std::vector<unsigned char> bytes;
    bytes.reserve(units.size() * 2);
    for (auto unit : units)
    {
        bytes.push_back(static_cast<unsigned char>(unit >> 8));
        bytes.push_back(static_cast<unsigned char>(unit & 0xFF));
    }
    out.push_back('&');
    std::uint32_t acc = 0;
    int bits = 0;
    for (auto byte : bytes)
    {
        acc = (acc << 8) | byte;
        bits += 8;
        while (bits >= 6)
        {
            bits -= 6;
            out.push_back(ALPHABET[(acc >> bits) & 0x3F]);
        }
    }
    if (bits > 0)
        out.push_back(ALPHABET[(acc << (6 - bits)) & 0x3F]);
    out.push_back('-');
}

} // namespace utf7_detail

/// Encode a UTF-8 mailbox name for the wire.
[[nodiscard]] inline result<std::string> encode_modified_utf7(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    std::vector<std::uint16_t> pending;

    std::size_t i = 0;
    while (i < utf8.size())
    {
        const auto ch = static_cast<unsigned char>(utf8[i]);
        if (ch >= 0x20 && ch <= 0x7E)
        {
            if (!pending.empty())
            {
                utf7_detail::flush_shifted(out, pending);
                pending.clear();
            }
            out.push_back(static_cast<char>(ch));
            if (ch == '&')
                out.push_back('-');
            ++i;
            continue;
        }

        std::uint32_t cp = 0;
        if (!utf7_detail::next_code_point(utf8, i, cp))
            return fail<std::string>(errc::codec_error, "Invalid UTF-8 in mailbox name.");
        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            pending.push_back(static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
            pending.push_back(static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
        }
        else
        {
            pending.push_back(static_cast<std::uint16_t>(cp));
        }
    }
    if (!pending.empty())
        utf7_detail::flush_shifted(out, pending);
    return ok(std::move(out));
}

/// Decode a wire mailbox name to UTF-8.
[[nodiscard]] inline result<std::string> decode_modified_utf7(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        const char ch = text[i];
        if (ch != '&')
        {
            out.push_back(ch);
            ++i;
            continue;
        }

        const auto end = text.find('-', i + 1);
        if (end == std::string_view::npos)
            return fail<std::string>(errc::codec_error, "Unterminated modified UTF-7 sequence.");
        if (end == i + 1)
        {
            out.push_back('&');
            i = end + 1;
            continue;
        }

        std::vector<unsigned char> bytes;
        std::uint32_t acc = 0;
        int bits = 0;
        for (std::size_t k = i + 1; k < end; ++k)
        {
            const int value = utf7_detail::base64_value(text[k]);
            if (value < 0)
                return fail<std::string>(errc::codec_error, "Invalid modified UTF-7 character.");
            acc = (acc << 6) | static_cast<std::uint32_t>(value);
            bits += 6;
            if (bits >= 8)
            {
                bits -= 8;
                bytes.push_back(static_cast<unsigned char>((acc >> bits) & 0xFF));
            }
        }
        if (bytes.size() % 2 != 0)
            return fail<std::string>(errc::codec_error, "Truncated UTF-16 in modified UTF-7.");

        for (std::size_t k = 0; k < bytes.size(); k += 2)
        {
            std::uint32_t unit = (static_cast<std::uint32_t>(bytes[k]) << 8) | bytes[k + 1];
            if (unit >= 0xD800 && unit <= 0xDBFF)
            {
                if (k + 3 >= bytes.size())
                    return fail<std::string>(errc::codec_error, "Unpaired surrogate in modified UTF-7.");
                const std::uint32_t low = (static_cast<std::uint32_t>(bytes[k + 2]) << 8) | bytes[k + 3];
                if (low < 0xDC00 || low > 0xDFFF)
                    return fail<std::string>(errc::codec_error, "Unpaired surrogate in modified UTF-7.");
                unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                k += 2;
            }
            utf7_detail::append_utf8(out, unit);
        }
        i = end + 1;
    }
    return ok(std::move(out));
}

} // namespace mailvault::imap
