/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <mailvault/detail/result.hpp>

namespace mailvault::codec
{

namespace base64_detail
{

inline constexpr std::array<std::int8_t, 256> make_table() noexcept
{
    std::array<std::int8_t, 256> table{};
    for (auto& v : table)
        v = -1;
    constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (std::size_t i = 0; i < alphabet.size(); ++i)
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<std::int8_t>(i);
    return table;
}

inline constexpr auto DECODE_TABLE = make_table();

} // namespace base64_detail

/**
Decoding base64 content as found in MIME bodies and encoded words.

Line breaks and other whitespace are skipped; decoding stops at the first
padding character. Any other character outside the alphabet is an error.
**/
[[nodiscard]] inline result<std::string> decode_base64(std::string_view text)
{
    std::string out;
    out.reserve(text.size() * 3 / 4);
    std::uint32_t acc = 0;
    int bits = 0;
    for (char ch : text)
    {
        if (ch == '=')
            break;
        if (ch == '\r' || ch == '\n' || ch == ' ' || ch == '\t')
            continue;
        const std::int8_t value = base64_detail::DECODE_TABLE[static_cast<unsigned char>(ch)];
        if (value < 0)
        {
            detail::error_detail detail;
            detail.add("char", std::string_view(&ch, 1));
            return fail<std::string>(errc::codec_error, "Invalid base64 character.", detail);
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return ok(std::move(out));
}

} // namespace mailvault::codec
