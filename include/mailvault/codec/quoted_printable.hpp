/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

namespace mailvault::codec
{

[[nodiscard]] constexpr int hex_value(char ch) noexcept
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    return -1;
}

/**
Decoding quoted printable text (RFC 2045 section 6.7).

Soft line breaks are removed. With `q_encoding` set, underscores decode to
spaces as required by the RFC 2047 Q encoding. Malformed escapes are kept
verbatim, as mail clients do.
**/
[[nodiscard]] inline std::string decode_quoted_printable(std::string_view text, bool q_encoding = false)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '_' && q_encoding)
        {
            out.push_back(' ');
            continue;
        }
        if (ch != '=')
        {
            out.push_back(ch);
            continue;
        }

        // Soft line break: "=\r\n" or "=\n", possibly after trailing blanks.
        std::size_t j = i + 1;
        while (j < text.size() && (text[j] == ' ' || text[j] == '\t'))
            ++j;
        if (j < text.size() && (text[j] == '\r' || text[j] == '\n'))
        {
            if (text[j] == '\r' && j + 1 < text.size() && text[j + 1] == '\n')
                ++j;
            i = j;
            continue;
        }
        if (j == text.size())
        {
            i = j;
            continue;
        }

        const int hi = i + 2 < text.size() ? hex_value(text[i + 1]) : -1;
        const int lo = i + 2 < text.size() ? hex_value(text[i + 2]) : -1;
        if (hi < 0 || lo < 0)
        {
            out.push_back(ch);
            continue;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

} // namespace mailvault::codec
