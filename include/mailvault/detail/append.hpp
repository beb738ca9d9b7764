/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Allocation friendly builders for protocol command lines.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace mailvault::detail
{

inline void append_sv(std::string& out, std::string_view value)
{
    out.append(value.data(), value.size());
}

inline void append_char(std::string& out, char ch)
{
    out.push_back(ch);
}

inline void append_space(std::string& out)
{
    out.push_back(' ');
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[24]{};
    const auto res = std::to_chars(std::begin(buffer), std::end(buffer), value);
    if (res.ec == std::errc{})
        out.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
}

/// Append `uids` as a comma separated IMAP sequence set, collapsing consecutive runs.
template<typename Range>
inline void append_sequence_set(std::string& out, const Range& uids)
{
    bool first = true;
    auto it = std::begin(uids);
    const auto end = std::end(uids);
    while (it != end)
    {
        const std::uint64_t start = *it;
        std::uint64_t last = start;
        auto next = std::next(it);
        while (next != end && static_cast<std::uint64_t>(*next) == last + 1)
        {
            last = *next;
            ++next;
        }
        if (!first)
            append_char(out, ',');
        first = false;
        append_uint(out, start);
        if (last != start)
        {
            append_char(out, ':');
            append_uint(out, last);
        }
        it = next;
    }
}

} // namespace mailvault::detail
