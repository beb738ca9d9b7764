/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <format>
#include <string_view>

#include <mailvault/detail/result.hpp>

namespace mailvault
{
namespace detail
{

/// Offset of the first CR, LF or NUL in `value`, or npos.
[[nodiscard]] inline std::size_t find_line_break(std::string_view value) noexcept
{
    return value.find_first_of(std::string_view("\r\n\0", 3));
}

/**
Refuse a value that would end or split a protocol line: an IMAP command, a
quoted mailbox name, a host, or a path handed to the share.

@return errc::invalid_argument naming the field and the offset of the byte.
**/
inline result_void ensure_single_line(std::string_view value, std::string_view field)
{
    const std::size_t pos = find_line_break(value);
    if (pos == std::string_view::npos)
        return ok();
    const std::string_view what = value[pos] == '\0' ? "NUL" : (value[pos] == '\r' ? "CR" : "LF");
    return fail<void>(errc::invalid_argument, std::format("Invalid {}: {} not allowed.", field, what),
        std::format("field={} offset={}", field, pos));
}

} // namespace detail
} // namespace mailvault
