/*

tls_mode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include <mailvault/detail/ascii.hpp>

namespace mailvault::net
{

/**
TLS mode for the mail connection.
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

/**
Parse a TLS mode as written in the environment or the configuration file.

Besides the mode names, the boolean spellings of the older `IMAP_SSL` switch
are accepted: true/yes/1/on mean implicit TLS, false/no/0/off mean none.
**/
[[nodiscard]] inline std::optional<tls_mode> parse_tls_mode(std::string_view text) noexcept
{
    using detail::iequals_ascii;
    text = detail::trim(text);
    if (iequals_ascii(text, "implicit") || iequals_ascii(text, "ssl") || iequals_ascii(text, "tls") ||
        iequals_ascii(text, "true") || iequals_ascii(text, "yes") || iequals_ascii(text, "on") || text == "1")
        return tls_mode::implicit;
    if (iequals_ascii(text, "starttls"))
        return tls_mode::starttls;
    if (iequals_ascii(text, "none") || iequals_ascii(text, "plain") ||
        iequals_ascii(text, "false") || iequals_ascii(text, "no") || iequals_ascii(text, "off") || text == "0")
        return tls_mode::none;
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

} // namespace mailvault::net
