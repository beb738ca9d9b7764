/*

error_detail.hpp
----------------

Key/value lines attached to an error_info: one `key=value` entry per line, so
the CLI can print it under --verbose and tests can search it.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <concepts>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

namespace mailvault::detail
{

class error_detail
{
public:
    /// Text value; a CR or LF inside it is written as `\r` / `\n` to keep the entry on one line.
    error_detail& add(std::string_view key, std::string_view value)
    {
        out_.append(key);
        out_.push_back('=');
        for (char ch : value)
        {
            if (ch == '\r')
                out_.append("\\r");
            else if (ch == '\n')
                out_.append("\\n");
            else
                out_.push_back(ch);
        }
        out_.push_back('\n');
        return *this;
    }

    template<std::integral T>
    error_detail& add(std::string_view key, T value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    [[nodiscard]] const std::string& str() const noexcept
    {
        return out_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

private:
    std::string out_;
};

} // namespace mailvault::detail
