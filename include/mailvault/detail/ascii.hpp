/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Locale independent ASCII helpers shared by the protocol parsers.

*/

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mailvault::detail
{

[[nodiscard]] constexpr char to_upper_ascii(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - ('a' - 'A')) : ch;
}

[[nodiscard]] constexpr char to_lower_ascii(char ch) noexcept
{
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + ('a' - 'A')) : ch;
}

[[nodiscard]] constexpr bool is_alnum_ascii(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

[[nodiscard]] constexpr bool is_digit_ascii(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

[[nodiscard]] constexpr bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (to_upper_ascii(a[i]) != to_upper_ascii(b[i]))
            return false;
    }
    return true;
}

[[nodiscard]] constexpr bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    if (text.size() < prefix.size())
        return false;
    return iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::string to_upper_copy(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char ch : input)
        out.push_back(to_upper_ascii(ch));
    return out;
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char ch : input)
        out.push_back(to_lower_ascii(ch));
    return out;
}

[[nodiscard]] constexpr bool is_space_ascii(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

[[nodiscard]] constexpr std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && is_space_ascii(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space_ascii(text.back()))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] constexpr std::string_view ltrim(std::string_view text) noexcept
{
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    return text;
}

[[nodiscard]] constexpr std::pair<std::string_view, std::string_view> split_token(std::string_view text) noexcept
{
    text = ltrim(text);
    auto pos = text.find(' ');
    if (pos == std::string_view::npos)
        return {text, std::string_view{}};
    return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
}

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        auto [token, rest] = split_token(text);
        if (token.empty())
            break;
        out.push_back(token);
        text = rest;
    }
}

} // namespace mailvault::detail
