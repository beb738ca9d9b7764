/*

retention.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <charconv>
#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

enum class age_unit
{
    day,
    week,
    month,
    year
};

/// Longest age accepted in any unit, in years.
inline constexpr unsigned int RETENTION_MAX_YEARS = 1000;

/// Relative age such as `6M` or `30D`.
struct retention_expression
{
    unsigned int quantity = 0;
    age_unit unit = age_unit::day;

    [[nodiscard]] std::string to_string() const
    {
        char letter = 'D';
        switch (unit)
        {
            case age_unit::day: letter = 'D'; break;
            case age_unit::week: letter = 'W'; break;
            case age_unit::month: letter = 'M'; break;
            case age_unit::year: letter = 'Y'; break;
        }
        return std::format("{}{}", quantity, letter);
    }

    /// Quantity within RETENTION_MAX_YEARS for its unit.
    [[nodiscard]] bool in_range() const noexcept
    {
        switch (unit)
        {
            case age_unit::day: return quantity <= RETENTION_MAX_YEARS * 366;
            case age_unit::week: return quantity <= RETENTION_MAX_YEARS * 53;
            case age_unit::month: return quantity <= RETENTION_MAX_YEARS * 12;
            case age_unit::year: return quantity <= RETENTION_MAX_YEARS;
        }
        return false;
    }

    bool operator==(const retention_expression&) const = default;
};

/**
Parse `<integer><D|W|M|Y>`, case insensitive, without embedded spaces.

@return errc::invalid_argument naming the rejected text, also for ages beyond
        RETENTION_MAX_YEARS.
**/
[[nodiscard]] inline result<retention_expression> parse_retention(std::string_view text)
{
    const std::string_view input = mailvault::detail::trim(text);
    auto reject = [&]()
    {
        return fail<retention_expression>(errc::invalid_argument,
            std::format("Invalid time range '{}'; use e.g. 30D (days), 2W (weeks), 6M (months), 1Y (years).", text),
            std::format("value={}", text));
    };
    if (input.size() < 2)
        return reject();

    const std::string_view digits = input.substr(0, input.size() - 1);
    for (char ch : digits)
    {
        if (!mailvault::detail::is_digit_ascii(ch))
            return reject();
    }

    retention_expression expr;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), expr.quantity);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
        return reject();

    switch (mailvault::detail::to_upper_ascii(input.back()))
    {
        case 'D': expr.unit = age_unit::day; break;
        case 'W': expr.unit = age_unit::week; break;
        case 'M': expr.unit = age_unit::month; break;
        case 'Y': expr.unit = age_unit::year; break;
        default: return reject();
    }
    if (!expr.in_range())
        return fail<retention_expression>(errc::invalid_argument,
            std::format("Time range '{}' is longer than {} years.", text, RETENTION_MAX_YEARS),
            std::format("value={}", text));
    return expr;
}

/**
Absolute cutoff `now - expr`.

Months and years are subtracted on the calendar; a day that does not exist in
the target month is clamped to that month's last day (31 March - 1M gives
28 or 29 February). The time of day is kept. An expression out of range gives
the earliest representable instant, so nothing is older than the cutoff.
**/
[[nodiscard]] inline std::chrono::sys_seconds retention_cutoff(std::chrono::sys_seconds now, const retention_expression& expr)
{
    using namespace std::chrono;
    const sys_days today = floor<days>(now);
    const seconds time_of_day = now - today;
    if (!expr.in_range())
        return sys_seconds::min();

    switch (expr.unit)
    {
        case age_unit::day:
            return now - days{expr.quantity};
        case age_unit::week:
            return now - weeks{expr.quantity};
        case age_unit::month:
        case age_unit::year:
            break;
    }

    const year_month_day ymd{today};
    const months shift = expr.unit == age_unit::month ? months{expr.quantity} : months{12LL * expr.quantity};
    const year_month target = year_month{ymd.year(), ymd.month()} - shift;
    year_month_day shifted{target.year(), target.month(), ymd.day()};
    if (!shifted.ok())
        shifted = year_month_day{year_month_day_last{target.year(), month_day_last{target.month()}}};
    return sys_days{shifted} + time_of_day;
}

/// Strictly older than the cutoff; a message dated exactly at the cutoff is kept.
[[nodiscard]] inline bool is_older_than(std::chrono::sys_seconds message_date, std::chrono::sys_seconds cutoff) noexcept
{
    return message_date < cutoff;
}

/**
Retention decision for one message.

Without an expression every message qualifies. Callers must only reach that
case after an explicit opt-in (`--all`) and confirmation.
**/
[[nodiscard]] inline bool should_delete(std::chrono::sys_seconds message_date, std::chrono::sys_seconds now,
    const std::optional<retention_expression>& age)
{
    if (!age.has_value())
        return true;
    return is_older_than(message_date, retention_cutoff(now, *age));
}

} // namespace mailvault::archive
