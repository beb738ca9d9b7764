/*

throwing.hpp
------------

Exception bridge for the command line tool: a failed step is raised once and
turned into a message and an exit status in main().


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <mailvault/detail/result.hpp>

namespace mailvault
{

/// Process exit status for a run that completed with item failures or a failed connection.
inline constexpr int EXIT_RUN_FAILED = 1;

/// Process exit status for bad command line or configuration input.
inline constexpr int EXIT_BAD_INPUT = 2;

class exception : public std::runtime_error
{
public:
    /// @param step What the tool was doing, prefixed to the message when given.
    explicit exception(error_info info, std::string_view step = {})
        : std::runtime_error(step.empty() ? info.to_string() : std::format("{}: {}", step, info.to_string())),
          info_(std::move(info))
    {
    }

    [[nodiscard]] const error_info& info() const noexcept { return info_; }

    [[nodiscard]] errc code() const noexcept { return info_.code; }

    /// EXIT_BAD_INPUT for configuration and argument errors, EXIT_RUN_FAILED otherwise.
    [[nodiscard]] int exit_status() const noexcept
    {
        switch (info_.code)
        {
            case errc::config_missing:
            case errc::config_invalid:
            case errc::invalid_argument:
                return EXIT_BAD_INPUT;
            default:
                return EXIT_RUN_FAILED;
        }
    }

private:
    error_info info_;
};

/// Value of `r`, or throw its error labelled with `step`.
template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r, std::string_view step = {})
{
    if (!r)
        throw exception(std::move(r.error()), step);
    return std::move(*r);
}

} // namespace mailvault
