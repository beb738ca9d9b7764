/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized mapping between Asio error codes and mailvault::errc for network I/O.

*/

#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <mailvault/detail/asio_decl.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const mailvault::asio::error_code& ec, bool timeout_triggered) noexcept
{
    namespace error = mailvault::asio::error;
    if (timeout_triggered || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view proto,
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail detail;
    detail.add("proto", proto);
    detail.add("host", host);
    detail.add("service", service);
    detail.add("stage", stage_name(stage));
    detail.add("op", op);
    return detail;
}

/// Build the failure for an Asio error observed at `stage`.
template<typename T = void>
[[nodiscard]] result<T> net_fail(io_stage stage, const mailvault::asio::error_code& ec, bool timeout_triggered,
    const detail::error_detail& detail = {})
{
    const errc code = map_net_error(stage, ec, timeout_triggered);
    std::string message(to_string(code));
    message += " during ";
    message += stage_name(stage);
    return fail_sys<T>(code, std::move(message), static_cast<std::error_code>(ec), detail.str());
}

} // namespace mailvault::net
