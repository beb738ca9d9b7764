/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Library calls return result<T>; only the throwing bridge raises exceptions.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <mailvault/detail/error_detail.hpp>

namespace mailvault
{

/// Error categories for mailvault operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Network errors (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_connection_refused = 102,
    net_connection_reset = 103,
    net_timeout = 104,
    net_eof = 105,
    net_io_failed = 106,
    net_cancelled = 107,

    // TLS errors (150-199)
    tls_handshake_failed = 150,
    tls_verify_failed = 151,
    tls_required = 152,

    // IMAP protocol errors (300-399)
    imap_tagged_no = 300,
    imap_tagged_bad = 301,
    imap_parse_error = 302,
    imap_invalid_state = 303,
    imap_continuation_expected = 304,
    imap_auth_failed = 305,
    imap_bye = 306,

    // MIME/codec errors (600-699)
    mime_parse_error = 600,
    codec_error = 601,

    // Input validation and configuration (700-799)
    invalid_argument = 700,
    config_missing = 701,
    config_invalid = 702,

    // Storage errors (800-899)
    storage_connect_failed = 800,
    storage_auth_failed = 801,
    storage_io_failed = 802,
    storage_partial_write = 803,
    fs_io_failed = 850,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "Success";
        case errc::net_resolve_failed: return "Host name resolution failed";
        case errc::net_connect_failed: return "Connection failed";
        case errc::net_connection_refused: return "Connection refused";
        case errc::net_connection_reset: return "Connection reset";
        case errc::net_timeout: return "Network timeout";
        case errc::net_eof: return "Connection closed by peer";
        case errc::net_io_failed: return "Network I/O failed";
        case errc::net_cancelled: return "Network operation cancelled";
        case errc::tls_handshake_failed: return "TLS handshake failed";
        case errc::tls_verify_failed: return "TLS certificate verification failed";
        case errc::tls_required: return "TLS required";
        case errc::imap_tagged_no: return "IMAP tagged NO";
        case errc::imap_tagged_bad: return "IMAP tagged BAD";
        case errc::imap_parse_error: return "IMAP parse error";
        case errc::imap_invalid_state: return "IMAP invalid state";
        case errc::imap_continuation_expected: return "IMAP continuation expected";
        case errc::imap_auth_failed: return "IMAP authentication failed";
        case errc::imap_bye: return "IMAP server closed the session";
        case errc::mime_parse_error: return "MIME parse error";
        case errc::codec_error: return "Codec error";
        case errc::invalid_argument: return "Invalid argument";
        case errc::config_missing: return "Missing configuration";
        case errc::config_invalid: return "Invalid configuration";
        case errc::storage_connect_failed: return "Storage connection failed";
        case errc::storage_auth_failed: return "Storage authentication failed";
        case errc::storage_io_failed: return "Storage I/O failed";
        case errc::storage_partial_write: return "Storage partial write";
        case errc::fs_io_failed: return "Local filesystem I/O failed";
        case errc::internal_error: return "Internal error";
    }
    return "Unknown error";
}

[[nodiscard]] constexpr bool is_network_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 150;
}

[[nodiscard]] constexpr bool is_tls_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 150 && c < 200;
}

[[nodiscard]] constexpr bool is_storage_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 800 && c < 900;
}

/// Rich error: code, message, key=value detail, system error and origin
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string text = message.empty() ? std::string(mailvault::to_string(code)) : message;
        if (sys)
            text += std::format(" ({})", sys.message());
        return text;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = std::expected<void, error_info>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message = {},
    std::string detail = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), {}, where});
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message,
    const detail::error_detail& detail, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), detail.str(), {}, where});
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail_sys(errc code, std::string message, std::error_code sys,
    std::string detail = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

} // namespace mailvault

#define MAILVAULT_DETAIL_CONCAT_IMPL(a, b) a##b
#define MAILVAULT_DETAIL_CONCAT(a, b) MAILVAULT_DETAIL_CONCAT_IMPL(a, b)

/// Assign the value of a result or return its error.
#define MAILVAULT_TRY_ASSIGN(lhs, expr) \
    MAILVAULT_DETAIL_TRY_ASSIGN(MAILVAULT_DETAIL_CONCAT(mailvault_res_, __LINE__), lhs, expr, return)

#define MAILVAULT_TRY_VOID(expr) \
    MAILVAULT_DETAIL_TRY_VOID(MAILVAULT_DETAIL_CONCAT(mailvault_res_, __LINE__), expr, return)

/// Coroutine flavours of the above.
#define MAILVAULT_CO_TRY_ASSIGN(lhs, expr) \
    MAILVAULT_DETAIL_TRY_ASSIGN(MAILVAULT_DETAIL_CONCAT(mailvault_res_, __LINE__), lhs, expr, co_return)

#define MAILVAULT_CO_TRY_VOID(expr) \
    MAILVAULT_DETAIL_TRY_VOID(MAILVAULT_DETAIL_CONCAT(mailvault_res_, __LINE__), expr, co_return)

#define MAILVAULT_DETAIL_TRY_ASSIGN(tmp, lhs, expr, ret) \
    auto tmp = (expr); \
    if (!tmp) [[unlikely]] \
        ret std::unexpected(std::move(tmp).error()); \
    lhs = std::move(*tmp)

#define MAILVAULT_DETAIL_TRY_VOID(tmp, expr, ret) \
    do { \
        auto tmp = (expr); \
        if (!tmp) [[unlikely]] \
            ret std::unexpected(std::move(tmp).error()); \
    } while (0)
