/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <mailvault/detail/asio_decl.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/net/tls_options.hpp>

namespace mailvault
{
namespace net
{

using mailvault::asio::any_io_executor;
using mailvault::asio::awaitable;
using mailvault::asio::tcp;
namespace ssl = mailvault::asio::ssl;

/**
Stable stream type that can be upgraded to TLS without changing the type.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /// Best effort TLS close_notify followed by a socket shutdown.
    awaitable<void> shutdown()
    {
        mailvault::asio::error_code ec;
        if (auto* tls = std::get_if<ssl_stream>(&stream_))
            co_await tls->async_shutdown(mailvault::asio::nothrow_awaitable(ec));
        lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        lowest_layer().close(ec);
    }

    awaitable<result_void> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        MAILVAULT_CO_TRY_VOID(configure_context(context, opt));

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);

        auto& tls_stream = std::get<ssl_stream>(stream_);
        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify_peer)
        {
            if (sni.empty())
                co_return fail<void>(errc::tls_verify_failed, "TLS hostname verification requires a host name.");
            tls_stream.set_verify_mode(ssl::verify_peer);
            tls_stream.set_verify_callback(ssl::host_name_verification(sni));
        }
        else
        {
            MAILVAULT_WARN(std::format("tls: certificate checks disabled for {}", sni));
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        mailvault::asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client, mailvault::asio::nothrow_awaitable(ec));
        if (ec)
        {
            const long verify_result = SSL_get_verify_result(tls_stream.native_handle());
            if (verify_result != X509_V_OK)
            {
                co_return fail_sys<void>(errc::tls_verify_failed, "TLS certificate verification failed.",
                    static_cast<std::error_code>(ec), X509_verify_cert_error_string(verify_result));
            }
            co_return fail_sys<void>(errc::tls_handshake_failed,
                "TLS handshake failed.", static_cast<std::error_code>(ec), ec.message());
        }
        co_return ok();
    }

private:
    static std::string openssl_error_message()
    {
        const unsigned long err = ERR_get_error();
        if (err == 0)
            return {};
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    static result_void configure_context(ssl::context& context, const tls_options& opt)
    {
        mailvault::asio::error_code ec;
        context.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_handshake_failed, "Loading default trust store failed.", ec.message());
        if (!opt.ca_file.empty())
        {
            context.load_verify_file(opt.ca_file, ec);
            if (ec)
                return fail<void>(errc::tls_handshake_failed, "Loading CA file failed.",
                    std::format("ca_file={} error={}", opt.ca_file, ec.message()));
        }

        // Does not override a minimum version already set on the context.
        const long current = SSL_CTX_get_min_proto_version(context.native_handle());
        if (current == 0 && SSL_CTX_set_min_proto_version(context.native_handle(), MIN_TLS_VERSION) != 1)
            return fail<void>(errc::tls_handshake_failed, "TLS min version configuration failed.", openssl_error_message());
        return ok();
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace mailvault
