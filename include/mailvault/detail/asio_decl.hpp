/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for mailvault.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_future.hpp>

namespace mailvault::asio
{
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::use_future;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;

    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    using boost::asio::async_write;
    using boost::asio::async_read;
    using boost::asio::async_read_until;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;
    using boost::asio::transfer_exactly;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

    /// Completion token that stores the error in `ec` instead of throwing.
    [[nodiscard]] inline auto nothrow_awaitable(error_code& ec)
    {
        return redirect_error(use_awaitable, ec);
    }

} // namespace mailvault::asio

#else
#error "mailvault requires coroutine support (C++20) and Boost.Asio 1.18+"
#endif

namespace mailvault
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
