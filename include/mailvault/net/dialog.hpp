/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <mailvault/detail/asio_decl.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/net/error_mapping.hpp>

namespace mailvault
{
namespace net
{

using mailvault::asio::awaitable;

/// Default maximum line length for network protocols
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (socket, ssl stream, upgradable stream).

Every operation is bounded by the optional timeout: when it expires the
lowest layer is cancelled and the operation fails with errc::net_timeout.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    /**
    Sending a line to network.

    @param line  Line to send (CRLF added if missing).
    **/
    awaitable<result_void> write_line(std::string_view line)
    {
        std::string payload = normalize_line(line);
        MAILVAULT_TRACE_SEND(trace_protocol_, payload);
        mailvault::asio::error_code ec;
        auto guard = arm_timer();
        co_await mailvault::asio::async_write(stream_, mailvault::asio::buffer(payload),
            mailvault::asio::nothrow_awaitable(ec));
        const bool timed_out = guard.disarm();
        if (ec)
            co_return net_fail<void>(io_stage::write, ec, timed_out, net_detail());
        co_return ok();
    }

    /**
    Receiving a line from network, without the trailing CRLF.
    **/
    awaitable<result<std::string>> read_line()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            mailvault::asio::error_code ec;
            auto guard = arm_timer();
            co_await mailvault::asio::async_read_until(stream_,
                mailvault::asio::dynamic_buffer(read_buffer_, max_line_length_ + 2), '\n',
                mailvault::asio::nothrow_awaitable(ec));
            const bool timed_out = guard.disarm();
            if (ec == mailvault::asio::error::not_found)
                co_return fail<std::string>(errc::net_io_failed, "Line too long.", net_detail());
            if (ec)
                co_return net_fail<std::string>(io_stage::read, ec, timed_out, net_detail());
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                co_return fail<std::string>(errc::net_io_failed, "Line terminator missing.", net_detail());
        }

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            co_return fail<std::string>(errc::net_io_failed, "Line too long.", net_detail());
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        MAILVAULT_TRACE_RECV(trace_protocol_, line);
        co_return ok(std::move(line));
    }

    /**
    Receiving exactly N bytes from network.

    @param n Number of bytes to read.
    **/
    awaitable<result<std::string>> read_exactly(std::size_t n)
    {
        if (read_buffer_.size() < n)
        {
            const std::size_t remaining = n - read_buffer_.size();
            mailvault::asio::error_code ec;
            auto guard = arm_timer();
            co_await mailvault::asio::async_read(stream_, mailvault::asio::dynamic_buffer(read_buffer_),
                mailvault::asio::transfer_exactly(remaining), mailvault::asio::nothrow_awaitable(ec));
            const bool timed_out = guard.disarm();
            if (ec)
                co_return net_fail<std::string>(io_stage::read, ec, timed_out, net_detail());
            if (read_buffer_.size() < n)
                co_return fail<std::string>(errc::net_eof, "Short read.", net_detail());
        }
        std::string out(read_buffer_.data(), n);
        read_buffer_.erase(0, n);
        if (log::logger::instance().is_trace_enabled())
            MAILVAULT_TRACE_RECV(trace_protocol_, std::format("<{} literal bytes>", n));
        co_return ok(std::move(out));
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    /// Cancels the lowest layer when the deadline passes; disarm() reports whether it fired.
    class timer_guard
    {
    public:
        timer_guard() = default;

        timer_guard(Stream& stream, duration timeout)
            : timer_(std::make_unique<mailvault::asio::steady_timer>(stream.get_executor())),
              fired_(std::make_shared<bool>(false))
        {
            timer_->expires_after(timeout);
            timer_->async_wait([&stream, fired = fired_](const mailvault::asio::error_code& ec)
            {
                if (ec)
                    return;
                *fired = true;
                mailvault::asio::error_code ignore_ec;
                stream.lowest_layer().cancel(ignore_ec);
            });
        }

        bool disarm()
        {
            if (!timer_)
                return false;
            timer_->cancel();
            return *fired_;
        }

    private:
        std::unique_ptr<mailvault::asio::steady_timer> timer_;
        std::shared_ptr<bool> fired_;
    };

    timer_guard arm_timer()
    {
        if (!timeout_.has_value())
            return timer_guard{};
        return timer_guard(stream_, *timeout_);
    }

    [[nodiscard]] mailvault::detail::error_detail net_detail() const
    {
        mailvault::detail::error_detail out;
        out.add("proto", trace_protocol_);
        return out;
    }

    static std::string normalize_line(std::string_view line)
    {
        if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
            return std::string(line);
        std::string out(line);
        while (!out.empty() && (out.back() == '\r' || out.back() == '\n'))
            out.pop_back();
        out += "\r\n";
        return out;
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::string trace_protocol_{"NET"};
};

} // namespace net
} // namespace mailvault
