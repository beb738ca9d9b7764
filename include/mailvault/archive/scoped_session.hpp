/*

scoped_session.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/**
Owns an adapter session and closes it when leaving scope.

`Session` needs a `result_void close()`. A failed close is logged, never
thrown, so the guard is safe on every exit path.
**/
template<typename Session>
class scoped_session
{
public:
    scoped_session() = default;

    scoped_session(std::unique_ptr<Session> session, std::string_view what)
        : session_(std::move(session)), what_(what)
    {
    }

    scoped_session(const scoped_session&) = delete;
    scoped_session& operator=(const scoped_session&) = delete;

    scoped_session(scoped_session&& other) noexcept = default;

    scoped_session& operator=(scoped_session&& other) noexcept
    {
        if (this != &other)
        {
            release();
            session_ = std::move(other.session_);
            what_ = std::move(other.what_);
        }
        return *this;
    }

    ~scoped_session()
    {
        release();
    }

    Session* operator->() const noexcept { return session_.get(); }
    Session& operator*() const noexcept { return *session_; }
    [[nodiscard]] Session* get() const noexcept { return session_.get(); }
    explicit operator bool() const noexcept { return session_ != nullptr; }

    /// Close now; returns the close error instead of logging it.
    result_void close()
    {
        if (!session_)
            return ok();
        auto res = session_->close();
        session_.reset();
        return res;
    }

private:
    void release() noexcept
    {
        if (!session_)
            return;
        auto res = session_->close();
        if (!res)
            MAILVAULT_WARN(std::format("{}: close failed: {}", what_, res.error().to_string()));
        session_.reset();
    }

    std::unique_ptr<Session> session_;
    std::string what_;
};

} // namespace mailvault::archive
