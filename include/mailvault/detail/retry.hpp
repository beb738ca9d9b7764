/*

retry.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::detail
{

/**
 * Bounded retry policy for blocking operations returning result<T>.
 *
 * An operation is attempted at most `max_attempts` times; a failed attempt is
 * repeated only when `classify` reports the error as transient.
 */
struct retry_policy
{
    /// Total attempts including the first one
    unsigned int max_attempts = 2;

    /// Pause between attempts
    std::chrono::milliseconds delay{0};

    /// Returns true when the error is worth another attempt
    std::function<bool(const error_info&)> classify = [](const error_info& err)
    {
        return is_network_error(err.code);
    };

    /// Invoked before each repeated attempt (1-based attempt number about to run)
    std::function<void(unsigned int, const error_info&)> on_retry;

    /// Never retry
    static retry_policy none()
    {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }

    /// One extra attempt on network class errors
    static retry_policy single_retry(std::chrono::milliseconds pause = std::chrono::milliseconds{0})
    {
        retry_policy policy;
        policy.max_attempts = 2;
        policy.delay = pause;
        return policy;
    }

    [[nodiscard]] bool should_retry(unsigned int attempt, const error_info& err) const
    {
        if (attempt >= max_attempts)
            return false;
        return classify ? classify(err) : false;
    }

    /**
     * Run `op` under this policy.
     *
     * @param op     Callable returning result<T>.
     * @param tries  Receives the number of attempts actually made.
     */
    template<typename Op>
    auto run(Op&& op, unsigned int* tries = nullptr) const -> std::invoke_result_t<Op&>
    {
        unsigned int attempt = 1;
        while (true)
        {
            auto res = op();
            if (tries != nullptr)
                *tries = attempt;
            if (res || !should_retry(attempt, res.error()))
                return res;

            ++attempt;
            if (on_retry)
                on_retry(attempt, res.error());
            else
                MAILVAULT_DEBUG(std::format("retrying (attempt {}/{}): {}", attempt, max_attempts, res.error().to_string()));
            if (delay.count() > 0)
                std::this_thread::sleep_for(delay);
        }
    }
};

} // namespace mailvault::detail
