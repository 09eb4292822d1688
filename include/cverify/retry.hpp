#pragma once

/**
 * @file retry.hpp
 * @brief Bounded exponential backoff for infrastructure calls
 */

#include "cverify/common.hpp"

#include <chrono>
#include <functional>
#include <utility>

namespace cverify::retry {

struct RetryPolicy
{
    int max_attempts = 4;
    std::chrono::milliseconds initial_backoff{250};
    std::chrono::milliseconds max_backoff{4000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Only infrastructure faults are worth another attempt
[[nodiscard]] bool is_retryable(const Error& error) noexcept;

/// Delay before attempt number @p attempt (1-based, attempt >= 2)
[[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt);

[[nodiscard]] Sleeper thread_sleeper();

/**
 * Call @p fn until it succeeds, fails with a non-retryable error, or
 * max_attempts is reached. The last error is returned on exhaustion.
 */
template <typename Fn>
[[nodiscard]] auto with_retry(const RetryPolicy& policy, const Sleeper& sleep, Fn&& fn) -> decltype(fn())
{
    auto result = fn();
    for (int attempt = 2; attempt <= policy.max_attempts; ++attempt) {
        if (result || !is_retryable(result.error())) {
            break;
        }
        sleep(backoff_delay(policy, attempt));
        result = fn();
    }
    return result;
}

}  // namespace cverify::retry
