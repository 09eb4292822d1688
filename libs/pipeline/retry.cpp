/**
 * @file retry.cpp
 * @brief Backoff schedule
 */

#include "cverify/retry.hpp"

#include <algorithm>
#include <thread>

namespace cverify::retry {

bool is_retryable(const Error& error) noexcept
{
    return error.code == "InfrastructureError";
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt)
{
    auto delay = policy.initial_backoff;
    for (int i = 2; i < attempt && delay < policy.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.max_backoff);
}

Sleeper thread_sleeper()
{
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

}  // namespace cverify::retry
