/**
 * @file RateLimiter.hpp
 * @brief Minimum-interval throttle for outbound model requests.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace timenotes::infrastructure {

/**
 * @class RateLimiter
 * @brief Ensures consecutive Acquire() calls are at least a fixed interval apart.
 *
 * Owned by the client that issues the requests; thread-safe.
 */
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds minInterval);

    /** @brief Blocks until the interval since the previous call has elapsed. */
    void Acquire();

    std::chrono::milliseconds GetMinInterval() const { return m_minInterval; }

private:
    std::chrono::milliseconds m_minInterval;
    std::optional<std::chrono::steady_clock::time_point> m_lastCall;
    std::mutex m_mutex;
};

} // namespace timenotes::infrastructure
