#include "infrastructure/RateLimiter.hpp"

#include <thread>

namespace timenotes::infrastructure {

RateLimiter::RateLimiter(std::chrono::milliseconds minInterval)
    : m_minInterval(minInterval.count() < 0 ? std::chrono::milliseconds(0) : minInterval) {}

void RateLimiter::Acquire() {
    // Held while sleeping so waiters are released one interval apart.
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = std::chrono::steady_clock::now();
    if (m_lastCall) {
        auto earliest = *m_lastCall + m_minInterval;
        if (now < earliest) {
            std::this_thread::sleep_until(earliest);
            now = std::chrono::steady_clock::now();
        }
    }
    m_lastCall = now;
}

} // namespace timenotes::infrastructure
