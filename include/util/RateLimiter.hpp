#pragma once

#include <chrono>
#include <mutex>

namespace photodb::util {

/**
 * Process-wide call spacing: at most one permit per `interval`.
 *
 * acquire() reserves the next free slot under the lock and then sleeps
 * outside it until that slot opens, so concurrent callers are released
 * one interval apart in reservation order. The first permit is immediate.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds interval);

    // Blocks until a permit is available
    void acquire();

    // Takes a permit only if one is available right now
    [[nodiscard]] bool try_acquire();

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

    static constexpr std::chrono::milliseconds GEOCODE_INTERVAL{5000};

private:
    const std::chrono::milliseconds interval_;
    std::mutex mutex_;
    Clock::time_point next_slot_;
    bool primed_ = false;  // false until the first permit is handed out
};

}  // namespace photodb::util
