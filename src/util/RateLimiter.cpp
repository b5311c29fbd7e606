#include "util/RateLimiter.hpp"
#include "util/Logger.hpp"
#include <thread>
#include <algorithm>

namespace photodb::util {

RateLimiter::RateLimiter(std::chrono::milliseconds interval)
    : interval_(interval) {}

void RateLimiter::acquire() {
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        slot = primed_ ? std::max(now, next_slot_) : now;
        next_slot_ = slot + interval_;
        primed_ = true;
    }

    auto now = Clock::now();
    if (slot > now) {
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
        Logger::debug("RateLimiter: waiting " + std::to_string(wait.count()) + "ms for next slot");
        std::this_thread::sleep_until(slot);
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (primed_ && now < next_slot_) {
        return false;
    }
    next_slot_ = now + interval_;
    primed_ = true;
    return true;
}

}  // namespace photodb::util
