#include "tg/rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tg {

RateLimiter::RateLimiter(Config config) : config_(std::move(config)), next_allowed_(std::chrono::steady_clock::now()) {}

bool RateLimiter::acquire(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (std::chrono::steady_clock::now() < next_allowed_) {
        auto wait_time = next_allowed_ - std::chrono::steady_clock::now();
        spdlog::debug(
            "RateLimiter: waiting {}ms before next request",
            std::chrono::duration_cast<std::chrono::milliseconds>(wait_time).count()
        );
        // Re-checked in the loop since defer() can push next_allowed_ further out
        cv_.wait_until(lock, stop, next_allowed_, [] { return false; });
        if (stop.stop_requested()) {
            return false;
        }
    }

    next_allowed_ = std::chrono::steady_clock::now() + config_.min_interval;
    return true;
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    if (now < next_allowed_) {
        return false;
    }

    next_allowed_ = now + config_.min_interval;
    return true;
}

void RateLimiter::defer(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    next_allowed_ = std::max(next_allowed_, std::chrono::steady_clock::now() + delay);
    spdlog::debug("RateLimiter: deferred for {}ms", delay.count());
    cv_.notify_all();
}

void RateLimiter::set_config(Config config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

}  // namespace tg
