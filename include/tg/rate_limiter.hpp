#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace tg {

/// Configuration for RateLimiter
struct RateLimiterConfig {
    std::chrono::milliseconds min_interval{500};  // Minimum time between requests
};

/// Spaces out Bot API requests issued by background sweeps
///
/// Requests are separated by at least min_interval. A RetryAfter answer from
/// the provider pushes the next slot out with defer(). Thread-safe.
class RateLimiter {
public:
    using Config = RateLimiterConfig;

    explicit RateLimiter(Config config = {});
    ~RateLimiter() = default;

    // Disable copy
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Wait until a request may be made
    /// @return false if the stop token fired while waiting
    bool acquire(std::stop_token stop = {});

    /// Try to acquire without blocking
    /// @return true if acquired, false if the next slot is still in the future
    bool try_acquire();

    /// Forbid requests for `delay` (provider asked us to back off)
    void defer(std::chrono::milliseconds delay);

    /// Get current configuration
    [[nodiscard]] const Config& get_config() const { return config_; }

    /// Update configuration (thread-safe)
    void set_config(Config config);

private:
    Config config_;
    std::chrono::steady_clock::time_point next_allowed_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace tg
