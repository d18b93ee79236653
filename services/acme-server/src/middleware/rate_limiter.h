#pragma once

/**
 * @file rate_limiter.h
 * @brief In-memory windowed rate limiter for new-account and new-order
 *
 * Keys are "ip:<client address>" for registrations and "acct:<id>" for
 * orders. Counters live in this process only; behind several replicas the
 * effective limit is multiplied by the replica count.
 */

#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace middleware {

/**
 * @brief Limits per window; 0 disables a window
 */
struct RateLimits {
    int perMinute = 0;
    int perHour = 0;
    int perDay = 0;

    bool enabled() const { return perMinute > 0 || perHour > 0 || perDay > 0; }
};

struct RateLimitDecision {
    bool allowed = true;
    int limit = 0;
    int remaining = 0;
    int64_t retryAfterSeconds = 0;   // Until the exhausted window resets
    std::string window;              // "per_minute", "per_hour", "per_day"
};

class RateLimiter {
public:
    RateLimiter();
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Count one request for key unless a window is exhausted
     *
     * A denied request is not counted.
     */
    RateLimitDecision checkAndIncrement(const std::string& key, const RateLimits& limits);

    /**
     * @brief Drop keys idle for a full day (called by acme-cleanup)
     * @return Number of keys removed
     */
    size_t cleanup();

private:
    using Clock = std::chrono::steady_clock;

    struct Window {
        int64_t count = 0;
        Clock::time_point start;
    };

    struct KeyWindows {
        Window minute;
        Window hour;
        Window day;
    };

    std::unordered_map<std::string, KeyWindows> windows_;
    mutable std::shared_mutex mutex_;

    static void resetIfExpired(Window& w, Clock::time_point now, std::chrono::seconds duration);
    static int64_t secondsUntilReset(const Window& w, Clock::time_point now, std::chrono::seconds duration);
};

} // namespace middleware
