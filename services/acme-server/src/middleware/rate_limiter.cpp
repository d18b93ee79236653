/**
 * @file rate_limiter.cpp
 * @brief Windowed rate limiter implementation
 */

#include "rate_limiter.h"
#include <spdlog/spdlog.h>
#include <mutex>

namespace middleware {

namespace {
constexpr std::chrono::seconds kMinute(60);
constexpr std::chrono::seconds kHour(3600);
constexpr std::chrono::seconds kDay(86400);
}

RateLimiter::RateLimiter() {
    spdlog::info("[RateLimiter] Initialized");
}

RateLimiter::~RateLimiter() = default;

void RateLimiter::resetIfExpired(Window& w, Clock::time_point now, std::chrono::seconds duration) {
    if (now - w.start >= duration) {
        w.count = 0;
        w.start = now;
    }
}

int64_t RateLimiter::secondsUntilReset(const Window& w, Clock::time_point now, std::chrono::seconds duration) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - w.start);
    int64_t left = (duration - elapsed).count();
    return left > 0 ? left : 1;
}

RateLimitDecision RateLimiter::checkAndIncrement(const std::string& key, const RateLimits& limits) {
    if (!limits.enabled()) {
        return {};
    }

    std::unique_lock lock(mutex_);

    auto now = Clock::now();
    auto [it, inserted] = windows_.try_emplace(key);
    auto& kw = it->second;
    if (inserted) {
        kw.minute.start = kw.hour.start = kw.day.start = now;
    }

    resetIfExpired(kw.minute, now, kMinute);
    resetIfExpired(kw.hour, now, kHour);
    resetIfExpired(kw.day, now, kDay);

    // Most restrictive window first
    if (limits.perMinute > 0 && kw.minute.count >= limits.perMinute) {
        return {false, limits.perMinute, 0, secondsUntilReset(kw.minute, now, kMinute), "per_minute"};
    }
    if (limits.perHour > 0 && kw.hour.count >= limits.perHour) {
        return {false, limits.perHour, 0, secondsUntilReset(kw.hour, now, kHour), "per_hour"};
    }
    if (limits.perDay > 0 && kw.day.count >= limits.perDay) {
        spdlog::warn("[RateLimiter] Daily limit reached for {}", key);
        return {false, limits.perDay, 0, secondsUntilReset(kw.day, now, kDay), "per_day"};
    }

    kw.minute.count++;
    kw.hour.count++;
    kw.day.count++;

    RateLimitDecision decision;
    decision.allowed = true;
    decision.limit = limits.perMinute;
    decision.remaining = limits.perMinute > 0 ? limits.perMinute - static_cast<int>(kw.minute.count) : 0;
    decision.window = "per_minute";
    return decision;
}

size_t RateLimiter::cleanup() {
    std::unique_lock lock(mutex_);
    auto now = Clock::now();

    size_t removed = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.day.start >= kDay) {
            it = windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace middleware
