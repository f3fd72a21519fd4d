/**
 * RateLimiter.h - Token-bucket throttle shared by all fetch workers
 *
 * Grants at most `rate` acquisitions per rolling `per` window. The grant
 * timestamps live in a lock-protected deque; callers that find the window
 * full sleep outside the lock until the oldest grant expires.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <atomic>

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int rate, std::chrono::milliseconds per = std::chrono::milliseconds(1000));

    // Blocks the caller until a slot is free
    void acquire();

    int rate() const { return rate_; }
    uint64_t total_acquired() const { return total_acquired_.load(); }
    uint64_t total_waits() const { return total_waits_.load(); }

private:
    const int rate_;
    const Clock::duration per_;
    std::deque<Clock::time_point> grants_;
    std::mutex mutex_;
    std::atomic<uint64_t> total_acquired_{0};
    std::atomic<uint64_t> total_waits_{0};
};
