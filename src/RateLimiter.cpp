/**
 * RateLimiter.cpp - Implementation
 */

#include "tmdbsync/RateLimiter.h"
#include <stdexcept>
#include <thread>

RateLimiter::RateLimiter(int rate, std::chrono::milliseconds per)
    : rate_(rate), per_(per) {
    if (rate_ <= 0) {
        throw std::invalid_argument("RateLimiter rate must be positive");
    }
    if (per.count() <= 0) {
        throw std::invalid_argument("RateLimiter window must be positive");
    }
}

void RateLimiter::acquire() {
    bool waited = false;
    while (true) {
        Clock::duration sleep_for{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = Clock::now();
            while (!grants_.empty() && (now - grants_.front()) >= per_) {
                grants_.pop_front();
            }
            if (static_cast<int>(grants_.size()) < rate_) {
                grants_.push_back(now);
                total_acquired_.fetch_add(1);
                if (waited) total_waits_.fetch_add(1);
                return;
            }
            sleep_for = per_ - (now - grants_.front());
        }

        waited = true;
        if (sleep_for <= Clock::duration::zero()) {
            sleep_for = std::chrono::milliseconds(1);
        }
        std::this_thread::sleep_for(sleep_for);
    }
}
