/**
 * ConcurrentFetchScheduler.cpp - Implementation
 */

#include "tmdbsync/ConcurrentFetchScheduler.h"
#include "tmdbsync/ThreadPool.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace {
    struct Completion {
        size_t index = 0;
        std::optional<FetchResult> result;
        std::exception_ptr error;
    };

    TargetState state_for(const FetchResult& result) {
        switch (result.status) {
            case FetchStatus::SUCCEEDED:
                return result.payload ? TargetState::SUCCEEDED : TargetState::FAILED_TERMINAL;
            case FetchStatus::FAILED_TRANSIENT_EXHAUSTED:
                return TargetState::FAILED_TRANSIENT_EXHAUSTED;
            case FetchStatus::FAILED_TERMINAL:
            default:
                return TargetState::FAILED_TERMINAL;
        }
    }
}

const char* target_state_name(TargetState state) {
    switch (state) {
        case TargetState::PENDING: return "PENDING";
        case TargetState::IN_FLIGHT: return "IN_FLIGHT";
        case TargetState::SUCCEEDED: return "SUCCEEDED";
        case TargetState::FAILED_TERMINAL: return "FAILED_TERMINAL";
        case TargetState::FAILED_TRANSIENT_EXHAUSTED: return "FAILED_TRANSIENT_EXHAUSTED";
    }
    return "UNKNOWN";
}

ConcurrentFetchScheduler::ConcurrentFetchScheduler(size_t max_workers, size_t max_in_flight)
    : max_workers_(max_workers), max_in_flight_(max_in_flight) {
    if (max_workers_ == 0 || max_in_flight_ == 0) {
        throw std::invalid_argument("scheduler needs at least one worker and one in-flight slot");
    }
}

ConcurrentFetchScheduler::Stats ConcurrentFetchScheduler::run(
    const std::vector<Target>& targets,
    const FetchFn& fetch,
    const CompletionHandler& on_complete) {

    Stats stats;
    states_.assign(targets.size(), TargetState::PENDING);
    if (targets.empty()) return stats;

    std::mutex completions_mutex;
    std::condition_variable completions_cv;
    std::deque<Completion> completions;

    ThreadPool pool(std::min(max_workers_, targets.size()));

    size_t next = 0;
    size_t in_flight = 0;
    std::exception_ptr abort_error;

    auto submit = [&](size_t index) {
        states_[index] = TargetState::IN_FLIGHT;
        bool accepted = pool.enqueue([&, index]() {
            Completion done;
            done.index = index;
            try {
                done.result = fetch(targets[index]);
            } catch (...) {
                done.error = std::current_exception();
            }
            {
                std::lock_guard<std::mutex> lock(completions_mutex);
                completions.push_back(std::move(done));
            }
            completions_cv.notify_one();
        });
        if (!accepted) {
            states_[index] = TargetState::PENDING;
            throw std::runtime_error("worker pool refused a fetch task");
        }
        in_flight++;
        stats.submitted++;
        stats.peak_in_flight = std::max(stats.peak_in_flight, in_flight);
    };

    auto admit = [&]() {
        while (!abort_error && next < targets.size() && in_flight < max_in_flight_) {
            try {
                submit(next++);
            } catch (...) {
                abort_error = std::current_exception();
            }
        }
    };

    admit();

    while (in_flight > 0) {
        Completion done;
        {
            std::unique_lock<std::mutex> lock(completions_mutex);
            completions_cv.wait(lock, [&]() { return !completions.empty(); });
            done = std::move(completions.front());
            completions.pop_front();
        }
        in_flight--;
        stats.completed++;

        if (done.error) {
            states_[done.index] = TargetState::FAILED_TERMINAL;
            stats.failed_terminal++;
            if (!abort_error) abort_error = done.error;
        } else {
            const FetchResult& result = *done.result;
            TargetState state = state_for(result);
            states_[done.index] = state;
            if (state == TargetState::SUCCEEDED) {
                stats.succeeded++;
            } else if (state == TargetState::FAILED_TRANSIENT_EXHAUSTED) {
                stats.failed_exhausted++;
            } else {
                stats.failed_terminal++;
            }

            if (!abort_error) {
                try {
                    on_complete(targets[done.index], result);
                } catch (...) {
                    abort_error = std::current_exception();
                }
            }
        }

        admit();
    }

    pool.shutdown();

    if (abort_error) {
        std::rethrow_exception(abort_error);
    }
    return stats;
}
