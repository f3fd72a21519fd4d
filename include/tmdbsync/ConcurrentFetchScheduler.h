/**
 * ConcurrentFetchScheduler.h - Sliding admission window over a ThreadPool
 *
 * At most `max_in_flight` targets are submitted at any time. The window is
 * primed, then one pending target is submitted for every completion, so the
 * pool never idles between batches. Completions are handed to the caller's
 * handler on the coordinating thread, in arrival order.
 *
 * There is no cancellation. If a fetch throws (AuthFailure) or the handler
 * throws, no further targets are admitted, the in-flight ones are drained,
 * and the first exception is rethrown to the caller.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include "tmdbsync/RequestExecutor.h"
#include "tmdbsync/TargetSetBuilder.h"

enum class TargetState {
    PENDING,
    IN_FLIGHT,
    SUCCEEDED,
    FAILED_TERMINAL,
    FAILED_TRANSIENT_EXHAUSTED
};

const char* target_state_name(TargetState state);

class ConcurrentFetchScheduler {
public:
    using FetchFn = std::function<FetchResult(const Target&)>;
    using CompletionHandler = std::function<void(const Target&, const FetchResult&)>;

    struct Stats {
        uint64_t submitted = 0;
        uint64_t completed = 0;
        uint64_t succeeded = 0;
        uint64_t failed_terminal = 0;
        uint64_t failed_exhausted = 0;
        size_t peak_in_flight = 0;
    };

    ConcurrentFetchScheduler(size_t max_workers, size_t max_in_flight);

    Stats run(const std::vector<Target>& targets,
              const FetchFn& fetch,
              const CompletionHandler& on_complete);

    // Per-target state after the last run(), indexed like `targets`
    const std::vector<TargetState>& states() const { return states_; }

    size_t max_workers() const { return max_workers_; }
    size_t max_in_flight() const { return max_in_flight_; }

private:
    size_t max_workers_;
    size_t max_in_flight_;
    std::vector<TargetState> states_;
};
