/**
 * RequestExecutor.h - One logical API call with classification and retry
 *
 * Outcome classes:
 *   404                 -> NotFound, counted, no retry
 *   401                 -> AuthFailure exception, aborts the run
 *   429                 -> retried; Retry-After honored, else backoff
 *   no status / timeout -> retried with backoff
 *   2xx, invalid JSON   -> retried with backoff
 *   any other status    -> terminal, counted as http_<code>
 *
 * Backoff starts at base_backoff_seconds and grows by a uniformly
 * jittered factor in [1.5, 2.0) after each retry, capped at
 * max_backoff_seconds. A Retry-After hint is also capped.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "tmdbsync/EngineConfig.h"
#include "tmdbsync/HttpTransport.h"
#include "tmdbsync/RateLimiter.h"
#include "tmdbsync/RunCounters.h"

using json = nlohmann::json;

class AuthFailure : public std::runtime_error {
public:
    explicit AuthFailure(const std::string& msg) : std::runtime_error(msg) {}
};

namespace error_category {
    constexpr const char* NOT_FOUND = "not_found";
    constexpr const char* RATE_LIMITED_EXHAUSTED = "rate_limited_exhausted";
    constexpr const char* NETWORK_EXHAUSTED = "network_exhausted";
    constexpr const char* INVALID_PAYLOAD_EXHAUSTED = "invalid_payload_exhausted";
    constexpr const char* MALFORMED_LOCAL_RECORD = "malformed_local_record";
    constexpr const char* DUPLICATE_LOCAL_RECORD = "duplicate_local_record";
    constexpr const char* UNKEYED_ROW = "unkeyed_row";
    constexpr const char* DUPLICATE_ROW = "duplicate_row";
    constexpr const char* INTERNAL = "internal_error";

    std::string http_status(int status);
}

enum class FetchStatus {
    SUCCEEDED,
    FAILED_TERMINAL,
    FAILED_TRANSIENT_EXHAUSTED
};

struct FetchResult {
    FetchStatus status = FetchStatus::FAILED_TERMINAL;
    std::optional<json> payload;
    int attempts = 0;
    std::string error_category;

    bool ok() const { return status == FetchStatus::SUCCEEDED && payload.has_value(); }
};

using QueryParams = std::map<std::string, std::string>;

class RequestExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RequestExecutor(
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<RateLimiter> limiter,
        std::shared_ptr<ErrorCounter> errors,
        const EngineConfig& config,
        std::string bearer_token
    );

    // Throws AuthFailure on 401. Every other failure is counted and
    // reflected in the returned status.
    FetchResult fetch(const std::string& endpoint, const QueryParams& params = {});

    std::string build_url(const std::string& endpoint, const QueryParams& params) const;

    // Tests replace the real sleep to observe requested delays
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_random_seed(uint32_t seed);

    // Delay before the next attempt; also advances `backoff_seconds`
    std::chrono::milliseconds next_delay(double& backoff_seconds,
                                         const HttpGetResponse* rate_limited_response);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<ErrorCounter> errors_;
    std::string api_host_;
    std::string bearer_token_;
    std::string user_agent_;
    int max_attempts_;
    double base_backoff_seconds_;
    double max_backoff_seconds_;

    Sleeper sleeper_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;

    double jitter_factor();
    static std::optional<double> parse_retry_after(const std::string& value);
};
