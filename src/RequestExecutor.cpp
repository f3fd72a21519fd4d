/**
 * RequestExecutor.cpp - Implementation
 */

#include "tmdbsync/RequestExecutor.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <aws/core/utils/StringUtils.h>

namespace {
    void log_warn(const std::string& msg) {
        std::cerr << "⚠️  " << msg << std::endl;
    }

    enum class AttemptClass {
        SUCCESS,
        NOT_FOUND,
        UNAUTHORIZED,
        RATE_LIMITED,
        NETWORK,
        INVALID_PAYLOAD,
        OTHER_STATUS
    };

    AttemptClass classify(const HttpGetResponse& response) {
        if (!response.has_status()) return AttemptClass::NETWORK;
        if (response.status >= 200 && response.status < 300) return AttemptClass::SUCCESS;
        switch (response.status) {
            case 404: return AttemptClass::NOT_FOUND;
            case 401: return AttemptClass::UNAUTHORIZED;
            case 429: return AttemptClass::RATE_LIMITED;
            default:  return AttemptClass::OTHER_STATUS;
        }
    }
}

std::string error_category::http_status(int status) {
    return "http_" + std::to_string(status);
}

RequestExecutor::RequestExecutor(
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<RateLimiter> limiter,
    std::shared_ptr<ErrorCounter> errors,
    const EngineConfig& config,
    std::string bearer_token)
    : transport_(std::move(transport)),
      limiter_(std::move(limiter)),
      errors_(std::move(errors)),
      api_host_(config.api_host),
      bearer_token_(std::move(bearer_token)),
      user_agent_("tmdbsync/1.0"),
      max_attempts_(config.max_attempts),
      base_backoff_seconds_(config.base_backoff_seconds),
      max_backoff_seconds_(config.max_backoff_seconds),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      rng_(std::random_device{}()) {
    if (!transport_ || !limiter_ || !errors_) {
        throw std::invalid_argument("RequestExecutor requires transport, limiter and error counter");
    }
    while (!api_host_.empty() && api_host_.back() == '/') {
        api_host_.pop_back();
    }
}

void RequestExecutor::set_random_seed(uint32_t seed) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    rng_.seed(seed);
}

double RequestExecutor::jitter_factor() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(1.5, 2.0);
    return dist(rng_);
}

std::optional<double> RequestExecutor::parse_retry_after(const std::string& value) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(value, &consumed);
        if (consumed == 0 || !std::isfinite(seconds) || seconds < 0) return std::nullopt;
        return seconds;
    } catch (const std::exception&) {
        // HTTP-date form or garbage: fall back to our own backoff
        return std::nullopt;
    }
}

std::chrono::milliseconds RequestExecutor::next_delay(double& backoff_seconds,
                                                      const HttpGetResponse* rate_limited_response) {
    double wait_seconds = backoff_seconds;
    if (rate_limited_response) {
        if (const auto* hint = rate_limited_response->header("retry-after")) {
            if (auto parsed = parse_retry_after(*hint)) {
                wait_seconds = *parsed;
            }
        }
    }
    wait_seconds = std::min(wait_seconds, max_backoff_seconds_);
    backoff_seconds = std::min(max_backoff_seconds_, backoff_seconds * jitter_factor());

    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(wait_seconds * 1000.0)));
}

std::string RequestExecutor::build_url(const std::string& endpoint, const QueryParams& params) const {
    std::string url = api_host_;
    if (endpoint.empty() || endpoint.front() != '/') url += '/';
    url += endpoint;

    bool first = true;
    for (const auto& [name, value] : params) {
        url += first ? '?' : '&';
        url += Aws::Utils::StringUtils::URLEncode(name.c_str()).c_str();
        url += '=';
        url += Aws::Utils::StringUtils::URLEncode(value.c_str()).c_str();
        first = false;
    }
    return url;
}

FetchResult RequestExecutor::fetch(const std::string& endpoint, const QueryParams& params) {
    HttpGetRequest request;
    request.url = build_url(endpoint, params);
    request.headers = {
        {"Authorization", "Bearer " + bearer_token_},
        {"Accept", "application/json"},
        {"User-Agent", user_agent_}
    };

    FetchResult result;
    double backoff_seconds = base_backoff_seconds_;

    for (int attempt = 1; ; ++attempt) {
        result.attempts = attempt;
        limiter_->acquire();

        HttpGetResponse response;
        try {
            response = transport_->get(request);
        } catch (const std::exception& e) {
            response = HttpGetResponse{};
            response.transport_error = e.what();
        }

        const char* exhausted_category = nullptr;
        switch (classify(response)) {
            case AttemptClass::SUCCESS: {
                json payload = json::parse(response.body, nullptr, false);
                if (!payload.is_discarded()) {
                    result.status = FetchStatus::SUCCEEDED;
                    result.payload = std::move(payload);
                    return result;
                }
                exhausted_category = error_category::INVALID_PAYLOAD_EXHAUSTED;
                break;
            }
            case AttemptClass::NOT_FOUND:
                errors_->inc(error_category::NOT_FOUND);
                result.status = FetchStatus::FAILED_TERMINAL;
                result.error_category = error_category::NOT_FOUND;
                return result;
            case AttemptClass::UNAUTHORIZED:
                throw AuthFailure("401 Unauthorized for " + endpoint + ": check TMDB_BEARER");
            case AttemptClass::RATE_LIMITED:
                exhausted_category = error_category::RATE_LIMITED_EXHAUSTED;
                break;
            case AttemptClass::NETWORK:
                exhausted_category = error_category::NETWORK_EXHAUSTED;
                break;
            case AttemptClass::OTHER_STATUS:
                result.status = FetchStatus::FAILED_TERMINAL;
                result.error_category = error_category::http_status(response.status);
                errors_->inc(result.error_category);
                return result;
        }

        if (attempt >= max_attempts_) {
            errors_->inc(exhausted_category);
            result.status = FetchStatus::FAILED_TRANSIENT_EXHAUSTED;
            result.error_category = exhausted_category;
            if (!response.has_status()) {
                log_warn("Giving up on " + endpoint + " after " + std::to_string(attempt) +
                         " attempts: " + response.transport_error);
            }
            return result;
        }

        const HttpGetResponse* hint_source = response.status == 429 ? &response : nullptr;
        sleeper_(next_delay(backoff_seconds, hint_source));
    }
}
