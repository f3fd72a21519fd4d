/**
 * HttpRuntime.h - Process-wide AWS SDK lifetime and shared HTTP client
 *
 * The SDK must be initialized once before any client is built and shut
 * down once after the last client is released. The runtime owns both ends
 * and hands out one pooled Aws::Http::HttpClient shared by all workers.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <aws/core/Aws.h>
#include <aws/core/http/HttpClient.h>

struct HttpClientSettings {
    long connect_timeout_ms = 10000;
    long request_timeout_ms = 45000;
    unsigned max_connections = 64;
    std::string user_agent = "tmdbsync/1.0";
};

class HttpRuntime {
public:
    static HttpRuntime& instance();

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return initialized_;
    }

    // Idempotent; the first call's settings win until shutdown()
    void initialize(const HttpClientSettings& settings);

    std::shared_ptr<Aws::Http::HttpClient> get_http_client() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return http_client_;
    }

    void shutdown();

    ~HttpRuntime();

private:
    HttpRuntime();

    static std::unique_ptr<HttpRuntime> instance_;
    static std::mutex instance_mutex_;

    bool initialized_{false};
    Aws::SDKOptions aws_options_;
    std::shared_ptr<Aws::Http::HttpClient> http_client_;
    mutable std::mutex state_mutex_;
};
