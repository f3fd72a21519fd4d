/**
 * FakeTransport.h - Scripted HttpTransport for tests
 *
 * Responses are looked up by URL path (host and query stripped). A path
 * with a scripted queue pops one response per call and repeats the last
 * one when the queue runs dry. Unscripted paths go to the fallback
 * handler, or answer 404.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "tmdbsync/HttpTransport.h"

using json = nlohmann::json;

class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpGetResponse(const std::string& path)>;

    static HttpGetResponse ok(const json& body) {
        HttpGetResponse r;
        r.status = 200;
        r.body = body.dump();
        return r;
    }

    static HttpGetResponse status(int code, const std::string& body = "") {
        HttpGetResponse r;
        r.status = code;
        r.body = body;
        return r;
    }

    static HttpGetResponse rate_limited(const std::string& retry_after) {
        HttpGetResponse r = status(429, "{\"status_code\":25}");
        if (!retry_after.empty()) r.headers["retry-after"] = retry_after;
        return r;
    }

    static HttpGetResponse network_error(const std::string& what = "connection reset") {
        HttpGetResponse r;
        r.transport_error = what;
        return r;
    }

    void script(const std::string& path, std::vector<HttpGetResponse> responses) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[path] = std::move(responses);
    }

    void set_fallback(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(handler);
    }

    void set_latency(std::chrono::milliseconds latency) { latency_ms_ = latency.count(); }

    HttpGetResponse get(const HttpGetRequest& request) override {
        const std::string path = path_of(request.url);
        size_t now_active = ++active_;
        size_t peak = peak_active_.load();
        while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active)) {}

        if (latency_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_.load()));
        }

        HttpGetResponse response;
        Handler fallback;
        bool scripted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            calls_[path]++;
            auto it = scripts_.find(path);
            if (it != scripts_.end() && !it->second.empty()) {
                response = it->second.front();
                if (it->second.size() > 1) it->second.erase(it->second.begin());
                scripted = true;
            } else {
                fallback = fallback_;
            }
        }
        if (!scripted) {
            response = fallback ? fallback(path) : status(404, "{\"status_code\":34}");
        }

        --active_;
        return response;
    }

    size_t calls(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(path);
        return it == calls_.end() ? 0 : it->second;
    }

    size_t total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<HttpGetRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t peak_concurrency() const { return peak_active_.load(); }

    static std::string path_of(const std::string& url) {
        size_t start = url.find("://");
        start = (start == std::string::npos) ? 0 : url.find('/', start + 3);
        if (start == std::string::npos) return "/";
        size_t end = url.find('?', start);
        std::string path = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
        // Drop the API version prefix so scripts read like TMDB endpoints
        if (path.rfind("/3/", 0) == 0) path = path.substr(2);
        return path;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<HttpGetResponse>> scripts_;
    std::map<std::string, size_t> calls_;
    std::vector<HttpGetRequest> requests_;
    Handler fallback_;
    std::atomic<long long> latency_ms_{0};
    std::atomic<size_t> active_{0};
    std::atomic<size_t> peak_active_{0};
};
