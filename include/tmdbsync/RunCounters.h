/**
 * RunCounters.h - Thread-safe failure tallies and live progress
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * ErrorCounter - failure categories ("not_found", "http_500", ...) -> count
 */
class ErrorCounter {
public:
    void inc(const std::string& category, uint64_t by = 1);

    uint64_t get(const std::string& category) const;
    std::map<std::string, uint64_t> get_all() const;
    uint64_t total() const;

    // "k=v ; k=v" sorted by category, empty when nothing was counted
    std::string format_breakdown() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counts_;
};

/**
 * ProgressReporter - processed/ok/added/updated/errors against a total.
 *
 * Rendering rewrites a single stderr line and is rate limited so that large
 * runs do not spend their time on the terminal.
 */
class ProgressReporter {
public:
    struct Snapshot {
        uint64_t total = 0;
        uint64_t will_add = 0;
        uint64_t will_update = 0;
        uint64_t processed = 0;
        uint64_t ok = 0;
        uint64_t added = 0;
        uint64_t updated = 0;
        uint64_t errors = 0;
    };

    explicit ProgressReporter(std::string label = "", bool render_enabled = true);

    void set_total(uint64_t total);
    void set_estimates(uint64_t will_add, uint64_t will_update);

    void record_processed();
    void record_success(bool was_update);
    void set_errors(uint64_t errors);

    Snapshot snapshot() const;
    json to_json() const;

    void render(bool force = false);
    // Terminates the progress line
    void finish();

private:
    std::string label_;
    bool render_enabled_;
    mutable std::mutex mutex_;
    Snapshot state_;
    uint64_t last_render_ms_ = 0;
    bool rendered_ = false;
};
