/**
 * RunCounters.cpp - Implementation
 */

#include "tmdbsync/RunCounters.h"
#include <chrono>
#include <iostream>
#include <sstream>

namespace {
    uint64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    constexpr uint64_t RENDER_INTERVAL_MS = 200;
}

// ============================================================================
// ErrorCounter
// ============================================================================

void ErrorCounter::inc(const std::string& category, uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[category] += by;
}

uint64_t ErrorCounter::get(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(category);
    return it == counts_.end() ? 0 : it->second;
}

std::map<std::string, uint64_t> ErrorCounter::get_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

uint64_t ErrorCounter::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t sum = 0;
    for (const auto& [category, count] : counts_) {
        sum += count;
    }
    return sum;
}

std::string ErrorCounter::format_breakdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    bool first = true;
    for (const auto& [category, count] : counts_) {
        if (!first) oss << " ; ";
        oss << category << "=" << count;
        first = false;
    }
    return oss.str();
}

// ============================================================================
// ProgressReporter
// ============================================================================

ProgressReporter::ProgressReporter(std::string label, bool render_enabled)
    : label_(std::move(label)), render_enabled_(render_enabled) {}

void ProgressReporter::set_total(uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.total = total;
}

void ProgressReporter::set_estimates(uint64_t will_add, uint64_t will_update) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.will_add = will_add;
    state_.will_update = will_update;
}

void ProgressReporter::record_processed() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.processed++;
}

void ProgressReporter::record_success(bool was_update) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.ok++;
    if (was_update) {
        state_.updated++;
    } else {
        state_.added++;
    }
}

void ProgressReporter::set_errors(uint64_t errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.errors = errors;
}

ProgressReporter::Snapshot ProgressReporter::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

json ProgressReporter::to_json() const {
    auto s = snapshot();
    return json{
        {"total", s.total},
        {"will_add", s.will_add},
        {"will_update", s.will_update},
        {"processed", s.processed},
        {"ok", s.ok},
        {"added", s.added},
        {"updated", s.updated},
        {"errors", s.errors}
    };
}

void ProgressReporter::render(bool force) {
    if (!render_enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = now_ms();
    bool done = state_.total > 0 && state_.processed >= state_.total;
    if (!force && !done && now - last_render_ms_ < RENDER_INTERVAL_MS) return;
    last_render_ms_ = now;
    rendered_ = true;

    std::cerr << "\r[" << label_ << "] " << state_.processed << "/" << state_.total
              << " | ok=" << state_.ok
              << " | added=" << state_.added << "/" << state_.will_add
              << " | updated=" << state_.updated << "/" << state_.will_update
              << " | errors=" << state_.errors << std::flush;
}

void ProgressReporter::finish() {
    if (!render_enabled_) return;
    render(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (rendered_) {
        std::cerr << std::endl;
        rendered_ = false;
    }
}
