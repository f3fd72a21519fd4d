/**
 * ExistingStateScanner.cpp - Implementation
 */

#include "tmdbsync/ExistingStateScanner.h"
#include "tmdbsync/NdjsonFile.h"
#include <iostream>

namespace {
    void log_warn(const std::string& msg) {
        std::cerr << "⚠️  " << msg << std::endl;
    }
}

ExistingStateScanner::ExistingStateScanner(std::vector<std::string> key_fields,
                                           std::shared_ptr<const RefreshPolicy> policy,
                                           CivilDate today,
                                           KeyCardinality cardinality)
    : key_fields_(std::move(key_fields)),
      policy_(std::move(policy)),
      today_(today),
      cardinality_(cardinality) {}

ExistingState ExistingStateScanner::scan(const std::string& store_path) const {
    ExistingState state;
    const bool scan_time_policy = policy_ && !policy_->uses_parent_context();

    state.store_exists = ndjson::for_each_line(store_path, [&](const std::string& line) {
        auto record = ndjson::parse_object(line);
        if (!record) {
            state.malformed_lines++;
            return;
        }
        auto key = EntityKey::from_record(*record, key_fields_);
        if (!key) {
            state.malformed_lines++;
            return;
        }

        state.valid_lines++;
        if (!state.keys.insert(*key).second && cardinality_ == KeyCardinality::ONE_LINE) {
            state.duplicate_lines++;
        }

        if (scan_time_policy && policy_->is_due(*record, today_) &&
            state.refresh_due.insert(*key).second) {
            state.refresh_order.push_back(*key);
        }
    });

    if (state.malformed_lines > 0 || state.duplicate_lines > 0) {
        log_warn(store_path + ": " + std::to_string(state.malformed_lines) + " malformed lines, " +
                 std::to_string(state.duplicate_lines) + " duplicate keys");
    }
    return state;
}
