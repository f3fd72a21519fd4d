/**
 * CandidateSource.cpp - Implementation
 */

#include "tmdbsync/CandidateSource.h"
#include "tmdbsync/NdjsonFile.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    void log_warn(const std::string& msg) {
        std::cerr << "⚠️  " << msg << std::endl;
    }

    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    // Deduplicates while keeping first-seen order
    class CandidateCollector {
    public:
        explicit CandidateCollector(CandidateList& out) : out_(out) {}

        void add(EntityKey key, json context = nullptr) {
            if (!seen_.insert(key).second) {
                out_.duplicates++;
                return;
            }
            out_.candidates.push_back(CandidateKey{std::move(key), std::move(context)});
        }

    private:
        CandidateList& out_;
        EntityKeySet seen_;
    };

    void read_input(const std::string& path, const ndjson::LineVisitor& visit) {
        if (!ndjson::for_each_line(path, visit)) {
            throw std::runtime_error("Input file not found: " + path);
        }
    }

    void report(const std::string& path, const CandidateList& list) {
        if (list.malformed_lines > 0 || list.unusable_records > 0) {
            log_warn(fs::path(path).filename().string() + ": " +
                     std::to_string(list.malformed_lines) + " invalid JSON lines, " +
                     std::to_string(list.unusable_records) + " records without usable keys");
        }
    }
}

std::string resolve_data_path(const std::string& data_dir, const std::string& file) {
    return (fs::path(data_dir) / file).string();
}

// ============================================================================
// ListingSource
// ============================================================================

ListingSource::ListingSource(std::string input_file, std::vector<std::string> key_fields)
    : input_file_(std::move(input_file)), key_fields_(std::move(key_fields)) {}

CandidateList ListingSource::load(const std::string& data_dir) const {
    const std::string path = resolve_data_path(data_dir, input_file_);
    CandidateList list;
    CandidateCollector collector(list);

    read_input(path, [&](const std::string& line) {
        auto record = ndjson::parse_object(line);
        if (!record) {
            list.malformed_lines++;
            return;
        }
        auto key = EntityKey::from_record(*record, key_fields_);
        if (!key) {
            list.unusable_records++;
            return;
        }
        collector.add(std::move(*key));
    });

    report(path, list);
    return list;
}

std::string ListingSource::describe() const {
    return "listing " + input_file_;
}

// ============================================================================
// NestedListingSource
// ============================================================================

NestedListingSource::NestedListingSource(std::string input_file,
                                         std::string parent_key_field,
                                         std::string list_field,
                                         std::string child_key_field)
    : input_file_(std::move(input_file)),
      parent_key_field_(std::move(parent_key_field)),
      list_field_(std::move(list_field)),
      child_key_field_(std::move(child_key_field)) {}

CandidateList NestedListingSource::load(const std::string& data_dir) const {
    const std::string path = resolve_data_path(data_dir, input_file_);
    CandidateList list;
    CandidateCollector collector(list);

    read_input(path, [&](const std::string& line) {
        auto record = ndjson::parse_object(line);
        if (!record) {
            list.malformed_lines++;
            return;
        }
        auto parent = EntityKey::from_record(*record, {parent_key_field_});
        auto nested = record->find(list_field_);
        if (!parent || nested == record->end() || !nested->is_array()) {
            list.unusable_records++;
            return;
        }
        for (const auto& item : *nested) {
            if (!item.is_object()) continue;
            auto child = item.find(child_key_field_);
            if (child == item.end()) continue;
            auto part = EntityKey::part_from_json(*child);
            if (!part) continue;
            collector.add(parent->with(std::move(*part)));
        }
    });

    report(path, list);
    return list;
}

std::string NestedListingSource::describe() const {
    return "nested " + input_file_ + ":" + list_field_ + "[]." + child_key_field_;
}

// ============================================================================
// SequenceSource
// ============================================================================

SequenceSource::SequenceSource(std::string input_file,
                               std::vector<std::string> parent_key_fields,
                               std::string count_field,
                               std::vector<std::string> context_fields,
                               int64_t max_count)
    : input_file_(std::move(input_file)),
      parent_key_fields_(std::move(parent_key_fields)),
      count_field_(std::move(count_field)),
      context_fields_(std::move(context_fields)),
      max_count_(max_count) {
    if (max_count_ < 0) {
        throw std::invalid_argument("sequence max count must not be negative");
    }
}

CandidateList SequenceSource::load(const std::string& data_dir) const {
    const std::string path = resolve_data_path(data_dir, input_file_);
    CandidateList list;
    CandidateCollector collector(list);
    uint64_t derived = 0;
    uint64_t over_limit = 0;

    read_input(path, [&](const std::string& line) {
        auto record = ndjson::parse_object(line);
        if (!record) {
            list.malformed_lines++;
            return;
        }
        auto parent = EntityKey::from_record(*record, parent_key_fields_);
        auto count = record->find(count_field_);
        if (!parent || count == record->end() || !count->is_number_integer() || count->get<int64_t>() < 0) {
            list.unusable_records++;
            return;
        }
        if (count->get<int64_t>() > max_count_) {
            list.unusable_records++;
            over_limit++;
            return;
        }

        json context = json::object();
        for (const auto& field : context_fields_) {
            auto it = record->find(field);
            context[field] = (it == record->end()) ? json(nullptr) : *it;
        }

        const int64_t n = count->get<int64_t>();
        for (int64_t i = 1; i <= n; ++i) {
            collector.add(parent->with(KeyPart(i)), context);
            derived++;
        }
    });

    report(path, list);
    if (over_limit > 0) {
        log_warn(fs::path(path).filename().string() + ": " + std::to_string(over_limit) + " records with " +
                 count_field_ + " above " + std::to_string(max_count_));
    }
    log_info(fs::path(path).filename().string() + ": derived " + std::to_string(derived) +
             " keys from " + count_field_);
    return list;
}

std::string SequenceSource::describe() const {
    return "sequence 1.." + count_field_ + " from " + input_file_;
}
