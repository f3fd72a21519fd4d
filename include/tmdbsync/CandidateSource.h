/**
 * CandidateSource.h - Where candidate identity keys come from
 *
 * ListingSource        keys read from another store or a daily ID export
 *                      (plain or gzip-compressed NDJSON)
 * NestedListingSource  (parent key, child key) pairs from a list nested in
 *                      each parent record, e.g. a series' seasons_index
 * SequenceSource       (parent key..., n) for n in 1..count, e.g. episode
 *                      numbers derived from a season's episode_count; a
 *                      count above max_count makes the record unusable
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tmdbsync/EntityKey.h"

using json = nlohmann::json;

struct CandidateKey {
    EntityKey key;
    // Fields inherited from the parent record, null when there are none
    json context;
};

struct CandidateList {
    std::vector<CandidateKey> candidates;
    uint64_t malformed_lines = 0;
    uint64_t unusable_records = 0;
    uint64_t duplicates = 0;
};

class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    // Throws std::runtime_error when the input file does not exist
    virtual CandidateList load(const std::string& data_dir) const = 0;

    virtual std::string input_file() const = 0;
    virtual std::string describe() const = 0;
};

class ListingSource : public CandidateSource {
public:
    ListingSource(std::string input_file, std::vector<std::string> key_fields);

    CandidateList load(const std::string& data_dir) const override;
    std::string input_file() const override { return input_file_; }
    std::string describe() const override;

private:
    std::string input_file_;
    std::vector<std::string> key_fields_;
};

class NestedListingSource : public CandidateSource {
public:
    NestedListingSource(std::string input_file,
                        std::string parent_key_field,
                        std::string list_field,
                        std::string child_key_field);

    CandidateList load(const std::string& data_dir) const override;
    std::string input_file() const override { return input_file_; }
    std::string describe() const override;

private:
    std::string input_file_;
    std::string parent_key_field_;
    std::string list_field_;
    std::string child_key_field_;
};

class SequenceSource : public CandidateSource {
public:
    static constexpr int64_t DEFAULT_MAX_COUNT = 10000;

    SequenceSource(std::string input_file,
                   std::vector<std::string> parent_key_fields,
                   std::string count_field,
                   std::vector<std::string> context_fields,
                   int64_t max_count = DEFAULT_MAX_COUNT);

    CandidateList load(const std::string& data_dir) const override;
    std::string input_file() const override { return input_file_; }
    std::string describe() const override;

private:
    std::string input_file_;
    std::vector<std::string> parent_key_fields_;
    std::string count_field_;
    std::vector<std::string> context_fields_;
    int64_t max_count_;
};

std::string resolve_data_path(const std::string& data_dir, const std::string& file);
