/**
 * AtomicMergeWriter.h - Rewrites a store through a temp file and rename
 *
 * The temp file is "<store>.tmp" in the store's own directory: rename(2)
 * is only atomic within one filesystem, so the temp file must never live
 * elsewhere (e.g. /tmp).
 *
 *   open(T)   copy every stored line whose key is not in T (retained set);
 *             in a one-line-per-key store only the first line of a key is kept
 *   append()  add a freshly projected record; safe from any thread
 *   commit()  flush, fsync, rename over the store, fsync the directory
 *
 * A writer destroyed before commit() removes its temp file and leaves the
 * store untouched.
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tmdbsync/EntityKey.h"

using json = nlohmann::json;

class AtomicMergeWriter {
public:
    AtomicMergeWriter(std::string store_path,
                      std::vector<std::string> key_fields,
                      KeyCardinality cardinality = KeyCardinality::ONE_LINE);
    ~AtomicMergeWriter();

    AtomicMergeWriter(const AtomicMergeWriter&) = delete;
    AtomicMergeWriter& operator=(const AtomicMergeWriter&) = delete;

    // Creates the temp file and copies the retained lines. Throws
    // std::runtime_error on I/O failure.
    void open(const EntityKeySet& targets);

    // Creates an empty temp file; nothing from the current store is kept
    void open_fresh();

    void append(const json& record);

    void commit();
    void abort();

    const std::string& store_path() const { return store_path_; }
    const std::string& temp_path() const { return temp_path_; }

    uint64_t retained() const { return retained_; }
    uint64_t appended() const;
    uint64_t dropped_malformed() const { return dropped_malformed_; }
    uint64_t dropped_duplicates() const { return dropped_duplicates_; }
    uint64_t total() const { return retained_ + appended(); }

    bool is_open() const { return file_ != nullptr; }
    bool committed() const { return committed_; }

private:
    std::string store_path_;
    std::string temp_path_;
    std::vector<std::string> key_fields_;
    KeyCardinality cardinality_;

    std::FILE* file_ = nullptr;
    bool committed_ = false;
    mutable std::mutex write_mutex_;

    uint64_t retained_ = 0;
    uint64_t appended_ = 0;
    uint64_t dropped_malformed_ = 0;
    uint64_t dropped_duplicates_ = 0;

    void create_temp();
    void write_line(const std::string& line);
    void close_file();
};
