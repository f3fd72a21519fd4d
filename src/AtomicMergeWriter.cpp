/**
 * AtomicMergeWriter.cpp - Implementation
 */

#include "tmdbsync/AtomicMergeWriter.h"
#include "tmdbsync/NdjsonFile.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    void log_warn(const std::string& msg) {
        std::cerr << "⚠️  " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    std::runtime_error io_error(const std::string& what, const std::string& path) {
        return std::runtime_error(what + " " + path + ": " + std::strerror(errno));
    }

    // Makes the rename itself durable
    void sync_directory(const fs::path& dir) {
        int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
        if (fd < 0) return;
        if (::fsync(fd) != 0) {
            log_warn("fsync failed on directory " + dir.string());
        }
        ::close(fd);
    }
}

AtomicMergeWriter::AtomicMergeWriter(std::string store_path,
                                     std::vector<std::string> key_fields,
                                     KeyCardinality cardinality)
    : store_path_(std::move(store_path)),
      temp_path_(store_path_ + ".tmp"),
      key_fields_(std::move(key_fields)),
      cardinality_(cardinality) {}

AtomicMergeWriter::~AtomicMergeWriter() {
    if (!committed_) {
        abort();
    }
}

void AtomicMergeWriter::create_temp() {
    if (file_) {
        throw std::logic_error("writer already open for " + store_path_);
    }

    std::error_code ec;
    fs::path parent = fs::path(store_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    // A leftover from a crashed run is never read; just replace it
    file_ = std::fopen(temp_path_.c_str(), "wb");
    if (!file_) {
        throw io_error("Failed to create temp file", temp_path_);
    }
    committed_ = false;
}

void AtomicMergeWriter::open_fresh() {
    create_temp();
}

void AtomicMergeWriter::open(const EntityKeySet& targets) {
    create_temp();

    EntityKeySet copied;
    ndjson::for_each_line(store_path_, [&](const std::string& line) {
        auto record = ndjson::parse_object(line);
        std::optional<EntityKey> key;
        if (record) key = EntityKey::from_record(*record, key_fields_);
        if (!key) {
            dropped_malformed_++;
            return;
        }
        if (targets.count(*key) > 0) return;
        if (!copied.insert(*key).second && cardinality_ == KeyCardinality::ONE_LINE) {
            dropped_duplicates_++;
            return;
        }
        write_line(line);
        retained_++;
    });

    if (dropped_malformed_ > 0 || dropped_duplicates_ > 0) {
        log_warn(store_path_ + ": dropped " + std::to_string(dropped_malformed_) + " malformed and " +
                 std::to_string(dropped_duplicates_) + " duplicate lines while rewriting");
    }
}

void AtomicMergeWriter::write_line(const std::string& line) {
    if (std::fwrite(line.data(), 1, line.size(), file_) != line.size() ||
        std::fputc('\n', file_) == EOF) {
        throw io_error("Failed to write", temp_path_);
    }
}

void AtomicMergeWriter::append(const json& record) {
    std::string line = ndjson::dump_line(record);
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!file_) {
        throw std::logic_error("append on a writer that is not open: " + store_path_);
    }
    write_line(line);
    appended_++;
}

uint64_t AtomicMergeWriter::appended() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return appended_;
}

void AtomicMergeWriter::commit() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!file_) {
        throw std::logic_error("commit on a writer that is not open: " + store_path_);
    }

    if (std::fflush(file_) != 0) {
        throw io_error("Failed to flush", temp_path_);
    }
    if (::fsync(::fileno(file_)) != 0) {
        throw io_error("Failed to fsync", temp_path_);
    }
    close_file();

    std::error_code ec;
    fs::rename(temp_path_, store_path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to rename " + temp_path_ + " over " + store_path_ + ": " + ec.message());
    }
    committed_ = true;
    sync_directory(fs::path(store_path_).parent_path());
}

void AtomicMergeWriter::abort() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_file();
    }
    if (committed_) return;

    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        log_error("Failed to remove " + temp_path_ + ": " + ec.message());
    }
}

void AtomicMergeWriter::close_file() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}
