/**
 * ZlibUtils.cpp - Implementation
 */

#include "tmdbsync/ZlibUtils.h"
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace {
    constexpr unsigned INFLATE_BUFFER_BYTES = 128 * 1024;
    constexpr size_t LINE_CHUNK_BYTES = 64 * 1024;
}

namespace ZlibUtils {

GzipLineReader::GzipLineReader(const std::string& path)
    : path_(path), chunk_(LINE_CHUNK_BYTES) {
    file_ = gzopen(path_.c_str(), "rb");
    if (!file_) {
        throw std::runtime_error("Cannot open " + path_);
    }
    gzbuffer(file_, INFLATE_BUFFER_BYTES);
}

GzipLineReader::~GzipLineReader() {
    if (file_) {
        gzclose(file_);
    }
}

void GzipLineReader::throw_if_failed() const {
    int errnum = Z_OK;
    const char* message = gzerror(file_, &errnum);
    if (errnum != Z_OK) {
        throw std::runtime_error("Corrupt gzip stream in " + path_ + ": " + (message ? message : "unknown error"));
    }
}

bool GzipLineReader::next_line(std::string& line) {
    line.clear();
    bool got_data = false;

    // gzgets stops at a newline or when the chunk is full; long lines take
    // several calls
    while (gzgets(file_, chunk_.data(), static_cast<int>(chunk_.size())) != nullptr) {
        got_data = true;
        size_t length = std::strlen(chunk_.data());
        if (length > 0 && chunk_[length - 1] == '\n') {
            line.append(chunk_.data(), length - 1);
            return true;
        }
        line.append(chunk_.data(), length);
    }

    throw_if_failed();
    return got_data;
}

} // namespace ZlibUtils
