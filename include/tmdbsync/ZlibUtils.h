/**
 * ZlibUtils.h - Streaming reads of gzip-compressed listings
 *
 * TMDB daily ID exports are published gzipped and run to millions of lines.
 * They are inflated a buffer at a time through zlib's gz* interface, never
 * held in memory whole.
 */

#pragma once

#include <string>
#include <vector>

struct gzFile_s;

namespace ZlibUtils {

class GzipLineReader {
public:
    // Throws std::runtime_error when the file cannot be opened
    explicit GzipLineReader(const std::string& path);
    ~GzipLineReader();

    GzipLineReader(const GzipLineReader&) = delete;
    GzipLineReader& operator=(const GzipLineReader&) = delete;

    // Next line without its trailing newline; false at end of stream.
    // Throws std::runtime_error on a corrupt or truncated stream.
    bool next_line(std::string& line);

private:
    std::string path_;
    gzFile_s* file_ = nullptr;
    std::vector<char> chunk_;

    void throw_if_failed() const;
};

} // namespace ZlibUtils
