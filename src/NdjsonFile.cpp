/**
 * NdjsonFile.cpp - Implementation
 */

#include "tmdbsync/NdjsonFile.h"
#include "tmdbsync/ZlibUtils.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    bool is_blank(const std::string& line) {
        return line.find_first_not_of(" \t\r") == std::string::npos;
    }

    void visit_line(std::string& line, const ndjson::LineVisitor& visit) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) return;
        visit(line);
    }

    bool has_gz_extension(const std::string& path) {
        return fs::path(path).extension() == ".gz";
    }
}

namespace ndjson {

bool for_each_line(const std::string& path, const LineVisitor& visit) {
    if (!fs::exists(path)) return false;

    std::string line;
    if (has_gz_extension(path)) {
        ZlibUtils::GzipLineReader reader(path);
        while (reader.next_line(line)) {
            visit_line(line, visit);
        }
        return true;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    while (std::getline(in, line)) {
        visit_line(line, visit);
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on " + path);
    }
    return true;
}

std::optional<json> parse_object(const std::string& line) {
    json value = json::parse(line, nullptr, false);
    if (value.is_discarded() || !value.is_object()) return std::nullopt;
    return value;
}

std::string dump_line(const json& record) {
    return record.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace ndjson
