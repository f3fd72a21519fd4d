/**
 * NdjsonFile.h - Line-delimited JSON helpers
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ndjson {

using LineVisitor = std::function<void(const std::string& line)>;

// Streams every non-blank line (without the trailing newline / CR).
// Files ending in .gz are inflated while streaming. Returns false when
// the file does not exist; throws std::runtime_error on read failures.
bool for_each_line(const std::string& path, const LineVisitor& visit);

// Parses one line as a JSON object; nullopt for anything else
std::optional<json> parse_object(const std::string& line);

// Compact single-line serialization, UTF-8 kept as-is
std::string dump_line(const json& record);

} // namespace ndjson
