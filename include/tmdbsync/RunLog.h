/**
 * RunLog.h - Per-entity run summaries
 *
 * One line is appended to "<logs_dir>/<entity>.log" per run:
 *   18/10/2026 : added 12 movie details / updated 3 movie details / errors 2 / not_found=2 / total : 9051
 * When nothing failed the error part reads "errors 0".
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "tmdbsync/CivilDate.h"

using json = nlohmann::json;

struct RunReport {
    std::string entity;
    CivilDate date;
    uint64_t targets = 0;
    uint64_t added = 0;
    uint64_t updated = 0;
    uint64_t retained = 0;
    uint64_t total = 0;
    std::map<std::string, uint64_t> errors;
    // False when the store was left as it was (nothing to do, or a failed rebuild)
    bool store_written = false;

    uint64_t error_total() const;
    json to_json() const;
};

std::string format_run_log_line(const RunReport& report, const std::string& label);

// Throws std::runtime_error when the log cannot be written
void append_run_log(const std::string& logs_dir, const std::string& entity, const std::string& line);
