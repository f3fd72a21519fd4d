/**
 * RunLog.cpp - Implementation
 */

#include "tmdbsync/RunLog.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

uint64_t RunReport::error_total() const {
    uint64_t sum = 0;
    for (const auto& [category, count] : errors) {
        sum += count;
    }
    return sum;
}

json RunReport::to_json() const {
    return json{
        {"entity", entity},
        {"date", date.to_string()},
        {"targets", targets},
        {"added", added},
        {"updated", updated},
        {"retained", retained},
        {"total", total},
        {"errors", errors},
        {"store_written", store_written}
    };
}

std::string format_run_log_line(const RunReport& report, const std::string& label) {
    std::ostringstream oss;
    oss << report.date.to_log_string()
        << " : added " << report.added << " " << label
        << " / updated " << report.updated << " " << label
        << " / errors " << report.error_total();

    if (report.error_total() > 0) {
        oss << " / ";
        bool first = true;
        for (const auto& [category, count] : report.errors) {
            if (count == 0) continue;
            if (!first) oss << " ; ";
            oss << category << "=" << count;
            first = false;
        }
    }

    oss << " / total : " << report.total;
    return oss.str();
}

void append_run_log(const std::string& logs_dir, const std::string& entity, const std::string& line) {
    std::error_code ec;
    fs::create_directories(logs_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + logs_dir + ": " + ec.message());
    }

    const fs::path path = fs::path(logs_dir) / (entity + ".log");
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open run log " + path.string());
    }
    out << line << "\n";
    if (!out) {
        throw std::runtime_error("Failed to append to run log " + path.string());
    }
}
