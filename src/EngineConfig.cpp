/**
 * EngineConfig.cpp - Implementation
 */

#include "tmdbsync/EngineConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::string strip_quotes(const std::string& s) {
        size_t start = 0;
        size_t end = s.size();
        while (start < end && (s[start] == '"' || s[start] == '\'')) ++start;
        while (end > start && (s[end - 1] == '"' || s[end - 1] == '\'')) --end;
        return s.substr(start, end - start);
    }

    int env_int(const char* name, int fallback) {
        const char* value = std::getenv(name);
        if (!value) return fallback;
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw ConfigError(std::string("Invalid integer in ") + name + ": " + value);
        }
    }
}

void EngineConfig::validate() const {
    if (target_rps <= 0) throw ConfigError("target_rps must be positive");
    if (max_workers <= 0) throw ConfigError("max_workers must be positive");
    if (in_flight_multiplier <= 0) throw ConfigError("in_flight_multiplier must be positive");
    if (max_attempts <= 0) throw ConfigError("max_attempts must be positive");
    if (base_backoff_seconds < 0 || max_backoff_seconds < base_backoff_seconds) {
        throw ConfigError("backoff bounds must satisfy 0 <= base <= max");
    }
    if (request_timeout_ms <= 0 || connect_timeout_ms <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (api_host.empty()) throw ConfigError("api_host must not be empty");
    if (data_dir.empty() || logs_dir.empty()) throw ConfigError("data_dir and logs_dir are required");
}

json EngineConfig::to_json() const {
    return json{
        {"api_host", api_host},
        {"data_dir", data_dir},
        {"logs_dir", logs_dir},
        {"env_file", env_file},
        {"target_rps", target_rps},
        {"max_workers", max_workers},
        {"in_flight_multiplier", in_flight_multiplier},
        {"max_attempts", max_attempts},
        {"base_backoff_seconds", base_backoff_seconds},
        {"max_backoff_seconds", max_backoff_seconds},
        {"connect_timeout_ms", connect_timeout_ms},
        {"request_timeout_ms", request_timeout_ms},
        {"progress_enabled", progress_enabled}
    };
}

void apply_config_json(EngineConfig& config, const json& data) {
    if (!data.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }
    try {
        if (data.contains("api_host")) config.api_host = data["api_host"];
        if (data.contains("data_dir")) config.data_dir = data["data_dir"];
        if (data.contains("logs_dir")) config.logs_dir = data["logs_dir"];
        if (data.contains("env_file")) config.env_file = data["env_file"];
        if (data.contains("target_rps")) config.target_rps = data["target_rps"];
        if (data.contains("max_workers")) config.max_workers = data["max_workers"];
        if (data.contains("in_flight_multiplier")) config.in_flight_multiplier = data["in_flight_multiplier"];
        if (data.contains("max_attempts")) config.max_attempts = data["max_attempts"];
        if (data.contains("base_backoff_seconds")) config.base_backoff_seconds = data["base_backoff_seconds"];
        if (data.contains("max_backoff_seconds")) config.max_backoff_seconds = data["max_backoff_seconds"];
        if (data.contains("connect_timeout_ms")) config.connect_timeout_ms = data["connect_timeout_ms"];
        if (data.contains("request_timeout_ms")) config.request_timeout_ms = data["request_timeout_ms"];
        if (data.contains("progress_enabled")) config.progress_enabled = data["progress_enabled"];
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
}

bool load_config_file(EngineConfig& config, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    json data;
    try {
        f >> data;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }
    apply_config_json(config, data);
    log_info("Loaded configuration from " + path);
    return true;
}

void apply_environment_overrides(EngineConfig& config) {
    if (const char* v = std::getenv("TMDBSYNC_API_HOST")) config.api_host = v;
    if (const char* v = std::getenv("TMDBSYNC_DATA_DIR")) config.data_dir = v;
    if (const char* v = std::getenv("TMDBSYNC_LOGS_DIR")) config.logs_dir = v;
    if (const char* v = std::getenv("TMDBSYNC_ENV_FILE")) config.env_file = v;
    config.target_rps = env_int("TMDBSYNC_RPS", config.target_rps);
    config.max_workers = env_int("TMDBSYNC_WORKERS", config.max_workers);
}

std::string load_bearer_token(const std::string& env_path) {
    if (!fs::exists(env_path)) {
        throw CredentialsError("Secrets file not found: " + env_path);
    }
    std::ifstream f(env_path);
    if (!f.is_open()) {
        throw CredentialsError("Cannot open secrets file: " + env_path);
    }

    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = strip_quotes(trim(line.substr(eq + 1)));
        if ((key == "TMDB_BEARER" || key == "TMDB_bearer") && !value.empty()) {
            return value;
        }
    }
    throw CredentialsError("TMDB_BEARER missing in " + env_path);
}
