/**
 * EngineConfig.h - Runtime configuration for the ingestion engine
 *
 * Every tunable (rate, concurrency, retry budget, paths) lives here and is
 * passed into constructors. Sources, lowest priority first:
 * defaults -> JSON config file -> TMDBSYNC_* environment -> CLI flags.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class CredentialsError : public std::runtime_error {
public:
    explicit CredentialsError(const std::string& msg) : std::runtime_error(msg) {}
};

struct EngineConfig {
    std::string api_host = "https://api.themoviedb.org/3";
    std::string data_dir = "./data/out";
    std::string logs_dir = "./logs/fetch_TMDB_API";
    std::string env_file = "./.env";

    // Concurrency / rate limit
    int target_rps = 50;
    int max_workers = 64;
    int in_flight_multiplier = 4;

    // Retry policy
    int max_attempts = 6;
    double base_backoff_seconds = 0.2;
    double max_backoff_seconds = 60.0;
    int connect_timeout_ms = 10000;
    int request_timeout_ms = 45000;

    bool progress_enabled = true;

    int max_in_flight() const { return max_workers * in_flight_multiplier; }

    // Throws ConfigError on out-of-range values
    void validate() const;

    json to_json() const;
};

// Overlays keys present in `data` onto `config`. Unknown keys are ignored.
void apply_config_json(EngineConfig& config, const json& data);

// Reads a JSON config file. Returns false when the file does not exist;
// throws ConfigError when it exists but cannot be parsed.
bool load_config_file(EngineConfig& config, const std::string& path);

// Applies TMDBSYNC_* environment variables.
void apply_environment_overrides(EngineConfig& config);

// Reads the bearer token (TMDB_BEARER / TMDB_bearer) from a .env style
// file. Throws CredentialsError when the file or key is missing.
std::string load_bearer_token(const std::string& env_path);
