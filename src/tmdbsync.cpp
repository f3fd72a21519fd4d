/*
 * tmdbsync - Incremental TMDB ingestion
 *
 * Runs the selected entities (or all of them, in dependency order) once
 * and exits. Scheduling is left to cron or an orchestrator.
 *
 * Exit codes: 0 success, 1 configuration or local failure, 2 rejected
 * credentials (HTTP 401).
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "tmdbsync/AwsHttpTransport.h"
#include "tmdbsync/EngineConfig.h"
#include "tmdbsync/EntityCatalog.h"
#include "tmdbsync/HttpRuntime.h"
#include "tmdbsync/IngestionEngine.h"
#include "tmdbsync/RequestExecutor.h"

namespace {
    constexpr int EXIT_LOCAL_FAILURE = 1;
    constexpr int EXIT_AUTH_FAILURE = 2;

    struct CliOptions {
        std::string config_path;
        std::string data_dir;
        std::string logs_dir;
        std::string env_file;
        int rps = -1;
        int workers = -1;
        bool all = false;
        bool list = false;
        bool help = false;
        bool no_progress = false;
        std::vector<std::string> entities;
    };

    void print_usage(const char* argv0) {
        std::cout << "Usage: " << argv0 << " [options] [--all | ENTITY...]\n"
                  << "Options:\n"
                  << "  --config PATH       JSON config file\n"
                  << "  --data-dir DIR      Directory holding the stores and listings\n"
                  << "  --logs-dir DIR      Directory for per-entity run logs\n"
                  << "  --env-file PATH     File holding TMDB_BEARER\n"
                  << "  --rps N             Requests per second across all workers\n"
                  << "  --workers N         Number of worker threads\n"
                  << "  --all               Run every entity in dependency order\n"
                  << "  --list              List entities and exit\n"
                  << "  --no-progress       Disable the live progress line\n"
                  << "  --help              Show this help message\n";
    }

    int parse_int(const std::string& flag, const std::string& value) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::exception&) {
            throw ConfigError(flag + " expects an integer, got '" + value + "'");
        }
    }

    CliOptions parse_args(int argc, char* argv[]) {
        CliOptions opts;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) throw ConfigError(arg + " requires a value");
                return argv[++i];
            };

            if (arg == "--config") {
                opts.config_path = next_value();
            } else if (arg == "--data-dir") {
                opts.data_dir = next_value();
            } else if (arg == "--logs-dir") {
                opts.logs_dir = next_value();
            } else if (arg == "--env-file") {
                opts.env_file = next_value();
            } else if (arg == "--rps") {
                opts.rps = parse_int(arg, next_value());
            } else if (arg == "--workers") {
                opts.workers = parse_int(arg, next_value());
            } else if (arg == "--all") {
                opts.all = true;
            } else if (arg == "--list") {
                opts.list = true;
            } else if (arg == "--no-progress") {
                opts.no_progress = true;
            } else if (arg == "--help" || arg == "-h") {
                opts.help = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw ConfigError("unknown option " + arg);
            } else {
                opts.entities.push_back(arg);
            }
        }
        return opts;
    }

    EngineConfig build_config(const CliOptions& opts) {
        EngineConfig config;

        // Priority: CLI > environment > file > default
        if (!opts.config_path.empty() && !load_config_file(config, opts.config_path)) {
            throw ConfigError("config file not found: " + opts.config_path);
        }
        apply_environment_overrides(config);

        if (!opts.data_dir.empty()) config.data_dir = opts.data_dir;
        if (!opts.logs_dir.empty()) config.logs_dir = opts.logs_dir;
        if (!opts.env_file.empty()) config.env_file = opts.env_file;
        if (opts.rps != -1) config.target_rps = opts.rps;
        if (opts.workers != -1) config.max_workers = opts.workers;
        if (opts.no_progress || !isatty(STDERR_FILENO)) config.progress_enabled = false;

        config.validate();
        return config;
    }
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    EngineConfig config;
    std::vector<const EntityDescriptor*> selected;
    std::string bearer;
    const EntityCatalog catalog = EntityCatalog::builtin();

    try {
        opts = parse_args(argc, argv);
        if (opts.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (opts.list) {
            for (const auto& name : catalog.names()) {
                std::cout << name << "\n";
            }
            return 0;
        }
        if (!opts.all && opts.entities.empty()) {
            print_usage(argv[0]);
            return EXIT_LOCAL_FAILURE;
        }

        selected = opts.all ? catalog.select(catalog.names()) : catalog.select(opts.entities);
        config = build_config(opts);

        // Before any network activity
        bearer = load_bearer_token(config.env_file);
    } catch (const CredentialsError& e) {
        std::cerr << "❌ Credentials error: " << e.what() << std::endl;
        return EXIT_LOCAL_FAILURE;
    } catch (const ConfigError& e) {
        std::cerr << "❌ Configuration error: " << e.what() << std::endl;
        return EXIT_LOCAL_FAILURE;
    }

    std::cout << "🚀 tmdbsync starting: " << selected.size() << " entities, "
              << config.target_rps << " rps, " << config.max_workers << " workers, "
              << config.max_in_flight() << " in flight" << std::endl;
    std::cout << "📁 Data: " << config.data_dir << "  Logs: " << config.logs_dir << std::endl;

    HttpClientSettings http_settings;
    http_settings.connect_timeout_ms = config.connect_timeout_ms;
    http_settings.request_timeout_ms = config.request_timeout_ms;
    http_settings.max_connections = static_cast<unsigned>(config.max_workers);

    int exit_code = 0;
    HttpRuntime::instance().initialize(http_settings);
    {
        auto transport = std::make_shared<AwsHttpTransport>(HttpRuntime::instance().get_http_client());
        IngestionEngine engine(config, transport, bearer);

        for (const EntityDescriptor* descriptor : selected) {
            try {
                engine.run(*descriptor);
            } catch (const AuthFailure& e) {
                std::cerr << "❌ Authentication rejected, aborting: " << e.what() << std::endl;
                exit_code = EXIT_AUTH_FAILURE;
                break;
            } catch (const std::exception& e) {
                std::cerr << "❌ [" << descriptor->name << "] failed: " << e.what() << std::endl;
                exit_code = EXIT_LOCAL_FAILURE;
            }
        }
    }
    HttpRuntime::instance().shutdown();

    if (exit_code == 0) {
        std::cout << "✅ All entities completed" << std::endl;
    }
    return exit_code;
}
