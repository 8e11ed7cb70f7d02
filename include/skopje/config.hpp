#pragma once

#include <cstdint>
#include <string>

namespace skopje {

// PostgreSQL connection settings
struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "skopje";
    std::string user = "postgres";
    std::string password;
    uint32_t pool_size = 4;
    uint32_t connect_timeout = 10;  // seconds, 0 = libpq default

    // Build libpq connection string
    std::string to_conninfo() const;
};

struct DownloadConfig {
    uint64_t chunk_size = 100ULL * 1024 * 1024;  // 100 MiB
    uint32_t max_parallel_chunks = 4;
    uint32_t chunk_retries = 0;
    uint32_t retry_backoff_ms = 500;
    uint32_t timeout_seconds = 300;
    std::string user_agent = "skopje/1.0";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    DatabaseConfig database;
    DownloadConfig download;
    LoggingConfig logging;
    std::string config_file;
};

// Load configuration from a YAML file, then apply SKOPJE_* environment overrides.
// An empty path or a missing file yields defaults plus environment.
// Throws ConfigError on malformed YAML or invalid values.
Config load_config(const std::string& config_file = "");

// Apply SKOPJE_DB_* / SKOPJE_LOG_LEVEL environment variables on top of config.
void apply_env_overrides(Config& config);

// Throws ConfigError when a value is outside its valid range.
void validate_config(const Config& config);

} // namespace skopje
