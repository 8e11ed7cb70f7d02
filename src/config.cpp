#include "skopje/config.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace skopje {

namespace {

std::string get_env(const char* name) {
#if defined(_WIN32)
    char* val = nullptr;
    size_t len;
    if (_dupenv_s(&val, &len, name) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

void set_if_env(std::string& target, const char* env_var) {
    std::string value = get_env(env_var);
    if (!value.empty()) {
        target = value;
    }
}

template<typename T>
void read_if(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

} // namespace

std::string DatabaseConfig::to_conninfo() const {
    std::string conninfo = "dbname=" + dbname;
    if (!host.empty()) conninfo += " host=" + host;
    if (!port.empty()) conninfo += " port=" + port;
    if (!user.empty()) conninfo += " user=" + user;
    if (!password.empty()) conninfo += " password=" + password;
    if (connect_timeout > 0) conninfo += " connect_timeout=" + std::to_string(connect_timeout);
    return conninfo;
}

void apply_env_overrides(Config& config) {
    set_if_env(config.database.host, "SKOPJE_DB_HOST");
    set_if_env(config.database.port, "SKOPJE_DB_PORT");
    set_if_env(config.database.dbname, "SKOPJE_DB_NAME");
    set_if_env(config.database.user, "SKOPJE_DB_USER");
    set_if_env(config.database.password, "SKOPJE_DB_PASS");
    set_if_env(config.logging.level, "SKOPJE_LOG_LEVEL");
}

void validate_config(const Config& config) {
    if (config.download.chunk_size == 0) {
        throw ConfigError("download.chunk_size must be greater than zero", config.config_file);
    }
    if (config.download.max_parallel_chunks == 0) {
        throw ConfigError("download.max_parallel_chunks must be greater than zero", config.config_file);
    }
    if (config.database.pool_size == 0) {
        throw ConfigError("database.pool_size must be greater than zero", config.config_file);
    }
    if (config.database.dbname.empty()) {
        throw ConfigError("database.dbname must not be empty", config.config_file);
    }
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);

            if (yaml["database"]) {
                const auto& db = yaml["database"];
                read_if(db, "host", config.database.host);
                read_if(db, "port", config.database.port);
                read_if(db, "dbname", config.database.dbname);
                read_if(db, "user", config.database.user);
                read_if(db, "password", config.database.password);
                read_if(db, "pool_size", config.database.pool_size);
                read_if(db, "connect_timeout", config.database.connect_timeout);
            }

            if (yaml["download"]) {
                const auto& dl = yaml["download"];
                read_if(dl, "chunk_size", config.download.chunk_size);
                read_if(dl, "max_parallel_chunks", config.download.max_parallel_chunks);
                read_if(dl, "chunk_retries", config.download.chunk_retries);
                read_if(dl, "retry_backoff_ms", config.download.retry_backoff_ms);
                read_if(dl, "timeout_seconds", config.download.timeout_seconds);
                read_if(dl, "user_agent", config.download.user_agent);
            }

            if (yaml["logging"]) {
                const auto& log = yaml["logging"];
                read_if(log, "level", config.logging.level);
                read_if(log, "file", config.logging.file);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Failed to parse configuration: ") + e.what(), config_file);
        }
    } else if (!config_file.empty()) {
        LOG_WARNING("Config file " + config_file + " not found, using defaults");
    }

    apply_env_overrides(config);
    validate_config(config);
    return config;
}

} // namespace skopje
