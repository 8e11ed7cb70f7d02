#pragma once

#include <memory>
#include <string>

namespace skopje {

struct LoggingConfig;

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

class Logger {
public:
    static Logger& getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;
    void set_output_file(const std::string& filename);
    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Parse "trace", "debug", "info", "warn"/"warning", "error", "critical" (case-insensitive).
// Unknown names fall back to INFO.
LogLevel parse_log_level(const std::string& name);

// Apply level and optional file sink from configuration.
void init_logging(const LoggingConfig& config);

// Convenience macros
#define LOG_TRACE(msg) skopje::Logger::getInstance().trace(msg)
#define LOG_DEBUG(msg) skopje::Logger::getInstance().debug(msg)
#define LOG_INFO(msg) skopje::Logger::getInstance().info(msg)
#define LOG_WARNING(msg) skopje::Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) skopje::Logger::getInstance().error(msg)
#define LOG_CRITICAL(msg) skopje::Logger::getInstance().critical(msg)

} // namespace skopje
