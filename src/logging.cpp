#include "skopje/logging.hpp"
#include "skopje/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <vector>

namespace skopje {

class Logger::Impl {
public:
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    std::atomic<LogLevel> level{LogLevel::INFO};
    std::mutex mutex;  // serializes reconfiguration, logging never takes it

    Impl() {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        std::atomic_store(&logger_, build());
    }

    // Loggers are never modified after publication, only replaced.
    std::shared_ptr<spdlog::logger> current() const {
        return std::atomic_load(&logger_);
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        current()->set_level(to_spdlog(new_level));
    }

    void set_output_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        file_sink.reset();
        if (!filename.empty()) {
            file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        }

        auto replacement = build();
        auto previous = std::atomic_exchange(&logger_, replacement);
        previous->flush();
    }

private:
    std::shared_ptr<spdlog::logger> build() const {
        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (file_sink) sinks.push_back(file_sink);

        auto logger = std::make_shared<spdlog::logger>("skopje", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(level));
        logger->flush_on(spdlog::level::warn);
        return logger;
    }

    static spdlog::level::level_enum to_spdlog(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return spdlog::level::trace;
            case LogLevel::DEBUG: return spdlog::level::debug;
            case LogLevel::INFO: return spdlog::level::info;
            case LogLevel::WARNING: return spdlog::level::warn;
            case LogLevel::ERROR: return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> logger_;
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->current()->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->current()->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->current()->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->current()->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->current()->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->current()->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

void Logger::flush() {
    pImpl->current()->flush();
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void init_logging(const LoggingConfig& config) {
    auto& logger = Logger::getInstance();
    logger.set_level(parse_log_level(config.level));
    logger.set_output_file(config.file);
}

} // namespace skopje
