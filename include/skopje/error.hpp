#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace skopje {

/**
 * Structured error reporting for the extract/load toolkit.
 * Every failure carries a code, the operation context (URL, SQL statement, path)
 * and an optional hint for the operator.
 */

enum class ErrorCode {
    // General errors
    INVALID_ARGUMENT = 1,
    CONFIG_INVALID = 2,

    // Database errors
    CONNECTION_FAILED = 100,
    QUERY_FAILED = 101,
    TRANSACTION_FAILED = 102,
    SCHEMA_MISMATCH = 103,
    RACE_LOST = 104,

    // I/O errors
    WRITE_FAILED = 301,

    // Network errors
    CONNECTION_LOST = 401,
    UNEXPECTED_STATUS = 402,
    DOWNLOAD_FAILED = 403,
    DECODE_FAILED = 404
};

class SkopjeException : public std::runtime_error {
public:
    explicit SkopjeException(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "skopje error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public SkopjeException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : SkopjeException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public SkopjeException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : SkopjeException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class IOError : public SkopjeException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : SkopjeException(ErrorCode::WRITE_FAILED, message, context, suggestion) {}
};

// Transport failure or an HTTP status other than the one the caller required.
// status() is 0 when no response was received at all.
class NetworkError : public SkopjeException {
public:
    explicit NetworkError(const std::string& message,
                          const std::string& url = "",
                          unsigned status = 0)
        : SkopjeException(status == 0 ? ErrorCode::CONNECTION_LOST : ErrorCode::UNEXPECTED_STATUS,
                          message, url)
        , status_(status) {}

    unsigned status() const noexcept { return status_; }

private:
    unsigned status_;
};

// Response body that is not JSON, or JSON of the wrong shape for the requested type.
class DecodeError : public SkopjeException {
public:
    explicit DecodeError(const std::string& message, const std::string& url = "")
        : SkopjeException(ErrorCode::DECODE_FAILED, message, url) {}
};

// Raised once every chunk task of a download has settled and at least one failed.
class DownloadError : public SkopjeException {
public:
    DownloadError(const std::string& message, const std::string& url,
                  std::vector<uint64_t> failed_chunks)
        : SkopjeException(ErrorCode::DOWNLOAD_FAILED, message, url,
                          "the destination file is incomplete and must be discarded")
        , failed_chunks_(std::move(failed_chunks)) {}

    const std::vector<uint64_t>& failed_chunks() const noexcept { return failed_chunks_; }

private:
    std::vector<uint64_t> failed_chunks_;
};

// libpq connect/prepare/execute/copy/commit failure. The context holds the statement.
class StoreError : public SkopjeException {
public:
    explicit StoreError(const std::string& message,
                        const std::string& statement = "",
                        const std::string& sqlstate = "",
                        ErrorCode code = ErrorCode::QUERY_FAILED)
        : SkopjeException(code, message, statement)
        , sqlstate_(sqlstate) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }

private:
    std::string sqlstate_;
};

class SchemaMismatchError : public SkopjeException {
public:
    explicit SchemaMismatchError(const std::string& message,
                                 const std::string& statement = "")
        : SkopjeException(ErrorCode::SCHEMA_MISMATCH, message, statement,
                          "check the row decomposition against the target column order") {}
};

class RaceLossError : public SkopjeException {
public:
    explicit RaceLossError(const std::string& message,
                           const std::string& statement = "")
        : SkopjeException(ErrorCode::RACE_LOST, message, statement,
                          "another writer inserted the same key; fetch again to read its row") {}
};

// Error checking helpers
class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define SKOPJE_CHECK_ARGUMENT(condition, message) \
    skopje::ErrorHandler::check_argument(condition, message, __func__)

} // namespace skopje
