#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <libpq-fe.h>

#include "skopje/db/types.hpp"
#include "skopje/error.hpp"

namespace skopje::db {

// SQLSTATE raised by a unique constraint violation
inline constexpr const char* kUniqueViolation = "23505";

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int rows() const { return res_ ? PQntuples(res_) : 0; }
    int columns() const { return res_ ? PQnfields(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    // Raw text of a cell. Empty for NULL.
    std::string_view text(int row, int col) const {
        if (is_null(row, col)) return {};
        return std::string_view(PQgetvalue(res_, row, col),
                                static_cast<size_t>(PQgetlength(res_, row, col)));
    }

    // Decode a cell. Throws SchemaMismatchError on NULL or when the text does not decode as T.
    template <typename T>
    T get(int row, int col) const {
        check_cell(row, col);
        if (is_null(row, col)) {
            throw SchemaMismatchError("unexpected NULL in row " + std::to_string(row) +
                                      ", column " + std::to_string(col));
        }
        return FromSql<T>::decode(text(row, col));
    }

    template <typename T>
    std::optional<T> get_optional(int row, int col) const {
        check_cell(row, col);
        if (is_null(row, col)) return std::nullopt;
        return FromSql<T>::decode(text(row, col));
    }

    // Rows affected by INSERT/UPDATE/DELETE/COPY.
    uint64_t affected_rows() const;

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string sqlstate() const {
        const char* state = res_ ? PQresultErrorField(res_, PG_DIAG_SQLSTATE) : nullptr;
        return state ? state : "";
    }

private:
    void check_cell(int row, int col) const;

    PGresult* res_;
};

/**
 * Throws StoreError (with SQLSTATE and statement context) unless res completed
 * with the expected status. PGRES_COMMAND_OK also accepts PGRES_TUPLES_OK.
 */
void check_result(const Result& res, PGconn* conn, const std::string& statement,
                  ExecStatusType expected = PGRES_COMMAND_OK);

// Text-format parameter array for PQexecParams/PQexecPrepared. NULLs are passed as nullptr.
class TextParams {
public:
    explicit TextParams(const Row& row);

    int count() const { return static_cast<int>(values_.size()); }
    const char* const* values() const { return values_.empty() ? nullptr : values_.data(); }

private:
    std::vector<std::optional<std::string>> storage_;
    std::vector<const char*> values_;
};

// Execute a statement without parameters. Throws StoreError on failure.
Result exec(PGconn* conn, const std::string& sql);

// Execute with text-format parameters bound to $1..$n. Throws StoreError on failure.
Result exec_params(PGconn* conn, const std::string& sql, const Row& params);

} // namespace skopje::db
