#include "skopje/db/result.hpp"

#include <cstdlib>

namespace skopje::db {

namespace {

std::string trimmed(const char* msg) {
    std::string s = msg ? msg : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // namespace

uint64_t Result::affected_rows() const {
    if (!res_) return 0;
    const char* val = PQcmdTuples(res_);
    if (!val || *val == '\0') return 0;
    return std::strtoull(val, nullptr, 10);
}

void Result::check_cell(int row, int col) const {
    if (row < 0 || row >= rows() || col < 0 || col >= columns()) {
        throw SchemaMismatchError("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                  ") outside a result of " + std::to_string(rows()) + " rows and " +
                                  std::to_string(columns()) + " columns");
    }
}

void check_result(const Result& res, PGconn* conn, const std::string& statement,
                  ExecStatusType expected) {
    ExecStatusType status = res.get() ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
    bool ok = status == expected ||
              (expected == PGRES_COMMAND_OK && status == PGRES_TUPLES_OK);
    if (ok) return;

    std::string message = res.get() ? trimmed(PQresultErrorMessage(res.get()))
                                     : trimmed(PQerrorMessage(conn));
    if (message.empty()) {
        message = std::string("unexpected result status ") + PQresStatus(status);
    }
    throw StoreError(message, statement, res.sqlstate());
}

TextParams::TextParams(const Row& row) {
    storage_.reserve(row.size());
    values_.reserve(row.size());
    for (const Value& value : row) {
        storage_.push_back(value.to_text());
    }
    for (const auto& text : storage_) {
        values_.push_back(text ? text->c_str() : nullptr);
    }
}

Result exec(PGconn* conn, const std::string& sql) {
    Result res(PQexec(conn, sql.c_str()));
    check_result(res, conn, sql);
    return res;
}

Result exec_params(PGconn* conn, const std::string& sql, const Row& params) {
    TextParams text(params);
    Result res(PQexecParams(conn, sql.c_str(), text.count(), nullptr, text.values(),
                            nullptr, nullptr, 0));
    check_result(res, conn, sql);
    return res;
}

} // namespace skopje::db
