#include "skopje/db/statement.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

#include <atomic>

namespace skopje::db {

namespace {

std::string next_statement_name() {
    static std::atomic<uint64_t> counter{0};
    return "skopje_stmt_" + std::to_string(counter.fetch_add(1));
}

} // namespace

PreparedStatement::PreparedStatement(PGconn* conn, const std::string& sql)
    : conn_(conn), sql_(sql), name_(next_statement_name()), param_count_(0) {
    Result prepared(PQprepare(conn_, name_.c_str(), sql_.c_str(), 0, nullptr));
    check_result(prepared, conn_, sql_);

    Result described(PQdescribePrepared(conn_, name_.c_str()));
    check_result(described, conn_, sql_);
    param_count_ = PQnparams(described.get());
}

PreparedStatement::PreparedStatement(PreparedStatement&& other) noexcept
    : conn_(other.conn_), sql_(std::move(other.sql_)), name_(std::move(other.name_)),
      param_count_(other.param_count_) {
    other.conn_ = nullptr;
}

PreparedStatement::~PreparedStatement() {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) return;
    // Inside an aborted transaction this fails; the name is unique so the leak is harmless
    Result res(PQexec(conn_, ("DEALLOCATE " + name_).c_str()));
    if (!res.ok()) {
        LOG_DEBUG("DEALLOCATE " + name_ + " failed: " + res.error_message());
    }
}

Result PreparedStatement::execute(const Row& params) const {
    if (static_cast<int>(params.size()) != param_count_) {
        throw SchemaMismatchError("statement expects " + std::to_string(param_count_) +
                                  " parameters, row has " + std::to_string(params.size()), sql_);
    }

    TextParams text(params);
    Result res(PQexecPrepared(conn_, name_.c_str(), text.count(), text.values(),
                              nullptr, nullptr, 0));
    check_result(res, conn_, sql_);
    return res;
}

} // namespace skopje::db
