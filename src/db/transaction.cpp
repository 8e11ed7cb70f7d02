#include "skopje/db/transaction.hpp"
#include "skopje/db/result.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

namespace skopje::db {

Transaction::Transaction(PGconn* conn) : conn_(conn), active_(false) {
    Result res(PQexec(conn_, "BEGIN"));
    try {
        check_result(res, conn_, "BEGIN");
    } catch (const StoreError& e) {
        throw StoreError(e.message(), "BEGIN", e.sqlstate(), ErrorCode::TRANSACTION_FAILED);
    }
    active_ = true;
}

Transaction::~Transaction() {
    if (active_) {
        Result res(PQexec(conn_, "ROLLBACK"));
        if (!res.ok()) {
            LOG_WARNING("ROLLBACK failed: " + res.error_message());
        }
    }
}

void Transaction::commit() {
    if (!active_) {
        throw StoreError("no open transaction to commit", "COMMIT", "", ErrorCode::TRANSACTION_FAILED);
    }
    active_ = false;
    Result res(PQexec(conn_, "COMMIT"));
    try {
        check_result(res, conn_, "COMMIT");
    } catch (const StoreError& e) {
        throw StoreError(e.message(), "COMMIT", e.sqlstate(), ErrorCode::TRANSACTION_FAILED);
    }
    // COMMIT of an aborted transaction succeeds with a ROLLBACK tag
    if (std::string(PQcmdStatus(res.get())) == "ROLLBACK") {
        throw StoreError("transaction was aborted and has been rolled back", "COMMIT", "",
                         ErrorCode::TRANSACTION_FAILED);
    }
}

void Transaction::rollback() {
    if (!active_) return;
    active_ = false;
    Result res(PQexec(conn_, "ROLLBACK"));
    check_result(res, conn_, "ROLLBACK");
}

} // namespace skopje::db
