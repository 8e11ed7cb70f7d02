#include "skopje/db/copy_in.hpp"
#include "skopje/db/result.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

namespace skopje::db {

namespace {

std::string connection_error(PGconn* conn) {
    std::string s = PQerrorMessage(conn);
    while (!s.empty() && s.back() == '\n') s.pop_back();
    return s;
}

} // namespace

CopyIn::CopyIn(PGconn* conn, const std::string& statement)
    : conn_(conn), statement_(statement), open_(false) {
    Result res(PQexec(conn_, statement_.c_str()));
    check_result(res, conn_, statement_, PGRES_COPY_IN);
    open_ = true;
}

CopyIn::~CopyIn() {
    if (open_) {
        PQputCopyEnd(conn_, "copy abandoned before completion");
        open_ = false;
        drain_results();
    }
}

void CopyIn::put(std::string_view data) {
    if (!open_) {
        throw StoreError("COPY stream is not open", statement_);
    }
    if (data.empty()) return;
    if (PQputCopyData(conn_, data.data(), static_cast<int>(data.size())) != 1) {
        throw StoreError("PQputCopyData failed: " + connection_error(conn_), statement_);
    }
}

uint64_t CopyIn::finish() {
    if (!open_) {
        throw StoreError("COPY stream is not open", statement_);
    }
    open_ = false;

    if (PQputCopyEnd(conn_, nullptr) != 1) {
        std::string message = connection_error(conn_);
        drain_results();
        throw StoreError("PQputCopyEnd failed: " + message, statement_);
    }

    Result res(PQgetResult(conn_));
    drain_results();
    check_result(res, conn_, statement_);
    return res.affected_rows();
}

void CopyIn::abort(const std::string& reason) {
    if (!open_) return;
    open_ = false;
    PQputCopyEnd(conn_, reason.c_str());
    drain_results();
}

void CopyIn::drain_results() {
    while (PGresult* res = PQgetResult(conn_)) {
        PQclear(res);
    }
}

BinaryCopyWriter::BinaryCopyWriter(CopyIn& sink, std::vector<ColumnType> column_types,
                                   size_t flush_threshold)
    : sink_(sink), encoder_(std::move(column_types)), flush_threshold_(flush_threshold) {}

void BinaryCopyWriter::write(const Row& row) {
    encoder_.encode_row(row);
    if (encoder_.buffered() >= flush_threshold_) {
        flush();
    }
}

uint64_t BinaryCopyWriter::finish() {
    encoder_.finish();
    flush();
    uint64_t stored = sink_.finish();
    LOG_DEBUG("COPY finished: " + std::to_string(stored) + " rows");
    return stored;
}

void BinaryCopyWriter::flush() {
    if (encoder_.buffered() == 0) return;
    sink_.put(encoder_.take());
}

} // namespace skopje::db
