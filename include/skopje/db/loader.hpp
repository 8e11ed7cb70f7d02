/**
 * @file loader.hpp
 * @brief Transactional batch loading into PostgreSQL
 *
 * - insert(): one prepared statement executed per record inside one transaction
 * - copy(): one binary COPY stream inside one transaction
 * - fetch_or_insert(): read-then-conditionally-write for small lookup tables
 *
 * Every call borrows one connection from the pool and returns it on every
 * path. Failures are logged and propagated; nothing is committed unless the
 * whole batch succeeded.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "skopje/db/connection.hpp"
#include "skopje/db/copy_in.hpp"
#include "skopje/db/result.hpp"
#include "skopje/db/statement.hpp"
#include "skopje/db/transaction.hpp"
#include "skopje/db/types.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

namespace skopje::db {

class PgLoader {
public:
    explicit PgLoader(ConnectionPool& pool) : pool_(pool) {}

    /**
     * Prepare statement once and execute it for every record in one transaction.
     * All or nothing: any failure rolls the whole batch back.
     * @return Number of records inserted
     */
    template <typename T>
    size_t insert(const std::string& statement, const std::vector<T>& records) {
        auto conn = pool_.acquire();
        try {
            PreparedStatement prepared(conn.get(), statement);
            Transaction tx(conn.get());
            for (const T& record : records) {
                prepared.execute(RowMapper<T>::map(record));
            }
            tx.commit();
        } catch (const SkopjeException& e) {
            report_failure("insert", e);
            throw;
        }
        LOG_DEBUG("Inserted " + std::to_string(records.size()) + " records");
        return records.size();
    }

    /**
     * Stream records through binary COPY in one transaction.
     *
     * statement must be a COPY ... FROM STDIN (FORMAT binary) command whose
     * column list matches column_types. The stream stops at the first row that
     * fails to encode; rows must be deduplicated and validated upstream.
     * @return Number of rows the server stored
     */
    template <typename T>
    uint64_t copy(const std::string& statement, const std::vector<T>& records,
                  const std::vector<ColumnType>& column_types) {
        auto conn = pool_.acquire();
        uint64_t stored = 0;
        try {
            Transaction tx(conn.get());
            CopyIn sink(conn.get(), statement);
            BinaryCopyWriter writer(sink, column_types);
            for (const T& record : records) {
                writer.write(RowMapper<T>::map(record));
            }
            stored = writer.finish();
            tx.commit();
        } catch (const SkopjeException& e) {
            report_failure("copy", e);
            throw;
        }
        LOG_DEBUG("Copied " + std::to_string(stored) + " rows");
        return stored;
    }

    // copy() with the column types the record type declares.
    template <typename T>
    uint64_t copy(const std::string& statement, const std::vector<T>& records) {
        return copy(statement, records, RowMapper<T>::types());
    }

    /**
     * First column of the first row, or nullopt when the query returns no rows.
     */
    template <typename T>
    std::optional<T> fetch_if_exists(const std::string& statement, const Row& params) {
        auto conn = pool_.acquire();
        try {
            return fetch_first<T>(conn.get(), statement, params);
        } catch (const SkopjeException& e) {
            report_failure("fetch", e);
            throw;
        }
    }

    /**
     * Fetch a lookup value, inserting it first when it is missing.
     *
     * fetch_statement and insert_statement take the same parameters. When the
     * insert collides with a concurrent writer's row on a unique constraint
     * RaceLossError is thrown; when the row is still missing after a successful
     * insert StoreError is thrown. There is no further retry.
     */
    template <typename T>
    T fetch_or_insert(const std::string& fetch_statement, const std::string& insert_statement,
                      const Row& params) {
        auto conn = pool_.acquire();
        try {
            if (auto existing = fetch_first<T>(conn.get(), fetch_statement, params)) {
                return *existing;
            }

            try {
                exec_params(conn.get(), insert_statement, params);
            } catch (const StoreError& e) {
                if (e.sqlstate() == kUniqueViolation) {
                    throw RaceLossError("concurrent insert won the unique constraint: " + e.message(),
                                        insert_statement);
                }
                throw;
            }

            if (auto inserted = fetch_first<T>(conn.get(), fetch_statement, params)) {
                return *inserted;
            }
            throw StoreError("row not found after insert", fetch_statement);
        } catch (const SkopjeException& e) {
            report_failure("fetch_or_insert", e);
            throw;
        }
    }

    /**
     * Map every result row through fn(const Result&, int row).
     */
    template <typename Fn>
    auto fetch_collection(const std::string& statement, const Row& params, Fn&& fn)
        -> std::vector<decltype(fn(std::declval<const Result&>(), 0))> {
        using R = decltype(fn(std::declval<const Result&>(), 0));
        auto conn = pool_.acquire();
        try {
            Result res = exec_params(conn.get(), statement, params);
            std::vector<R> out;
            out.reserve(static_cast<size_t>(res.rows()));
            for (int row = 0; row < res.rows(); ++row) {
                out.push_back(fn(res, row));
            }
            return out;
        } catch (const SkopjeException& e) {
            report_failure("fetch_collection", e);
            throw;
        }
    }

    // Execute a statement outside any explicit transaction. Returns affected rows.
    uint64_t execute(const std::string& statement, const Row& params = {});

    ConnectionPool& pool() { return pool_; }

private:
    template <typename T>
    static std::optional<T> fetch_first(PGconn* conn, const std::string& statement, const Row& params) {
        Result res = exec_params(conn, statement, params);
        if (res.rows() == 0) {
            return std::nullopt;
        }
        return res.get<T>(0, 0);
    }

    static void report_failure(const char* operation, const SkopjeException& e);

    ConnectionPool& pool_;
};

} // namespace skopje::db
