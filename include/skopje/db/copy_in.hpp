#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <libpq-fe.h>

#include "skopje/db/binary_copy.hpp"
#include "skopje/db/types.hpp"

namespace skopje::db {

/**
 * RAII wrapper for the COPY ... FROM STDIN sub-protocol.
 *
 * Usage:
 *   CopyIn copy(conn, "COPY t (a, b) FROM STDIN BINARY");
 *   copy.put(bytes);
 *   copy.finish();  // Destroying an unfinished stream aborts the COPY
 */
class CopyIn {
public:
    // Throws StoreError unless the server enters COPY IN state.
    CopyIn(PGconn* conn, const std::string& statement);
    ~CopyIn();

    CopyIn(const CopyIn&) = delete;
    CopyIn& operator=(const CopyIn&) = delete;

    // Send a data chunk. Throws StoreError.
    void put(std::string_view data);

    // End the stream and collect the result. Returns the number of rows copied.
    uint64_t finish();

    // Abort the stream with a reason; the server rolls the COPY back.
    void abort(const std::string& reason);

    const std::string& statement() const { return statement_; }

private:
    void drain_results();

    PGconn* conn_;
    std::string statement_;
    bool open_;
};

/**
 * Binary row stream into a CopyIn sink.
 * Encoded rows are flushed to the server whenever the buffer reaches flush_threshold bytes.
 */
class BinaryCopyWriter {
public:
    BinaryCopyWriter(CopyIn& sink, std::vector<ColumnType> column_types,
                     size_t flush_threshold = 1 << 20);  // 1MB default chunks

    // Throws SchemaMismatchError for a row that does not fit the declared columns.
    void write(const Row& row);

    // Write the trailer, flush and end the COPY. Returns the rows the server stored.
    uint64_t finish();

    size_t rows() const { return encoder_.rows(); }

private:
    void flush();

    CopyIn& sink_;
    BinaryCopyEncoder encoder_;
    size_t flush_threshold_;
};

} // namespace skopje::db
