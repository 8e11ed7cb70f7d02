#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "skopje/db/types.hpp"

namespace skopje::db {

/**
 * Encoder for the PostgreSQL binary COPY format.
 *
 * Layout:
 *   header   "PGCOPY\n\377\r\n\0", int32 flags (0), int32 extension length (0)
 *   tuple    int16 field count, then per field int32 length (-1 for NULL) and payload
 *   trailer  int16 -1
 * All integers are big-endian.
 *
 * Rows are validated against the declared column types before any of their
 * bytes are appended, so a rejected row leaves the buffer untouched.
 */
class BinaryCopyEncoder {
public:
    explicit BinaryCopyEncoder(std::vector<ColumnType> column_types);

    // Throws SchemaMismatchError on an arity or type mismatch.
    void encode_row(const Row& row);

    // Append the trailer. No rows may follow.
    void finish();

    // Encoded bytes not yet taken.
    const std::string& buffer() const { return buffer_; }
    size_t buffered() const { return buffer_.size(); }

    // Hand over the encoded bytes and start a fresh buffer.
    std::string take();

    size_t rows() const { return rows_; }
    bool finished() const { return finished_; }
    const std::vector<ColumnType>& column_types() const { return column_types_; }

    static constexpr size_t kHeaderSize = 19;

private:
    std::vector<ColumnType> column_types_;
    std::string buffer_;
    size_t rows_ = 0;
    bool finished_ = false;
};

} // namespace skopje::db
