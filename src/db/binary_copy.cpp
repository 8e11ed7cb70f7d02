#include "skopje/db/binary_copy.hpp"
#include "skopje/error.hpp"

namespace skopje::db {

namespace {

const char kSignature[] = "PGCOPY\n\377\r\n";  // plus the terminating NUL: 11 bytes

void append_int16(std::string& out, int16_t v) {
    uint16_t u = static_cast<uint16_t>(v);
    out += static_cast<char>((u >> 8) & 0xFF);
    out += static_cast<char>(u & 0xFF);
}

void append_int32(std::string& out, int32_t v) {
    uint32_t u = static_cast<uint32_t>(v);
    out += static_cast<char>((u >> 24) & 0xFF);
    out += static_cast<char>((u >> 16) & 0xFF);
    out += static_cast<char>((u >> 8) & 0xFF);
    out += static_cast<char>(u & 0xFF);
}

} // namespace

BinaryCopyEncoder::BinaryCopyEncoder(std::vector<ColumnType> column_types)
    : column_types_(std::move(column_types)) {
    SKOPJE_CHECK_ARGUMENT(!column_types_.empty(), "binary COPY needs at least one column");
    SKOPJE_CHECK_ARGUMENT(column_types_.size() <= 1600, "too many columns for a PostgreSQL table");

    buffer_.append(kSignature, sizeof(kSignature));
    append_int32(buffer_, 0);  // flags
    append_int32(buffer_, 0);  // header extension length
}

void BinaryCopyEncoder::encode_row(const Row& row) {
    if (finished_) {
        throw InvalidArgumentError("row written after the COPY trailer", "BinaryCopyEncoder::encode_row");
    }
    if (row.size() != column_types_.size()) {
        throw SchemaMismatchError("row " + std::to_string(rows_) + " has " + std::to_string(row.size()) +
                                  " values, expected " + std::to_string(column_types_.size()));
    }
    for (size_t i = 0; i < row.size(); ++i) {
        if (!row[i].matches(column_types_[i])) {
            throw SchemaMismatchError("row " + std::to_string(rows_) + " column " + std::to_string(i) +
                                      ": " + row[i].type_name() + " value for " +
                                      column_type_name(column_types_[i]) + " column");
        }
    }

    std::string tuple;
    append_int16(tuple, static_cast<int16_t>(row.size()));
    std::string payload;
    for (const Value& value : row) {
        if (value.is_null()) {
            append_int32(tuple, -1);
            continue;
        }
        payload.clear();
        value.append_binary(payload);
        if (payload.size() > 0x7FFFFFFF) {
            throw SchemaMismatchError("field too large for binary COPY");
        }
        append_int32(tuple, static_cast<int32_t>(payload.size()));
        tuple += payload;
    }
    buffer_ += tuple;
    ++rows_;
}

void BinaryCopyEncoder::finish() {
    if (finished_) return;
    append_int16(buffer_, -1);
    finished_ = true;
}

std::string BinaryCopyEncoder::take() {
    std::string out;
    out.swap(buffer_);
    return out;
}

} // namespace skopje::db
