/**
 * @file types.hpp
 * @brief Typed SQL values, column type tags and record decomposition
 *
 * A record is loaded by decomposing it into a Row: an ordered list of Values
 * matching the target statement's parameters or the target table's columns.
 * - Records provide `db::Row sql_map() const` and `static std::vector<ColumnType> sql_types()`
 * - Scalars (integers, floating point, bool, text, bytea, Date) decompose to a one-value row
 * - FromSql<T> decodes a text-format result cell back into T
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <libpq-fe.h>

#include "skopje/error.hpp"
#include "skopje/util.hpp"

namespace skopje::db {

using Bytes = std::vector<uint8_t>;

enum class ColumnType {
    Bool,
    Int2,
    Int4,
    Int8,
    Float4,
    Float8,
    Text,
    Varchar,
    Bytea,
    Date
};

// PostgreSQL type OID (pg_type.oid) of a column type tag.
Oid column_oid(ColumnType type);

const char* column_type_name(ColumnType type);

/**
 * A single nullable SQL scalar.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, int16_t, int32_t, int64_t, float, double,
                                 std::string, Bytes, skopje::Date>;

    Value() = default;
    Value(std::nullopt_t) {}
    Value(bool v) : data_(v) {}
    Value(int16_t v) : data_(v) {}
    Value(int32_t v) : data_(v) {}
    Value(int64_t v) : data_(v) {}
    Value(float v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(Bytes v) : data_(std::move(v)) {}
    Value(skopje::Date v) : data_(v) {}

    template <typename T>
    Value(const std::optional<T>& v) {
        if (v) *this = Value(*v);
    }

    bool is_null() const { return std::holds_alternative<std::monostate>(data_); }

    // True when this value can be stored in a column of the given type. NULL fits any column.
    bool matches(ColumnType type) const;

    // Name of the held type, for diagnostics.
    const char* type_name() const;

    // Text-format parameter representation; nullopt for NULL.
    std::optional<std::string> to_text() const;

    // Append the binary COPY payload (without the length word). Must not be called on NULL.
    void append_binary(std::string& out) const;

    const Storage& storage() const { return data_; }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage data_;
};

using Row = std::vector<Value>;

// =============================================================================
// Record decomposition
// =============================================================================

// Column type of a scalar that decomposes to a one-value row. Empty for records.
template <typename T>
struct ScalarColumn {};

template <> struct ScalarColumn<bool> { static constexpr ColumnType type = ColumnType::Bool; };
template <> struct ScalarColumn<int16_t> { static constexpr ColumnType type = ColumnType::Int2; };
template <> struct ScalarColumn<int32_t> { static constexpr ColumnType type = ColumnType::Int4; };
template <> struct ScalarColumn<int64_t> { static constexpr ColumnType type = ColumnType::Int8; };
template <> struct ScalarColumn<float> { static constexpr ColumnType type = ColumnType::Float4; };
template <> struct ScalarColumn<double> { static constexpr ColumnType type = ColumnType::Float8; };
template <> struct ScalarColumn<std::string> { static constexpr ColumnType type = ColumnType::Text; };
template <> struct ScalarColumn<Bytes> { static constexpr ColumnType type = ColumnType::Bytea; };
template <> struct ScalarColumn<skopje::Date> { static constexpr ColumnType type = ColumnType::Date; };

/**
 * Decomposes a record into its row and declares the row's column types.
 * The decomposition must be total and keep the same order for every record of a type.
 */
template <typename T, typename = void>
struct RowMapper {
    static Row map(const T& record) { return record.sql_map(); }
    static std::vector<ColumnType> types() { return T::sql_types(); }
};

template <typename T>
struct RowMapper<T, std::void_t<decltype(ScalarColumn<T>::type)>> {
    static Row map(const T& value) { return Row{Value(value)}; }
    static std::vector<ColumnType> types() { return {ScalarColumn<T>::type}; }
};

// =============================================================================
// Result decoding
// =============================================================================

template <typename T, typename = void>
struct FromSql;

template <typename T>
struct FromSql<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static T decode(std::string_view text) {
        T value{};
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, value);
        if (ec != std::errc() || ptr != last) {
            throw SchemaMismatchError("cannot decode '" + std::string(text) + "' as an integer");
        }
        return value;
    }
};

template <> struct FromSql<bool> { static bool decode(std::string_view text); };
template <> struct FromSql<float> { static float decode(std::string_view text); };
template <> struct FromSql<double> { static double decode(std::string_view text); };
template <> struct FromSql<std::string> { static std::string decode(std::string_view text); };
template <> struct FromSql<Bytes> { static Bytes decode(std::string_view text); };
template <> struct FromSql<skopje::Date> { static skopje::Date decode(std::string_view text); };

} // namespace skopje::db
