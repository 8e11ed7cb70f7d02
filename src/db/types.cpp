#include "skopje/db/types.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace skopje::db {

namespace {

// PostgreSQL binary dates count days from 2000-01-01
constexpr int32_t kPostgresEpochOffsetDays = 10957;

template <typename U>
void append_be(std::string& out, U value) {
    for (int shift = static_cast<int>(sizeof(U) * 8) - 8; shift >= 0; shift -= 8) {
        out += static_cast<char>((value >> shift) & 0xFF);
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <typename F>
F decode_floating(std::string_view text, const char* what) {
    std::string buf(text);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(buf.c_str(), &end);
    if (buf.empty() || end != buf.c_str() + buf.size() || errno == ERANGE) {
        throw SchemaMismatchError("cannot decode '" + buf + "' as " + what);
    }
    return static_cast<F>(value);
}

} // namespace

Oid column_oid(ColumnType type) {
    switch (type) {
        case ColumnType::Bool:    return 16;
        case ColumnType::Int2:    return 21;
        case ColumnType::Int4:    return 23;
        case ColumnType::Int8:    return 20;
        case ColumnType::Float4:  return 700;
        case ColumnType::Float8:  return 701;
        case ColumnType::Text:    return 25;
        case ColumnType::Varchar: return 1043;
        case ColumnType::Bytea:   return 17;
        case ColumnType::Date:    return 1082;
    }
    return 0;
}

const char* column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::Bool:    return "bool";
        case ColumnType::Int2:    return "int2";
        case ColumnType::Int4:    return "int4";
        case ColumnType::Int8:    return "int8";
        case ColumnType::Float4:  return "float4";
        case ColumnType::Float8:  return "float8";
        case ColumnType::Text:    return "text";
        case ColumnType::Varchar: return "varchar";
        case ColumnType::Bytea:   return "bytea";
        case ColumnType::Date:    return "date";
    }
    return "unknown";
}

bool Value::matches(ColumnType type) const {
    switch (type) {
        case ColumnType::Bool:    return is_null() || std::holds_alternative<bool>(data_);
        case ColumnType::Int2:    return is_null() || std::holds_alternative<int16_t>(data_);
        case ColumnType::Int4:    return is_null() || std::holds_alternative<int32_t>(data_);
        case ColumnType::Int8:    return is_null() || std::holds_alternative<int64_t>(data_);
        case ColumnType::Float4:  return is_null() || std::holds_alternative<float>(data_);
        case ColumnType::Float8:  return is_null() || std::holds_alternative<double>(data_);
        case ColumnType::Text:
        case ColumnType::Varchar: return is_null() || std::holds_alternative<std::string>(data_);
        case ColumnType::Bytea:   return is_null() || std::holds_alternative<Bytes>(data_);
        case ColumnType::Date:    return is_null() || std::holds_alternative<skopje::Date>(data_);
    }
    return false;
}

const char* Value::type_name() const {
    static const char* names[] = {"null", "bool", "int2", "int4", "int8", "float4", "float8",
                                  "text", "bytea", "date"};
    return names[data_.index()];
}

std::optional<std::string> Value::to_text() const {
    struct Visitor {
        std::optional<std::string> operator()(std::monostate) const { return std::nullopt; }
        std::optional<std::string> operator()(bool v) const { return std::string(v ? "t" : "f"); }
        std::optional<std::string> operator()(int16_t v) const { return std::to_string(v); }
        std::optional<std::string> operator()(int32_t v) const { return std::to_string(v); }
        std::optional<std::string> operator()(int64_t v) const { return std::to_string(v); }
        std::optional<std::string> operator()(float v) const {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(v));
            return std::string(buf);
        }
        std::optional<std::string> operator()(double v) const {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", v);
            return std::string(buf);
        }
        std::optional<std::string> operator()(const std::string& v) const { return v; }
        std::optional<std::string> operator()(const Bytes& v) const {
            static const char hex[] = "0123456789abcdef";
            std::string out = "\\x";
            out.reserve(2 + v.size() * 2);
            for (uint8_t b : v) {
                out += hex[(b >> 4) & 0xF];
                out += hex[b & 0xF];
            }
            return out;
        }
        std::optional<std::string> operator()(const skopje::Date& v) const { return format_date(v); }
    };
    return std::visit(Visitor{}, data_);
}

void Value::append_binary(std::string& out) const {
    struct Visitor {
        std::string& out;
        void operator()(std::monostate) const {
            throw InvalidArgumentError("NULL has no binary payload", "Value::append_binary");
        }
        void operator()(bool v) const { out += static_cast<char>(v ? 1 : 0); }
        void operator()(int16_t v) const { append_be(out, static_cast<uint16_t>(v)); }
        void operator()(int32_t v) const { append_be(out, static_cast<uint32_t>(v)); }
        void operator()(int64_t v) const { append_be(out, static_cast<uint64_t>(v)); }
        void operator()(float v) const {
            uint32_t bits;
            std::memcpy(&bits, &v, sizeof(bits));
            append_be(out, bits);
        }
        void operator()(double v) const {
            uint64_t bits;
            std::memcpy(&bits, &v, sizeof(bits));
            append_be(out, bits);
        }
        void operator()(const std::string& v) const { out += v; }
        void operator()(const Bytes& v) const { out.append(reinterpret_cast<const char*>(v.data()), v.size()); }
        void operator()(const skopje::Date& v) const {
            append_be(out, static_cast<uint32_t>(v.days_since_epoch - kPostgresEpochOffsetDays));
        }
    };
    std::visit(Visitor{out}, data_);
}

// =============================================================================
// FromSql
// =============================================================================

bool FromSql<bool>::decode(std::string_view text) {
    if (text == "t" || text == "true" || text == "1") return true;
    if (text == "f" || text == "false" || text == "0") return false;
    throw SchemaMismatchError("cannot decode '" + std::string(text) + "' as bool");
}

float FromSql<float>::decode(std::string_view text) {
    return decode_floating<float>(text, "float4");
}

double FromSql<double>::decode(std::string_view text) {
    return decode_floating<double>(text, "float8");
}

std::string FromSql<std::string>::decode(std::string_view text) {
    return std::string(text);
}

Bytes FromSql<Bytes>::decode(std::string_view text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || text.size() % 2 != 0) {
        throw SchemaMismatchError("bytea value is not in hex format");
    }
    Bytes out;
    out.reserve((text.size() - 2) / 2);
    for (size_t i = 2; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw SchemaMismatchError("invalid hex digit in bytea value");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

skopje::Date FromSql<skopje::Date>::decode(std::string_view text) {
    try {
        return parse_date(std::string(text));
    } catch (const InvalidArgumentError& e) {
        throw SchemaMismatchError("cannot decode '" + std::string(text) + "' as date: " + e.message());
    }
}

} // namespace skopje::db
