#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace skopje {

// Human readable byte count in binary units ("1.5 MiB", "512 B").
std::string format_bytes(uint64_t bytes);

// Parse a plain decimal number no larger than max. Signs, whitespace and
// trailing characters are rejected with InvalidArgumentError.
uint64_t parse_unsigned(const std::string& text,
                        uint64_t max = std::numeric_limits<uint64_t>::max());

/**
 * Calendar date stored as days since 1970-01-01 (proleptic Gregorian).
 */
struct Date {
    int32_t days_since_epoch = 0;

    static Date from_ymd(int year, unsigned month, unsigned day);
    void to_ymd(int& year, unsigned& month, unsigned& day) const;

    bool operator==(const Date& other) const { return days_since_epoch == other.days_since_epoch; }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return days_since_epoch < other.days_since_epoch; }
};

// UTC date of a unix timestamp in seconds.
Date date_from_timestamp(uint32_t timestamp);

// Parse "YYYY-MM-DD". Throws InvalidArgumentError on anything else.
Date parse_date(const std::string& text);

// Format as "YYYY-MM-DD".
std::string format_date(const Date& date);

} // namespace skopje
