#include "skopje/util.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace skopje {

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

uint64_t parse_unsigned(const std::string& text, uint64_t max) {
    // stoull accepts leading blanks and a minus sign, which wraps
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw InvalidArgumentError("not an unsigned number: '" + text + "'", "parse_unsigned");
    }
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError("number out of range: " + text, "parse_unsigned");
    }
    if (pos != text.size()) {
        throw InvalidArgumentError("not an unsigned number: '" + text + "'", "parse_unsigned");
    }
    if (value > max) {
        throw InvalidArgumentError("number out of range: " + text, "parse_unsigned",
                                   "largest accepted value is " + std::to_string(max));
    }
    return value;
}

// Civil calendar conversions (days <-> y/m/d), valid for the full int32 day range.
Date Date::from_ymd(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return Date{era * 146097 + static_cast<int32_t>(doe) - 719468};
}

void Date::to_ymd(int& year, unsigned& month, unsigned& day) const {
    const int32_t z = days_since_epoch + 719468;
    const int32_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

Date date_from_timestamp(uint32_t timestamp) {
    return Date{static_cast<int32_t>(timestamp / 86400)};
}

Date parse_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char trailing = 0;

    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3 ||
        text[4] != '-' || text[7] != '-') {
        LOG_ERROR("Failed to parse date string; expected form YYYY-MM-DD - received: " + text);
        throw InvalidArgumentError("invalid date: " + text, "parse_date", "expected YYYY-MM-DD");
    }

    static const unsigned days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month < 1 || month > 12 || day < 1 ||
        day > days_in_month[month - 1] + ((month == 2 && leap) ? 1u : 0u)) {
        throw InvalidArgumentError("date out of range: " + text, "parse_date");
    }

    return Date::from_ymd(year, month, day);
}

std::string format_date(const Date& date) {
    int year;
    unsigned month, day;
    date.to_ymd(year, month, day);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

} // namespace skopje
