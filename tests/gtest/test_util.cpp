// =============================================================================
// Utility Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "skopje/error.hpp"
#include "skopje/logging.hpp"
#include "skopje/util.hpp"

using namespace skopje;

TEST(FormatBytesTest, SmallValuesInBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
}

TEST(FormatBytesTest, BinaryUnits) {
    EXPECT_EQ(format_bytes(1024), "1.0 KiB");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(100ULL * 1024 * 1024), "100.0 MiB");
    EXPECT_EQ(format_bytes(3ULL * 1024 * 1024 * 1024), "3.0 GiB");
}

TEST(ParseUnsignedTest, AcceptsPlainDecimal) {
    EXPECT_EQ(parse_unsigned("0"), 0u);
    EXPECT_EQ(parse_unsigned("8"), 8u);
    EXPECT_EQ(parse_unsigned("18446744073709551615"), 18446744073709551615ULL);
    EXPECT_EQ(parse_unsigned("4294967295", 4294967295ULL), 4294967295ULL);
}

TEST(ParseUnsignedTest, RejectsSignsAndJunk) {
    // stoull would wrap "-1" to the largest value
    EXPECT_THROW(parse_unsigned("-1"), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned("+4"), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned(" 4"), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned("4 "), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned("4k"), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned(""), InvalidArgumentError);
}

TEST(ParseUnsignedTest, RejectsOutOfRange) {
    EXPECT_THROW(parse_unsigned("18446744073709551616"), InvalidArgumentError);
    EXPECT_THROW(parse_unsigned("4294967296", 4294967295ULL), InvalidArgumentError);
}

TEST(DateTest, EpochIsDayZero) {
    EXPECT_EQ(Date::from_ymd(1970, 1, 1).days_since_epoch, 0);
    EXPECT_EQ(Date::from_ymd(2000, 1, 1).days_since_epoch, 10957);
    EXPECT_EQ(Date::from_ymd(1969, 12, 31).days_since_epoch, -1);
}

TEST(DateTest, YmdRoundTrip) {
    int year;
    unsigned month, day;
    Date::from_ymd(2024, 2, 29).to_ymd(year, month, day);
    EXPECT_EQ(year, 2024);
    EXPECT_EQ(month, 2u);
    EXPECT_EQ(day, 29u);
}

TEST(DateTest, FromTimestamp) {
    // 2021-03-04T05:06:07Z
    EXPECT_EQ(format_date(date_from_timestamp(1614834367)), "2021-03-04");
    EXPECT_EQ(format_date(date_from_timestamp(0)), "1970-01-01");
}

TEST(DateTest, ParseAndFormat) {
    Date d = parse_date("2019-11-30");
    EXPECT_EQ(format_date(d), "2019-11-30");
    EXPECT_LT(parse_date("2019-11-29"), d);
}

TEST(DateTest, ParseRejectsMalformed) {
    EXPECT_THROW(parse_date("2019/11/30"), InvalidArgumentError);
    EXPECT_THROW(parse_date("2019-11-3"), InvalidArgumentError);
    EXPECT_THROW(parse_date("2019-11-30T00:00"), InvalidArgumentError);
    EXPECT_THROW(parse_date(""), InvalidArgumentError);
}

TEST(DateTest, ParseRejectsImpossibleDays) {
    EXPECT_THROW(parse_date("2019-02-29"), InvalidArgumentError);
    EXPECT_THROW(parse_date("2019-13-01"), InvalidArgumentError);
    EXPECT_THROW(parse_date("2019-04-31"), InvalidArgumentError);
    EXPECT_NO_THROW(parse_date("2000-02-29"));
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("nonsense"), LogLevel::INFO);
}

TEST(LoggerTest, OutputFileCanChangeWhileLogging) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "skopje_logger_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path first = dir / "first.log";
    const fs::path second = dir / "second.log";

    auto& logger = Logger::getInstance();
    const LogLevel saved = logger.level();
    logger.set_level(LogLevel::WARNING);

    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&stop, t] {
            while (!stop.load()) {
                LOG_DEBUG("filtered " + std::to_string(t));
                LOG_WARNING("writer " + std::to_string(t));
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        });
    }
    for (int i = 0; i < 20; ++i) {
        logger.set_output_file((i % 2 == 0 ? first : second).string());
    }
    stop = true;
    for (auto& t : writers) t.join();

    logger.set_output_file(second.string());
    LOG_WARNING("after reconfiguration");
    logger.flush();

    std::ifstream in(second);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("after reconfiguration"), std::string::npos);
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_TRUE(fs::exists(first));

    logger.set_output_file("");
    logger.set_level(saved);
    fs::remove_all(dir);
}

TEST(ErrorTest, MessageCarriesCodeAndContext) {
    StoreError err("relation does not exist", "SELECT * FROM missing", "42P01");
    std::string what = err.what();
    EXPECT_NE(what.find("[101]"), std::string::npos);
    EXPECT_NE(what.find("SELECT * FROM missing"), std::string::npos);
    EXPECT_EQ(err.sqlstate(), "42P01");
    EXPECT_EQ(err.code(), ErrorCode::QUERY_FAILED);
}

TEST(ErrorTest, CheckArgumentThrows) {
    EXPECT_THROW(SKOPJE_CHECK_ARGUMENT(false, "bad"), InvalidArgumentError);
    EXPECT_NO_THROW(SKOPJE_CHECK_ARGUMENT(true, "fine"));
}
