// =============================================================================
// PgLoader Tests
// =============================================================================
//
// Run against a live server (SKOPJE_DB_* environment); skipped without one.
//

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "db_fixture.hpp"
#include "skopje/db/loader.hpp"

using namespace skopje;
using namespace skopje::db;

namespace {

struct Reading {
    int32_t id;
    std::string station;
    std::optional<double> value;

    Row sql_map() const { return {id, station, value}; }
    static std::vector<ColumnType> sql_types() {
        return {ColumnType::Int4, ColumnType::Text, ColumnType::Float8};
    }
};

// Decomposes to one value too many for a two-parameter statement
struct WideRecord {
    int32_t a;
    int32_t b;
    int32_t c;

    Row sql_map() const { return {a, b, c}; }
    static std::vector<ColumnType> sql_types() {
        return {ColumnType::Int4, ColumnType::Int4, ColumnType::Int4};
    }
};

// Record whose id column is int8 for one record, which the int4 COPY rejects
struct SometimesWide {
    int32_t id;

    Row sql_map() const {
        if (id == 3) return {int64_t{id}};
        return {id};
    }
    static std::vector<ColumnType> sql_types() { return {ColumnType::Int4}; }
};

const char* kReadingColumns = "id integer PRIMARY KEY, station text NOT NULL, value double precision";

} // namespace

class LoaderTest : public test::DatabaseTest {};

TEST_F(LoaderTest, InsertCommitsWholeBatch) {
    std::string table = scratch_table(kReadingColumns);
    PgLoader loader(*pool_);

    std::vector<Reading> readings = {{1, "Skopje", 12.5}, {2, "Bitola", std::nullopt}, {3, "Ohrid", -1.0}};
    EXPECT_EQ(loader.insert("INSERT INTO " + table + " VALUES ($1, $2, $3)", readings), 3u);
    EXPECT_EQ(count_rows(table), 3);

    auto value = loader.fetch_if_exists<double>("SELECT value FROM " + table + " WHERE id = $1",
                                                {int32_t{3}});
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(*value, -1.0);
}

TEST_F(LoaderTest, InsertArityMismatchCommitsNothing) {
    std::string table = scratch_table("a integer, b integer");
    PgLoader loader(*pool_);

    std::vector<WideRecord> records = {{1, 2, 3}, {4, 5, 6}};
    EXPECT_THROW(loader.insert("INSERT INTO " + table + " (a, b) VALUES ($1, $2)", records),
                 SchemaMismatchError);
    EXPECT_EQ(count_rows(table), 0);
}

TEST_F(LoaderTest, InsertFailureRollsBackEarlierRows) {
    std::string table = scratch_table(kReadingColumns);
    PgLoader loader(*pool_);

    // The duplicate primary key fails on the third row
    std::vector<Reading> readings = {{1, "a", 1.0}, {2, "b", 2.0}, {1, "c", 3.0}};
    try {
        loader.insert("INSERT INTO " + table + " VALUES ($1, $2, $3)", readings);
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.sqlstate(), kUniqueViolation);
    }
    EXPECT_EQ(count_rows(table), 0);
}

TEST_F(LoaderTest, InsertScalars) {
    std::string table = scratch_table("n bigint");
    PgLoader loader(*pool_);

    std::vector<int64_t> values = {10, 20, 30};
    loader.insert("INSERT INTO " + table + " VALUES ($1)", values);

    auto sum = loader.fetch_if_exists<int64_t>("SELECT sum(n) FROM " + table, {});
    EXPECT_EQ(sum, std::optional<int64_t>(60));
}

TEST_F(LoaderTest, CopyStoresEveryRow) {
    std::string table = scratch_table(kReadingColumns);
    PgLoader loader(*pool_);

    std::vector<Reading> readings;
    for (int32_t i = 0; i < 5000; ++i) {
        readings.push_back({i, "station-" + std::to_string(i % 17),
                            i % 10 == 0 ? std::optional<double>() : std::optional<double>(i * 0.5)});
    }

    uint64_t stored = loader.copy("COPY " + table + " (id, station, value) FROM STDIN (FORMAT binary)",
                                  readings);
    EXPECT_EQ(stored, 5000u);
    EXPECT_EQ(count_rows(table), 5000);

    auto nulls = loader.fetch_if_exists<int64_t>(
        "SELECT count(*) FROM " + table + " WHERE value IS NULL", {});
    EXPECT_EQ(nulls, std::optional<int64_t>(500));

    auto station = loader.fetch_if_exists<std::string>(
        "SELECT station FROM " + table + " WHERE id = $1", {int32_t{18}});
    EXPECT_EQ(station, std::optional<std::string>("station-1"));
}

TEST_F(LoaderTest, CopyWithBadRowStoresNothing) {
    std::string table = scratch_table("id integer");
    PgLoader loader(*pool_);

    std::vector<SometimesWide> records = {{1}, {2}, {3}, {4}};
    EXPECT_THROW(loader.copy("COPY " + table + " (id) FROM STDIN (FORMAT binary)", records),
                 SchemaMismatchError);
    EXPECT_EQ(count_rows(table), 0);
}

TEST_F(LoaderTest, CopyRejectedByServerStoresNothing) {
    std::string table = scratch_table("id integer PRIMARY KEY");
    PgLoader loader(*pool_);

    std::vector<int32_t> ids = {1, 2, 2};
    EXPECT_THROW(loader.copy("COPY " + table + " (id) FROM STDIN (FORMAT binary)", ids), StoreError);
    EXPECT_EQ(count_rows(table), 0);
}

TEST_F(LoaderTest, FetchIfExistsMissingRow) {
    std::string table = scratch_table(kReadingColumns);
    PgLoader loader(*pool_);

    auto missing = loader.fetch_if_exists<std::string>(
        "SELECT station FROM " + table + " WHERE id = $1", {int32_t{42}});
    EXPECT_FALSE(missing.has_value());
}

TEST_F(LoaderTest, FetchOrInsertCreatesOnce) {
    std::string table = scratch_table("id serial PRIMARY KEY, name text UNIQUE NOT NULL");
    PgLoader loader(*pool_);

    const std::string fetch = "SELECT id FROM " + table + " WHERE name = $1";
    const std::string insert = "INSERT INTO " + table + " (name) VALUES ($1)";

    int32_t first = loader.fetch_or_insert<int32_t>(fetch, insert, {"Kumanovo"});
    int32_t again = loader.fetch_or_insert<int32_t>(fetch, insert, {"Kumanovo"});
    int32_t other = loader.fetch_or_insert<int32_t>(fetch, insert, {"Prilep"});

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(count_rows(table), 2);
}

TEST_F(LoaderTest, ConcurrentFetchOrInsertLeavesOneRow) {
    std::string table = scratch_table("id serial PRIMARY KEY, name text UNIQUE NOT NULL");
    PgLoader loader(*pool_);

    const std::string fetch = "SELECT id FROM " + table + " WHERE name = $1";
    const std::string insert = "INSERT INTO " + table + " (name) VALUES ($1)";

    std::mutex mutex;
    std::set<int32_t> ids;
    std::atomic<int> successes{0};
    std::atomic<int> race_losses{0};
    std::atomic<int> other_errors{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            try {
                int32_t id = loader.fetch_or_insert<int32_t>(fetch, insert, {"Tetovo"});
                successes.fetch_add(1);
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(id);
            } catch (const RaceLossError&) {
                race_losses.fetch_add(1);
            } catch (const std::exception&) {
                other_errors.fetch_add(1);
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(count_rows(table), 1);
    EXPECT_EQ(other_errors.load(), 0);
    // Every caller either sees the row or loses the race; the winner always sees it
    EXPECT_EQ(successes.load() + race_losses.load(), 8);
    EXPECT_GE(successes.load(), 1);
    EXPECT_EQ(ids.size(), 1u);
}

TEST_F(LoaderTest, FetchCollectionMapsRows) {
    std::string table = scratch_table(kReadingColumns);
    PgLoader loader(*pool_);
    loader.insert("INSERT INTO " + table + " VALUES ($1, $2, $3)",
                  std::vector<Reading>{{1, "a", 1.0}, {2, "b", std::nullopt}, {3, "c", 3.0}});

    auto readings = loader.fetch_collection(
        "SELECT id, station, value FROM " + table + " WHERE id >= $1 ORDER BY id", {int32_t{2}},
        [](const Result& res, int row) {
            return Reading{res.get<int32_t>(row, 0), res.get<std::string>(row, 1),
                           res.get_optional<double>(row, 2)};
        });

    ASSERT_EQ(readings.size(), 2u);
    EXPECT_EQ(readings[0].id, 2);
    EXPECT_FALSE(readings[0].value.has_value());
    EXPECT_EQ(readings[1].station, "c");
}

TEST_F(LoaderTest, ExecuteReportsAffectedRows) {
    std::string table = scratch_table("n integer");
    PgLoader loader(*pool_);
    loader.insert("INSERT INTO " + table + " VALUES ($1)", std::vector<int32_t>{1, 2, 3, 4});

    EXPECT_EQ(loader.execute("DELETE FROM " + table + " WHERE n > $1", {int32_t{2}}), 2u);
    EXPECT_THROW(loader.execute("SELECT * FROM no_such_table_skopje"), StoreError);
}

TEST_F(LoaderTest, ConnectionsReturnToThePool) {
    std::string table = scratch_table("n integer UNIQUE");
    PgLoader loader(*pool_);

    loader.insert("INSERT INTO " + table + " VALUES ($1)", std::vector<int32_t>{1});
    EXPECT_THROW(loader.insert("INSERT INTO " + table + " VALUES ($1)", std::vector<int32_t>{1}),
                 StoreError);
    EXPECT_THROW(loader.copy("COPY " + table + " (n) FROM STDIN (FORMAT binary)",
                             std::vector<int32_t>{1}),
                 StoreError);

    EXPECT_EQ(pool_->available(), pool_->open_connections());
    EXPECT_LE(pool_->open_connections(), pool_->max_size());
}

TEST_F(LoaderTest, AbortedTransactionDoesNotLeakIntoNextBorrower) {
    std::string table = scratch_table("n integer");
    {
        auto conn = pool_->acquire();
        exec(conn.get(), "BEGIN");
        exec(conn.get(), "INSERT INTO " + table + " VALUES (1)");
        // Returned mid-transaction: the pool must discard it
    }
    EXPECT_EQ(count_rows(table), 0);
}

class SmallPoolLoaderTest : public test::DatabaseTest {
protected:
    size_t pool_size() const override { return 1; }
};

TEST_F(SmallPoolLoaderTest, BorrowersWaitForTheOnlyConnection) {
    std::string table = scratch_table("n integer");
    PgLoader loader(*pool_);

    std::vector<std::thread> workers;
    for (int32_t i = 0; i < 4; ++i) {
        workers.emplace_back([&loader, &table, i] {
            loader.insert("INSERT INTO " + table + " VALUES ($1)", std::vector<int32_t>{i});
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(count_rows(table), 4);
    EXPECT_EQ(pool_->open_connections(), 1u);
}
