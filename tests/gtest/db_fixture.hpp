// =============================================================================
// Database test fixture
// =============================================================================
//
// Connects with the SKOPJE_DB_* environment on top of the defaults and skips
// the test when no server answers. Tables made with scratch_table() are
// dropped in TearDown.
//

#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "skopje/config.hpp"
#include "skopje/db/connection.hpp"
#include "skopje/db/result.hpp"
#include "skopje/error.hpp"

namespace skopje::test {

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config config;
        apply_env_overrides(config);
        config.database.connect_timeout = 5;

        pool_ = std::make_unique<db::ConnectionPool>(config.database, pool_size());
        try {
            auto probe = pool_->acquire();
        } catch (const StoreError& e) {
            pool_.reset();
            GTEST_SKIP() << "Database connection failed: " << e.message();
        }
    }

    void TearDown() override {
        if (!pool_) return;
        auto conn = pool_->acquire();
        for (const auto& table : tables_) {
            db::exec(conn.get(), "DROP TABLE IF EXISTS " + table);
        }
    }

    virtual size_t pool_size() const { return 4; }

    // Create a uniquely named table with the given column list and return its name.
    std::string scratch_table(const std::string& columns) {
        static std::atomic<int> counter{0};
        std::string name = "skopje_test_" + std::to_string(::getpid()) + "_" +
                           std::to_string(counter.fetch_add(1));
        auto conn = pool_->acquire();
        db::exec(conn.get(), "DROP TABLE IF EXISTS " + name);
        db::exec(conn.get(), "CREATE TABLE " + name + " (" + columns + ")");
        tables_.push_back(name);
        return name;
    }

    int64_t count_rows(const std::string& table) {
        auto conn = pool_->acquire();
        db::Result res = db::exec(conn.get(), "SELECT count(*) FROM " + table);
        return res.get<int64_t>(0, 0);
    }

    std::unique_ptr<db::ConnectionPool> pool_;

private:
    std::vector<std::string> tables_;
};

} // namespace skopje::test
