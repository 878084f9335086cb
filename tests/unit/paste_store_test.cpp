#include "store/sqlite_paste_store.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace pastebin;
using namespace pastebin::store;

class SqlitePasteStoreTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    fs::path db_path;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "pastebin_store_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        db_path = temp_dir / "pastes.db";
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    // Row count read through a separate connection
    int count_rows() const {
        sqlite3 *db = nullptr;
        if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            return -1;
        }
        sqlite3_stmt *stmt = nullptr;
        int count = -1;
        if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM pastes;", -1, &stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return count;
    }
};

TEST_F(SqlitePasteStoreTest, OpenCreatesSchema) {
    auto store = SqlitePasteStore::open(db_path);

    EXPECT_TRUE(store->is_open());
    EXPECT_TRUE(fs::exists(db_path));
    EXPECT_EQ(count_rows(), 0);
}

TEST_F(SqlitePasteStoreTest, OpenCreatesParentDirectories) {
    db_path = temp_dir / "nested" / "deeper" / "pastes.db";

    auto store = SqlitePasteStore::open(db_path);

    EXPECT_TRUE(fs::exists(db_path));
}

TEST_F(SqlitePasteStoreTest, InsertThenGet) {
    auto store = SqlitePasteStore::open(db_path);
    std::string error;

    ASSERT_EQ(store->insert("a1b2c3d4", "hello world", error), StoreStatus::OK) << error;

    paste::PasteRecord record;
    ASSERT_EQ(store->get_by_id("a1b2c3d4", record, error), StoreStatus::OK) << error;
    EXPECT_EQ(record.id, "a1b2c3d4");
    EXPECT_EQ(record.content, "hello world");
    // CURRENT_TIMESTAMP format: YYYY-MM-DD HH:MM:SS
    ASSERT_EQ(record.created_at.size(), 19u);
    EXPECT_EQ(record.created_at[4], '-');
    EXPECT_EQ(record.created_at[10], ' ');
    EXPECT_EQ(record.created_at[13], ':');
}

TEST_F(SqlitePasteStoreTest, ContentStoredVerbatim) {
    auto store = SqlitePasteStore::open(db_path);
    std::string error;
    const std::string content = "<script>alert(1)</script>\n\t\"quotes\" & 'apostrophes' \xC3\xA9";

    ASSERT_EQ(store->insert("00000000", content, error), StoreStatus::OK);

    paste::PasteRecord record;
    ASSERT_EQ(store->get_by_id("00000000", record, error), StoreStatus::OK);
    EXPECT_EQ(record.content, content);
}

TEST_F(SqlitePasteStoreTest, DuplicateIdIsConstraintViolation) {
    auto store = SqlitePasteStore::open(db_path);
    std::string error;

    ASSERT_EQ(store->insert("a1b2c3d4", "first", error), StoreStatus::OK);
    EXPECT_EQ(store->insert("a1b2c3d4", "second", error), StoreStatus::CONSTRAINT_VIOLATION);
    EXPECT_FALSE(error.empty());

    // Original row untouched
    paste::PasteRecord record;
    ASSERT_EQ(store->get_by_id("a1b2c3d4", record, error), StoreStatus::OK);
    EXPECT_EQ(record.content, "first");
    EXPECT_EQ(count_rows(), 1);
}

TEST_F(SqlitePasteStoreTest, GetUnknownIdIsNotFound) {
    auto store = SqlitePasteStore::open(db_path);
    std::string error;
    paste::PasteRecord record;

    EXPECT_EQ(store->get_by_id("doesnotexist", record, error), StoreStatus::NOT_FOUND);
}

TEST_F(SqlitePasteStoreTest, NoPrefixMatching) {
    auto store = SqlitePasteStore::open(db_path);
    std::string error;
    ASSERT_EQ(store->insert("a1b2c3d4", "text", error), StoreStatus::OK);

    paste::PasteRecord record;
    EXPECT_EQ(store->get_by_id("a1b2", record, error), StoreStatus::NOT_FOUND);
    EXPECT_EQ(store->get_by_id("a1b2%", record, error), StoreStatus::NOT_FOUND);
    EXPECT_EQ(store->get_by_id("A1B2C3D4", record, error), StoreStatus::NOT_FOUND);
}

TEST_F(SqlitePasteStoreTest, DataSurvivesReopen) {
    std::string error;
    {
        auto store = SqlitePasteStore::open(db_path);
        ASSERT_EQ(store->insert("cafebabe", "persisted", error), StoreStatus::OK);
    }

    // Schema creation is idempotent and rows are kept
    auto store = SqlitePasteStore::open(db_path);
    paste::PasteRecord record;
    ASSERT_EQ(store->get_by_id("cafebabe", record, error), StoreStatus::OK);
    EXPECT_EQ(record.content, "persisted");
}

TEST_F(SqlitePasteStoreTest, ClosedStoreReportsError) {
    auto store = SqlitePasteStore::open(db_path);
    store->close();
    store->close();  // idempotent

    std::string error;
    paste::PasteRecord record;
    EXPECT_FALSE(store->is_open());
    EXPECT_EQ(store->insert("a1b2c3d4", "text", error), StoreStatus::ERROR);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(store->get_by_id("a1b2c3d4", record, error), StoreStatus::ERROR);
}

TEST_F(SqlitePasteStoreTest, OpenFailureThrows) {
    // A regular file where the parent directory should be
    const fs::path blocker = temp_dir / "blocker";
    std::ofstream(blocker) << "not a directory";
    db_path = blocker / "pastes.db";

    EXPECT_THROW(SqlitePasteStore::open(db_path), std::runtime_error);
}

TEST_F(SqlitePasteStoreTest, ConcurrentInsertsWithDistinctIds) {
    auto store = SqlitePasteStore::open(db_path);

    const int kThreads = 4;
    const int kPerThread = 25;
    std::vector<std::thread> threads;
    std::vector<int> failures(kThreads, 0);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string error;
                const std::string id = std::to_string(t) + "_" + std::to_string(i);
                if (store->insert(id, "content " + id, error) != StoreStatus::OK) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
    EXPECT_EQ(count_rows(), kThreads * kPerThread);
}

TEST(StoreStatusTest, ToString) {
    EXPECT_STREQ(store_status_to_string(StoreStatus::OK), "OK");
    EXPECT_STREQ(store_status_to_string(StoreStatus::NOT_FOUND), "NOT_FOUND");
    EXPECT_STREQ(store_status_to_string(StoreStatus::CONSTRAINT_VIOLATION), "CONSTRAINT_VIOLATION");
    EXPECT_STREQ(store_status_to_string(StoreStatus::ERROR), "ERROR");
}
