#include <gtest/gtest.h>
#include "record_store.hpp"
#include "test_helpers.hpp"
#include <sqlite3.h>
#include <algorithm>

using test_helpers::TempDbPath;
using test_helpers::make_record;

class RecordStoreTest : public ::testing::Test {
protected:
    TempDbPath db_{"record_store_test"};

    void exec_raw(const std::string& sql) {
        sqlite3* handle = nullptr;
        ASSERT_EQ(sqlite3_open(db_.str().c_str(), &handle), SQLITE_OK);
        char* err = nullptr;
        int rc = sqlite3_exec(handle, sql.c_str(), nullptr, nullptr, &err);
        std::string message = err ? err : "";
        sqlite3_free(err);
        sqlite3_close(handle);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }
};

TEST(RecordStoreOpenTest, UnopenablePathThrows) {
    EXPECT_THROW(RecordStore("/nonexistent-dir/polyhedge/markets.db"), std::runtime_error);
}

TEST_F(RecordStoreTest, EmptyStoreHasNoAge) {
    RecordStore store(db_.str());
    EXPECT_TRUE(store.is_healthy());
    EXPECT_EQ(store.count(), 0u);
    EXPECT_TRUE(store.get_all().empty());
    EXPECT_FALSE(store.cache_age().has_value());
}

TEST_F(RecordStoreTest, ReplaceAllRoundTripsRecords) {
    RecordStore store(db_.str());
    auto record = make_record("m1", "Will the Fed cut rates?", 25000.0, {{"Yes", 0.35}, {"No", 0.65}});
    record.description = "Resolves on the June FOMC decision";
    record.end_date = "2026-06-30T00:00:00Z";
    record.slug = "fed-june";

    ASSERT_TRUE(store.replace_all({record, make_record("m2", "Will it rain in Paris?")}));

    auto all = store.get_all();
    ASSERT_EQ(all.size(), 2u);
    auto it = std::find_if(all.begin(), all.end(), [](const MarketRecord& r) { return r.id == "m1"; });
    ASSERT_NE(it, all.end());
    EXPECT_EQ(it->question, "Will the Fed cut rates?");
    EXPECT_EQ(it->description, "Resolves on the June FOMC decision");
    ASSERT_EQ(it->outcomes.size(), 2u);
    EXPECT_EQ(it->outcomes[1].name, "No");
    EXPECT_DOUBLE_EQ(it->outcomes[1].price, 0.65);
    EXPECT_DOUBLE_EQ(it->liquidity, 25000.0);
    ASSERT_TRUE(it->end_date.has_value());
    EXPECT_EQ(*it->slug, "fed-june");

    auto age = store.cache_age();
    ASSERT_TRUE(age.has_value());
    EXPECT_LE(age->count(), 5);
}

TEST_F(RecordStoreTest, ReplaceAllDiscardsPreviousContents) {
    RecordStore store(db_.str());
    ASSERT_TRUE(store.replace_all({make_record("old1", "Old one"), make_record("old2", "Old two")}));
    ASSERT_TRUE(store.replace_all({make_record("new1", "New one")}));

    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, "new1");
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(RecordStoreTest, DuplicateIdsKeepLastOccurrence) {
    RecordStore store(db_.str());
    ASSERT_TRUE(store.replace_all({make_record("dup", "First version"), make_record("dup", "Second version")}));

    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].question, "Second version");
}

TEST_F(RecordStoreTest, InactiveRecordsAreNotReturned) {
    RecordStore store(db_.str());
    auto closed = make_record("closed", "Closed market");
    closed.active = false;
    ASSERT_TRUE(store.replace_all({make_record("open", "Open market"), closed}));

    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, "open");
    EXPECT_EQ(store.count(), 2u);
}

TEST_F(RecordStoreTest, MalformedRowIsSkipped) {
    {
        RecordStore store(db_.str());
        ASSERT_TRUE(store.replace_all({make_record("good", "Good row"), make_record("bad", "Bad row")}));
    }
    exec_raw("UPDATE markets SET data = '{not json' WHERE id = 'bad'");

    RecordStore store(db_.str());
    auto all = store.get_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, "good");

    auto by_id = store.get_by_ids({"good", "bad"});
    EXPECT_EQ(by_id.size(), 1u);
    EXPECT_EQ(by_id.count("good"), 1u);
}

TEST_F(RecordStoreTest, GetByIdsReturnsOnlyKnownIds) {
    RecordStore store(db_.str());
    std::vector<MarketRecord> records;
    for (int i = 0; i < 1200; ++i) {
        records.push_back(make_record("id" + std::to_string(i), "Question " + std::to_string(i)));
    }
    ASSERT_TRUE(store.replace_all(records));

    std::vector<std::string> wanted;
    for (int i = 0; i < 1200; i += 2) {
        wanted.push_back("id" + std::to_string(i));
    }
    wanted.push_back("missing");

    auto found = store.get_by_ids(wanted);
    EXPECT_EQ(found.size(), 600u);
    EXPECT_EQ(found.count("missing"), 0u);
    EXPECT_EQ(found.at("id1198").question, "Question 1198");
    EXPECT_TRUE(store.get_by_ids({}).empty());
}
