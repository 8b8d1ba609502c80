// STAKEVAULT - Database Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include "stakevault/db/database.h"
#include "stakevault/db/leveldb.h"
#include "stakevault/db/memorydb.h"
#include <filesystem>
#include <random>

using namespace stakevault;
using namespace stakevault::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakevault_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> OpenTestDatabase() {
        Options opts;
        opts.create_if_missing = true;
        auto [status, db] = OpenDatabase(testDir_ / "test_db", opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, ErrorIfExists) {
    { auto db = OpenTestDatabase(); }

    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "test_db", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(DatabaseTest, PutAndGet) {
    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    Status s = db->Get(Slice("key1"), &value);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(value, "value1");

    s = db->Get(Slice("nonexistent"), &value);
    EXPECT_TRUE(s.IsNotFound());
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto db = OpenTestDatabase();
        ASSERT_NE(db, nullptr);
        WriteOptions sync;
        sync.sync = true;
        ASSERT_TRUE(db->Put(sync, Slice("persist"), Slice("yes")).ok());
    }

    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, WriteBatch) {
    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);

    db::WriteBatch batch;
    batch.Put(Slice("key1"), Slice("value1"));
    batch.Put(Slice("key2"), Slice("value2"));
    batch.Put(Slice("key3"), Slice("value3"));
    batch.Delete(Slice("key2"));  // Delete in same batch
    EXPECT_EQ(batch.Count(), 4u);

    ASSERT_TRUE(db->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Get(Slice("key2"), &value).IsNotFound());
    EXPECT_TRUE(db->Exists(Slice("key3")));
}

TEST_F(DatabaseTest, IteratorSeeksPrefix) {
    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);

    db->Put(Slice("Ea"), Slice("1"));
    db->Put(Slice("Eb"), Slice("2"));
    db->Put(Slice("Fa"), Slice("3"));
    db->Put(Slice("A"), Slice("4"));

    auto iter = db->NewIterator();
    std::vector<std::string> keys;
    for (iter->Seek(Slice("E")); iter->Valid() && iter->key().starts_with(Slice("E"));
         iter->Next()) {
        keys.push_back(iter->key().ToString());
    }
    ASSERT_TRUE(iter->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"Ea", "Eb"}));
}

TEST_F(DatabaseTest, DestroyRemovesData) {
    {
        auto db = OpenTestDatabase();
        ASSERT_NE(db, nullptr);
        db->Put(Slice("key"), Slice("value"));
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "test_db").ok());

    auto db = OpenTestDatabase();
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists(Slice("key")));
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(DatabaseTest, MemoryDatabaseBasic) {
    MemoryDatabase db;

    ASSERT_TRUE(db.Put(WriteOptions(), Slice("key"), Slice("value")).ok());

    std::string value;
    ASSERT_TRUE(db.Get(ReadOptions(), Slice("key"), &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_EQ(db.Size(), 1u);

    ASSERT_TRUE(db.Delete(Slice("key")).ok());
    EXPECT_TRUE(db.Get(Slice("key"), &value).IsNotFound());
}

TEST_F(DatabaseTest, MemoryDatabaseBatchAndIterator) {
    MemoryDatabase db;
    db.Put(Slice("b"), Slice("old"));

    db::WriteBatch batch;
    batch.Put(Slice("c"), Slice("3"));
    batch.Put(Slice("a"), Slice("1"));
    batch.Delete(Slice("b"));
    ASSERT_TRUE(db.Write(&batch).ok());

    auto iter = db.NewIterator();

    // Snapshot: later writes are not visible to this iterator
    db.Put(Slice("d"), Slice("4"));

    std::vector<std::string> keys;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        keys.push_back(iter->key().ToString());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "c"}));

    iter->Seek(Slice("b"));
    ASSERT_TRUE(iter->Valid());
    EXPECT_EQ(iter->key().ToString(), "c");
    EXPECT_EQ(iter->value().ToString(), "3");

    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(DatabaseTest, SerializeDeserialize) {
    Hash160 original;
    for (size_t i = 0; i < 20; ++i) {
        original[i] = static_cast<uint8_t>(i);
    }

    std::string data = SerializeToString(original);
    EXPECT_EQ(data.size(), 20u);

    Hash160 restored;
    EXPECT_TRUE(DeserializeFromString(data, restored));
    EXPECT_EQ(original, restored);

    uint64_t counter = 0;
    EXPECT_FALSE(DeserializeFromString(std::string("abc"), counter));
}

TEST_F(DatabaseTest, MakeKey) {
    std::string key1 = MakeKey(prefix::PARAMS);
    EXPECT_EQ(key1.size(), 1u);
    EXPECT_EQ(key1[0], prefix::PARAMS);

    std::string key2 = MakeKey(prefix::FLAG, Slice("stakes"));
    EXPECT_EQ(key2[0], prefix::FLAG);
    EXPECT_EQ(key2.substr(1), "stakes");
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(DatabaseTest, StatusOk) {
    Status s = Status::Ok();
    EXPECT_TRUE(s.ok());
    EXPECT_FALSE(s.IsNotFound());
    EXPECT_FALSE(s.IsCorruption());
    EXPECT_FALSE(s.IsIOError());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST_F(DatabaseTest, StatusCodes) {
    EXPECT_TRUE(Status::NotFound("key not found").IsNotFound());
    EXPECT_EQ(Status::NotFound("key not found").message(), "key not found");
    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_TRUE(Status::IOError("disk full").IsIOError());
    EXPECT_EQ(Status::InvalidArgument().code(), Status::INVALID_ARGUMENT);
}

TEST_F(DatabaseTest, StatusToString) {
    Status s = Status::Corruption("test message");
    std::string str = s.ToString();
    EXPECT_NE(str.find("Corruption"), std::string::npos);
    EXPECT_NE(str.find("test message"), std::string::npos);
}

// ============================================================================
// Slice Tests
// ============================================================================

TEST_F(DatabaseTest, SliceBasic) {
    std::string data = "hello world";
    Slice slice(data);

    EXPECT_EQ(slice.size(), data.size());
    EXPECT_EQ(slice.ToString(), data);
    EXPECT_FALSE(slice.empty());
    EXPECT_EQ(slice[4], 'o');
}

TEST_F(DatabaseTest, SlicePrefix) {
    Slice key("Eabc");
    EXPECT_TRUE(key.starts_with(Slice("E")));
    EXPECT_TRUE(key.starts_with(Slice("")));
    EXPECT_FALSE(key.starts_with(Slice("F")));
    EXPECT_FALSE(Slice("E").starts_with(key));

    EXPECT_TRUE(Slice("abc") == Slice("abc"));
    EXPECT_TRUE(Slice("abc") != Slice("abd"));
}

TEST_F(DatabaseTest, SliceEmpty) {
    Slice empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.size(), 0u);
}
