// DADBS - Database Tests
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <gtest/gtest.h>
#include <dadbs/db/database.h>
#include <dadbs/db/leveldb.h>

#include <filesystem>
#include <string>

namespace dadbs {
namespace db {
namespace test {

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, ErrorKinds) {
    EXPECT_TRUE(Status::NotFound("missing").IsNotFound());
    EXPECT_TRUE(Status::Corruption().IsCorruption());
    EXPECT_TRUE(Status::IOError("disk").IsIOError());
    EXPECT_FALSE(Status::InvalidArgument().ok());
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
    EXPECT_EQ(Status::NotFound("k").ToString(), "NotFound: k");
}

// ============================================================================
// Slice Tests
// ============================================================================

TEST(SliceTest, Construction) {
    std::string s = "account";
    Slice fromString(s);
    EXPECT_EQ(fromString.size(), 7u);
    EXPECT_EQ(fromString.ToString(), "account");

    std::vector<uint8_t> v = {1, 2, 3};
    Slice fromVector(v);
    EXPECT_EQ(fromVector.ToVector(), v);

    Slice empty;
    EXPECT_TRUE(empty.empty());
}

TEST(SliceTest, ComparisonAndPrefix) {
    Slice a("abc");
    EXPECT_EQ(a, Slice("abc"));
    EXPECT_NE(a, Slice("abd"));
    EXPECT_TRUE(a.starts_with(Slice("ab")));
    EXPECT_FALSE(a.starts_with(Slice("abcd")));
}

TEST(SliceTest, MakeKeyPrependsPrefix) {
    std::string key = MakeKey(prefix::ACCOUNT, Slice("wallet"));
    EXPECT_EQ(key, "awallet");
    EXPECT_EQ(MakeKey(prefix::META, Slice("")), "m");
}

// ============================================================================
// WriteBatch Tests
// ============================================================================

TEST(WriteBatchTest, KeepsInsertionOrder) {
    WriteBatch batch;
    EXPECT_TRUE(batch.Empty());

    batch.Put("k1", "v1");
    batch.Delete("k2");
    batch.Put("k3", "v3");
    EXPECT_EQ(batch.Count(), 3u);

    std::vector<std::string> keys;
    int deletes = 0;
    batch.Iterate([&](const std::string& key, const std::optional<std::string>& value) {
        keys.push_back(key);
        if (!value) {
            ++deletes;
        }
    });
    EXPECT_EQ(keys, (std::vector<std::string>{"k1", "k2", "k3"}));
    EXPECT_EQ(deletes, 1);

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

// ============================================================================
// MemoryDatabase Tests
// ============================================================================

class MemoryDatabaseTest : public ::testing::Test {
protected:
    MemoryDatabase db_;
};

TEST_F(MemoryDatabaseTest, PutGetDelete) {
    ASSERT_TRUE(db_.Put("key", "value").ok());

    std::string value;
    ASSERT_TRUE(db_.Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_TRUE(db_.Exists("key"));

    ASSERT_TRUE(db_.Delete("key").ok());
    EXPECT_TRUE(db_.Get("key", &value).IsNotFound());
    EXPECT_FALSE(db_.Exists("key"));
}

TEST_F(MemoryDatabaseTest, PutOverwrites) {
    ASSERT_TRUE(db_.Put("key", "one").ok());
    ASSERT_TRUE(db_.Put("key", "two").ok());

    std::string value;
    ASSERT_TRUE(db_.Get("key", &value).ok());
    EXPECT_EQ(value, "two");
    EXPECT_EQ(db_.Size(), 1u);
}

TEST_F(MemoryDatabaseTest, BinaryValues) {
    std::vector<uint8_t> bytes = {0x00, 0xff, 0x00, 0x10};
    ASSERT_TRUE(db_.Put("bin", bytes).ok());

    std::string value;
    ASSERT_TRUE(db_.Get("bin", &value).ok());
    EXPECT_EQ(Slice(value).ToVector(), bytes);
}

TEST_F(MemoryDatabaseTest, WriteBatchAppliesAll) {
    ASSERT_TRUE(db_.Put("old", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("old");
    ASSERT_TRUE(db_.Write(&batch).ok());

    EXPECT_TRUE(db_.Exists("a"));
    EXPECT_TRUE(db_.Exists("b"));
    EXPECT_FALSE(db_.Exists("old"));
    EXPECT_EQ(db_.Size(), 2u);
}

TEST_F(MemoryDatabaseTest, IteratorIsOrdered) {
    ASSERT_TRUE(db_.Put("b", "2").ok());
    ASSERT_TRUE(db_.Put("a", "1").ok());
    ASSERT_TRUE(db_.Put("c", "3").ok());

    auto it = db_.NewIterator();
    std::string seen;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        seen += it->key().ToString() + it->value().ToString();
    }
    EXPECT_EQ(seen, "a1b2c3");
    EXPECT_TRUE(it->status().ok());
}

TEST_F(MemoryDatabaseTest, IteratorSeek) {
    ASSERT_TRUE(db_.Put(MakeKey(prefix::ACCOUNT, "x"), "1").ok());
    ASSERT_TRUE(db_.Put(MakeKey(prefix::ACCOUNT, "y"), "2").ok());
    ASSERT_TRUE(db_.Put(MakeKey(prefix::META, "z"), "3").ok());

    auto it = db_.NewIterator();
    std::string accountPrefix(1, prefix::ACCOUNT);
    int accounts = 0;
    for (it->Seek(accountPrefix); it->Valid() && it->key().starts_with(accountPrefix);
         it->Next()) {
        ++accounts;
    }
    EXPECT_EQ(accounts, 2);
}

TEST_F(MemoryDatabaseTest, IteratorIsSnapshot) {
    ASSERT_TRUE(db_.Put("a", "1").ok());
    auto it = db_.NewIterator();
    ASSERT_TRUE(db_.Put("b", "2").ok());

    int count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1);
}

// ============================================================================
// OpenDatabase Tests
// ============================================================================

class OpenDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "dadbs_db_test";
        std::filesystem::remove_all(path_);
    }

    void TearDown() override {
        std::filesystem::remove_all(path_);
    }

    std::filesystem::path path_;
};

TEST_F(OpenDatabaseTest, OpensAndStores) {
    auto [status, database] = OpenDatabase(path_);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(database, nullptr);

    ASSERT_TRUE(database->Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(database->Get("key", &value).ok());
    EXPECT_EQ(value, "value");
}

TEST_F(OpenDatabaseTest, PersistsWithLevelDB) {
    if (std::string(BackendName()) != "leveldb") {
        GTEST_SKIP() << "in-memory backend";
    }

    {
        auto [status, database] = OpenDatabase(path_);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(database->Put("persist", "yes").ok());
    }

    auto [status, database] = OpenDatabase(path_);
    ASSERT_TRUE(status.ok());
    std::string value;
    ASSERT_TRUE(database->Get("persist", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(OpenDatabaseTest, Destroy) {
    {
        auto [status, database] = OpenDatabase(path_);
        ASSERT_TRUE(status.ok());
    }
    EXPECT_TRUE(DestroyDatabase(path_).ok());
}

} // namespace test
} // namespace db
} // namespace dadbs
