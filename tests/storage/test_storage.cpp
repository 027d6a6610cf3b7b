// NOCKLEDGER - Storage Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/storage/storage.h"

#include <string>
#include <thread>
#include <vector>

namespace nockledger {
namespace storage {
namespace {

class MemoryStorageTest : public ::testing::Test {
protected:
    MemoryStorage storage_;
};

TEST_F(MemoryStorageTest, SaveLoadExistsDelete) {
    std::vector<Byte> record = {1, 2, 3};
    ASSERT_TRUE(storage_.Save("alpha", record).ok());
    EXPECT_TRUE(storage_.Exists("alpha"));

    auto loaded = storage_.Load("alpha");
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(*loaded, record);

    ASSERT_TRUE(storage_.Delete("alpha").ok());
    EXPECT_FALSE(storage_.Exists("alpha"));
    EXPECT_EQ(storage_.Size(), 0u);
}

TEST_F(MemoryStorageTest, SaveOverwrites) {
    ASSERT_TRUE(storage_.Save("k", {1}).ok());
    ASSERT_TRUE(storage_.Save("k", {2, 2}).ok());
    auto loaded = storage_.Load("k");
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(*loaded, (std::vector<Byte>{2, 2}));
    EXPECT_EQ(storage_.Size(), 1u);
}

TEST_F(MemoryStorageTest, MissingKeyIsStorageError) {
    auto loaded = storage_.Load("missing");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.status().code(), Status::STORAGE);
    EXPECT_EQ(loaded.status().message(), "Record not found: missing");

    EXPECT_EQ(storage_.Delete("missing").code(), Status::STORAGE);
}

TEST_F(MemoryStorageTest, EmptyKeyRejected) {
    EXPECT_EQ(storage_.Save("", {1}).code(), Status::STORAGE);
}

TEST_F(MemoryStorageTest, KeysAreSorted) {
    ASSERT_TRUE(storage_.Save("b", {}).ok());
    ASSERT_TRUE(storage_.Save("a", {}).ok());
    ASSERT_TRUE(storage_.Save("c", {}).ok());
    EXPECT_EQ(storage_.Keys(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(MemoryStorageTest, ConcurrentWriters) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                std::string key = std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(storage_.Save(key, {static_cast<Byte>(i)}).ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(storage_.Size(), 400u);
}

// ============================================================================
// Typed Records
// ============================================================================

TEST_F(MemoryStorageTest, TypedRecordRoundTrip) {
    std::vector<std::string> names = {"main", "savings"};
    ASSERT_TRUE(SaveRecord(storage_, "names", names).ok());

    auto loaded = LoadRecord<std::vector<std::string>>(storage_, "names");
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(*loaded, names);
}

TEST_F(MemoryStorageTest, TypedRecordDetectsCorruption) {
    ASSERT_TRUE(storage_.Save("truncated", {5, 'a', 'b'}).ok());
    auto truncated = LoadRecord<std::string>(storage_, "truncated");
    ASSERT_FALSE(truncated.ok());
    EXPECT_EQ(truncated.status().code(), Status::SERIALIZATION);

    ASSERT_TRUE(storage_.Save("trailing", {1, 'a', 'z'}).ok());
    auto trailing = LoadRecord<std::string>(storage_, "trailing");
    ASSERT_FALSE(trailing.ok());
    EXPECT_EQ(trailing.status().code(), Status::SERIALIZATION);
}

TEST_F(MemoryStorageTest, TypedRecordMissingKey) {
    auto loaded = LoadRecord<uint64_t>(storage_, "absent");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.status().code(), Status::STORAGE);
}

} // namespace
} // namespace storage
} // namespace nockledger
