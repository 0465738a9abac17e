/**
 * @file test_storage.cpp
 * @brief Unit tests for key-value stores, data accessors and the active source pointer
 */

#include <gtest/gtest.h>

#include "../test_fixtures.h"

#include <fstream>
#include <string>
#include <vector>

namespace matchops::sync::test {

using namespace std::chrono_literals;

// =============================================================================
// Key-Value Store Tests
// =============================================================================

class MemoryKeyValueStoreTest : public ::testing::Test {
protected:
    memory_key_value_store store_;
};

TEST_F(MemoryKeyValueStoreTest, MissingKeyIsEmpty) {
    auto value = store_.get("absent");

    ASSERT_TRUE(value);
    EXPECT_FALSE(value.value().has_value());
}

TEST_F(MemoryKeyValueStoreTest, SetGetRemove) {
    ASSERT_TRUE(store_.set("k", "v1"));
    ASSERT_TRUE(store_.set("k", "v2"));

    auto value = store_.get("k");
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().value(), "v2");
    EXPECT_EQ(store_.size(), 1u);

    ASSERT_TRUE(store_.remove("k"));
    EXPECT_FALSE(store_.get("k").value().has_value());
    EXPECT_TRUE(store_.remove("k"));
}

class FileKeyValueStoreTest : public TempDirectoryFixture {};

TEST_F(FileKeyValueStoreTest, PersistsAcrossInstances) {
    {
        file_key_value_store store(test_dir_);
        ASSERT_TRUE(store.set("matchops_migration_progress", "{\"version\": 1}"));
    }

    file_key_value_store reopened(test_dir_);
    auto value = reopened.get("matchops_migration_progress");

    ASSERT_TRUE(value);
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), "{\"version\": 1}");
}

TEST_F(FileKeyValueStoreTest, SanitizesKeysIntoFileNames) {
    file_key_value_store store(test_dir_);
    ASSERT_TRUE(store.set("../escape/attempt", "x"));

    EXPECT_FALSE(std::filesystem::exists(test_dir_.parent_path() / "escape"));

    auto value = store.get("../escape/attempt");
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().value_or(""), "x");
}

TEST_F(FileKeyValueStoreTest, RemoveDeletesFile) {
    file_key_value_store store(test_dir_);
    ASSERT_TRUE(store.set("key", "value"));
    ASSERT_TRUE(store.remove("key"));

    auto value = store.get("key");
    ASSERT_TRUE(value);
    EXPECT_FALSE(value.value().has_value());
}

TEST_F(FileKeyValueStoreTest, NoTemporaryFilesRemain) {
    file_key_value_store store(test_dir_);
    ASSERT_TRUE(store.set("key", "value"));

    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    }
}

// =============================================================================
// Memory Data Accessor Tests
// =============================================================================

class MemoryDataAccessorTest : public ::testing::Test {
protected:
    memory_data_accessor store_{"local"};
};

TEST_F(MemoryDataAccessorTest, PopulateCreatesOrderedItems) {
    store_.populate(3);

    auto count = store_.count();
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 3u);

    auto ids = store_.list_item_ids(0, 10);
    ASSERT_TRUE(ids);
    ASSERT_EQ(ids.value().size(), 3u);
    EXPECT_EQ(ids.value()[0], "item-00001");
    EXPECT_EQ(ids.value()[2], "item-00003");
}

TEST_F(MemoryDataAccessorTest, ListPagesByOffset) {
    store_.populate(25);

    auto page = store_.list_item_ids(20, 10);
    ASSERT_TRUE(page);
    ASSERT_EQ(page.value().size(), 5u);
    EXPECT_EQ(page.value().front(), "item-00021");

    auto past_end = store_.list_item_ids(25, 10);
    ASSERT_TRUE(past_end);
    EXPECT_TRUE(past_end.value().empty());
}

TEST_F(MemoryDataAccessorTest, ListsCriticalTierFirst) {
    store_.populate(2, "note", item_priority::background);
    store_.populate(2, "game");
    store_.populate(2, "team", item_priority::critical);

    auto ids = store_.list_item_ids(0, 10);
    ASSERT_TRUE(ids);
    std::vector<std::string> expected{"team-00001", "team-00002", "game-00001",
                                      "game-00002", "note-00001", "note-00002"};
    EXPECT_EQ(ids.value(), expected);

    auto tail = store_.list_item_ids(4, 10);
    ASSERT_TRUE(tail);
    ASSERT_EQ(tail.value().size(), 2u);
    EXPECT_EQ(tail.value().front(), "note-00001");
}

TEST_F(MemoryDataAccessorTest, UpsertMovesItemBetweenTiers) {
    store_.populate(3);

    auto record = store_.read_item("item-00003");
    ASSERT_TRUE(record);
    record.value().priority = item_priority::critical;
    ASSERT_TRUE(store_.upsert_item(record.value()));

    auto ids = store_.list_item_ids(0, 10);
    ASSERT_TRUE(ids);
    ASSERT_EQ(ids.value().size(), 3u);
    EXPECT_EQ(ids.value()[0], "item-00003");
    EXPECT_EQ(ids.value()[1], "item-00001");
    EXPECT_EQ(store_.size(), 3u);
}

TEST_F(MemoryDataAccessorTest, ReadMissingItem) {
    auto missing = store_.read_item("nope");

    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, error_code::item_not_found);
}

TEST_F(MemoryDataAccessorTest, UpsertIsIdempotent) {
    item_record record{"game-1", "{\"score\":3}", std::chrono::system_clock::now()};

    ASSERT_TRUE(store_.upsert_item(record));
    ASSERT_TRUE(store_.upsert_item(record));

    EXPECT_EQ(store_.size(), 1u);
    EXPECT_EQ(store_.write_count(), 2u);
}

TEST_F(MemoryDataAccessorTest, InjectedFailures) {
    store_.populate(2);
    store_.fail_reads_for("item-00001");
    store_.fail_writes_for("item-00002");

    auto read = store_.read_item("item-00001");
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, error_code::item_transfer_error);

    auto write = store_.upsert_item(store_.read_item("item-00002").value());
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, error_code::item_transfer_error);
}

TEST_F(MemoryDataAccessorTest, TemporarilyUnavailable) {
    store_.populate(1);
    store_.set_unavailable(2);

    EXPECT_EQ(store_.count().error().code, error_code::transport_unavailable);
    EXPECT_EQ(store_.count().error().code, error_code::transport_unavailable);
    EXPECT_TRUE(store_.count());
}

TEST_F(MemoryDataAccessorTest, Unreachable) {
    store_.set_unreachable(true);

    auto count = store_.count();
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code, error_code::fatal_transport_error);
}

TEST_F(MemoryDataAccessorTest, RejectAfterDropsNewItemsSilently) {
    store_.set_reject_after(1);

    EXPECT_TRUE(store_.upsert_item({"a", "1", {}}));
    EXPECT_TRUE(store_.upsert_item({"b", "2", {}}));

    EXPECT_EQ(store_.size(), 1u);
    EXPECT_TRUE(store_.contains("a"));
    EXPECT_FALSE(store_.contains("b"));
}

TEST_F(MemoryDataAccessorTest, CountNotSupported) {
    store_.set_count_supported(false);

    auto count = store_.count();
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code, error_code::not_supported);
}

TEST_F(MemoryDataAccessorTest, ContentHashCoversIdAndPayload) {
    item_record a{"a", "payload", {}};
    item_record b{"b", "payload", {}};
    item_record a2{"a", "payload", std::chrono::system_clock::now()};

    EXPECT_NE(a.content_hash(), b.content_hash());
    EXPECT_EQ(a.content_hash(), a2.content_hash());
}

// =============================================================================
// Active Source Pointer Tests
// =============================================================================

class ActiveSourcePointerTest : public ::testing::Test {
protected:
    void SetUp() override { get_logger().set_sink_enabled(false); }
    void TearDown() override { get_logger().set_sink_enabled(true); }

    flaky_key_value_store kv_;
};

TEST_F(ActiveSourcePointerTest, DefaultsWhenNothingStored) {
    active_source_pointer pointer(kv_, "local");

    EXPECT_EQ(pointer.get(), "local");
}

TEST_F(ActiveSourcePointerTest, SetPersists) {
    {
        active_source_pointer pointer(kv_, "local");
        ASSERT_TRUE(pointer.set("cloud"));
        EXPECT_EQ(pointer.get(), "cloud");
    }

    active_source_pointer reloaded(kv_, "local");
    EXPECT_EQ(reloaded.get(), "cloud");
}

TEST_F(ActiveSourcePointerTest, FailedWriteKeepsValue) {
    active_source_pointer pointer(kv_, "local");
    kv_.fail_writes = true;

    auto set = pointer.set("cloud");

    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().code, error_code::storage_write_error);
    EXPECT_EQ(pointer.get(), "local");
}

TEST_F(ActiveSourcePointerTest, UnreadableStoreFallsBackToDefault) {
    ASSERT_TRUE(kv_.inner.set(active_source_pointer::storage_key, "cloud"));
    kv_.fail_reads = true;

    active_source_pointer pointer(kv_, "local");

    EXPECT_EQ(pointer.get(), "local");
}

}  // namespace matchops::sync::test
