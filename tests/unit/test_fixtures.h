/**
 * @file test_fixtures.h
 * @brief Shared fixtures for migration unit tests
 */

#ifndef MATCHOPS_SYNC_TEST_FIXTURES_H
#define MATCHOPS_SYNC_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <matchops/sync/sync.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <string>

namespace matchops::sync::test {

/**
 * @brief Key-value store whose reads and writes can be made to fail
 */
class flaky_key_value_store : public key_value_store {
public:
    [[nodiscard]] auto get(const std::string& key)
        -> result<std::optional<std::string>> override {
        if (fail_reads.load()) {
            return unexpected(error(error_code::storage_read_error, "injected read failure"));
        }
        return inner.get(key);
    }

    [[nodiscard]] auto set(const std::string& key, const std::string& value)
        -> result<void> override {
        if (fail_writes.load()) {
            return unexpected(error(error_code::storage_write_error, "injected write failure"));
        }
        return inner.set(key, value);
    }

    [[nodiscard]] auto remove(const std::string& key) -> result<void> override {
        if (fail_writes.load()) {
            return unexpected(error(error_code::storage_write_error, "injected remove failure"));
        }
        return inner.remove(key);
    }

    memory_key_value_store inner;
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("matchops_sync_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief A local store, a cloud store and everything an engine needs
 */
class MigrationFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_sink_enabled(false);

        config_.batch_size = 10;
        config_.lock_timeout = std::chrono::milliseconds(500);
        config_.retry.initial_delay = std::chrono::milliseconds(1);
        config_.retry.max_delay = std::chrono::milliseconds(5);
    }

    void TearDown() override {
        get_logger().set_sink_enabled(true);
    }

    auto make_engine() -> std::unique_ptr<migration_engine> {
        return std::make_unique<migration_engine>(locks_, checkpoints_, local_, cloud_,
                                                  pointer_, config_);
    }

    flaky_key_value_store kv_;
    checkpoint_store checkpoints_{kv_};
    resource_lock_manager locks_;
    memory_data_accessor local_{"local"};
    memory_data_accessor cloud_{"cloud"};
    active_source_pointer pointer_{kv_, "local"};
    migration_config config_;
};

}  // namespace matchops::sync::test

#endif  // MATCHOPS_SYNC_TEST_FIXTURES_H
