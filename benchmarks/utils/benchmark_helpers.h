/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef MATCHOPS_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
#define MATCHOPS_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H

#include <matchops/sync/sync.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>

namespace matchops::sync::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate a JSON-like payload of roughly @p size bytes
     * @param size Approximate size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_payload(std::size_t size, uint32_t seed = 0) -> std::string;

    /**
     * @brief Fill @p store with @p count items named "item-00001" ...
     * @param payload_size Approximate payload size per item
     * @param seed Random seed (0 for random)
     */
    static void populate(memory_data_accessor& store,
                         std::size_t count,
                         std::size_t payload_size,
                         uint32_t seed = 0);

    /**
     * @brief A checkpoint in the transferring phase with @p errors recorded messages
     */
    static auto make_checkpoint(uint64_t items_processed,
                                uint64_t total_items,
                                std::size_t errors = 0) -> migration_checkpoint;
};

/**
 * @brief Temporary directory removed on destruction
 */
class temp_directory {
public:
    explicit temp_directory(const std::string& prefix = "matchops_sync_benchmarks");
    ~temp_directory();

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_item = 256;         // Roster entry
constexpr std::size_t medium_item = 4 * KB;     // Saved game
constexpr std::size_t large_item = 64 * KB;     // Saved game with event log
}  // namespace sizes

/**
 * @brief Engine configuration with retries and delays suited to in-memory stores
 */
auto benchmark_config(std::size_t batch_size) -> migration_config;

}  // namespace matchops::sync::benchmark

#endif  // MATCHOPS_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
