/**
 * @file memory_data_accessor.h
 * @brief In-memory data_accessor with fault injection
 */

#ifndef MATCHOPS_SYNC_STORAGE_MEMORY_DATA_ACCESSOR_H
#define MATCHOPS_SYNC_STORAGE_MEMORY_DATA_ACCESSOR_H

#include <matchops/sync/storage/data_accessor.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace matchops::sync {

/**
 * @brief Ordered in-memory store
 *
 * Used as the on-device store in examples and as both ends of a migration in
 * tests. Faults can be injected per item or for the whole store.
 *
 * @code
 * memory_data_accessor remote("cloud");
 * remote.fail_writes_for("player-7");   // item_transfer_error for one item
 * remote.set_unavailable(2);            // next two calls: transport_unavailable
 * @endcode
 */
class memory_data_accessor : public data_accessor {
public:
    explicit memory_data_accessor(std::string name);

    // ========================================================================
    // data_accessor
    // ========================================================================

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto count() -> result<uint64_t> override;
    [[nodiscard]] auto list_item_ids(uint64_t offset, std::size_t limit)
        -> result<std::vector<std::string>> override;
    [[nodiscard]] auto read_item(const std::string& id) -> result<item_record> override;
    [[nodiscard]] auto upsert_item(const item_record& record) -> result<void> override;
    [[nodiscard]] auto clear() -> result<void> override;

    // ========================================================================
    // Direct access (no fault injection)
    // ========================================================================

    /**
     * @brief Insert or replace an item directly
     */
    void put(item_record record);

    /**
     * @brief Insert @p count items named "<prefix>-00001" ... with generated payloads
     */
    void populate(std::size_t count, const std::string& prefix = "item",
                  item_priority priority = item_priority::important);

    [[nodiscard]] auto contains(const std::string& id) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto items() const -> std::vector<item_record>;

    /**
     * @brief Number of upsert_item() calls that stored a record
     */
    [[nodiscard]] auto write_count() const -> uint64_t;

    // ========================================================================
    // Fault injection
    // ========================================================================

    void fail_reads_for(const std::string& id);
    void fail_writes_for(const std::string& id);

    /**
     * @brief Fail the next @p calls operations with transport_unavailable
     */
    void set_unavailable(uint32_t calls);

    /**
     * @brief Fail every operation with fatal_transport_error
     */
    void set_unreachable(bool unreachable);

    /**
     * @brief Acknowledge but discard writes once @p stored items are held
     *
     * Models a remote that silently loses data; std::nullopt disables it.
     */
    void set_reject_after(std::optional<std::size_t> stored);

    /**
     * @brief Make count() report not_supported
     */
    void set_count_supported(bool supported);

    /**
     * @brief Artificial latency added to every read and write
     */
    void set_latency(std::chrono::microseconds latency);

private:
    [[nodiscard]] auto check_transport() -> result<void>;
    void simulate_latency() const;
    void store(item_record record);

    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, item_record> items_;
    std::set<std::pair<item_priority, std::string>> order_;
    std::set<std::string> failing_reads_;
    std::set<std::string> failing_writes_;
    uint32_t unavailable_calls_{0};
    bool unreachable_{false};
    std::optional<std::size_t> reject_after_;
    bool count_supported_{true};
    std::chrono::microseconds latency_{0};
    uint64_t write_count_{0};
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_STORAGE_MEMORY_DATA_ACCESSOR_H
