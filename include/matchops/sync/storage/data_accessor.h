/**
 * @file data_accessor.h
 * @brief Source and destination interface consumed by the migration engine
 */

#ifndef MATCHOPS_SYNC_STORAGE_DATA_ACCESSOR_H
#define MATCHOPS_SYNC_STORAGE_DATA_ACCESSOR_H

#include <matchops/sync/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace matchops::sync {

/**
 * @brief Transfer tier of a record; lower tiers are listed first
 */
enum class item_priority : uint8_t {
    critical = 0,    ///< Records others refer to (rosters, teams)
    important = 1,
    background = 2   ///< Derived or cosmetic data
};

/**
 * @brief One migratable record, keyed by a stable identifier
 */
struct item_record {
    std::string id;
    std::string payload;
    std::chrono::system_clock::time_point updated_at{};
    item_priority priority{item_priority::important};

    /**
     * @brief SHA-256 over id and payload
     *
     * updated_at and priority are excluded so that a copy compares equal to
     * its original.
     */
    [[nodiscard]] auto content_hash() const -> std::string;
};

/**
 * @brief Access to one data store (on-device or remote)
 *
 * Item identifiers are stable. list_item_ids() returns them grouped by
 * item_priority (critical first) and in ascending order within a tier, so
 * offset paging over an unchanged store is deterministic and referenced
 * records reach the destination before the records that refer to them.
 * upsert_item() must be idempotent per identifier.
 *
 * Errors reported by implementations:
 * - item_transfer_error / item_not_found: the single item failed
 * - transport_unavailable: transient, the caller may retry
 * - fatal_transport_error: the store cannot be used
 * - not_supported: from count() when the total is unknown
 */
class data_accessor {
public:
    virtual ~data_accessor() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto count() -> result<uint64_t> = 0;

    [[nodiscard]] virtual auto list_item_ids(uint64_t offset, std::size_t limit)
        -> result<std::vector<std::string>> = 0;

    [[nodiscard]] virtual auto read_item(const std::string& id) -> result<item_record> = 0;

    [[nodiscard]] virtual auto upsert_item(const item_record& record) -> result<void> = 0;

    /**
     * @brief Remove every item
     */
    [[nodiscard]] virtual auto clear() -> result<void> = 0;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_STORAGE_DATA_ACCESSOR_H
