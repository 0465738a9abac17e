/**
 * @file active_source_pointer.h
 * @brief Persisted name of the data store that downstream reads consult
 */

#ifndef MATCHOPS_SYNC_STORAGE_ACTIVE_SOURCE_POINTER_H
#define MATCHOPS_SYNC_STORAGE_ACTIVE_SOURCE_POINTER_H

#include <matchops/sync/core/types.h>
#include <matchops/sync/storage/key_value_store.h>

#include <mutex>
#include <string>

namespace matchops::sync {

/**
 * @brief The pointer flipped by a migration's switch phase
 *
 * Only the switch phase of a completed migration changes it, so a cancelled
 * or failed migration leaves readers on the original store.
 */
class active_source_pointer {
public:
    static constexpr const char* storage_key = "active_data_source";

    /**
     * @brief Load the persisted value, falling back to @p default_source
     */
    active_source_pointer(key_value_store& store, std::string default_source);

    [[nodiscard]] auto get() const -> std::string;

    /**
     * @brief Persist and publish a new active source
     *
     * The in-memory value changes only after the store accepted the write.
     */
    [[nodiscard]] auto set(const std::string& source) -> result<void>;

private:
    key_value_store& store_;
    mutable std::mutex mutex_;
    std::string current_;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_STORAGE_ACTIVE_SOURCE_POINTER_H
