/**
 * @file checkpoint_store.h
 * @brief Durable persistence of migration checkpoints
 *
 * This file defines the checkpoint_store class which saves a
 * migration_checkpoint to a key_value_store so an interrupted migration can
 * resume after a restart. Records are JSON with a format version and a
 * SHA-256 checksum over the body.
 */

#ifndef MATCHOPS_SYNC_MIGRATION_CHECKPOINT_STORE_H
#define MATCHOPS_SYNC_MIGRATION_CHECKPOINT_STORE_H

#include <matchops/sync/core/types.h>
#include <matchops/sync/migration/migration_types.h>
#include <matchops/sync/storage/key_value_store.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace matchops::sync {

/**
 * @brief Configuration for checkpoint_store
 */
struct checkpoint_store_config {
    std::string storage_key{"matchops_migration_progress"};
    std::chrono::seconds state_ttl{std::chrono::hours(24)};  ///< 0 disables expiry

    [[nodiscard]] auto validate() const -> result<void> {
        if (storage_key.empty()) {
            return unexpected(error(error_code::invalid_configuration,
                "checkpoint storage_key must not be empty"));
        }
        if (state_ttl.count() < 0) {
            return unexpected(error(error_code::invalid_configuration,
                "checkpoint state_ttl must not be negative"));
        }
        return {};
    }
};

/**
 * @brief Saves and restores the single active migration checkpoint
 *
 * load() reports, without throwing:
 * - checkpoint_corrupted: unparsable record or checksum mismatch
 * - checkpoint_unsupported_phase: a phase this build cannot resume from
 * - checkpoint_expired: last update older than state_ttl
 * - checkpoint_read_error: the underlying store failed
 *
 * @code
 * memory_key_value_store kv;
 * checkpoint_store store(kv);
 *
 * store.save(checkpoint);
 * auto loaded = store.load();
 * if (loaded && loaded.value()) {
 *     // resume from loaded.value()->items_processed
 * }
 * @endcode
 */
class checkpoint_store {
public:
    static constexpr int format_version = 1;

    explicit checkpoint_store(key_value_store& store,
                              checkpoint_store_config config = {});

    checkpoint_store(const checkpoint_store&) = delete;
    auto operator=(const checkpoint_store&) -> checkpoint_store& = delete;

    /**
     * @brief Persist a checkpoint, replacing the previous one
     * @return Success or checkpoint_write_error
     */
    [[nodiscard]] auto save(const migration_checkpoint& checkpoint) -> result<void>;

    /**
     * @brief Load the stored checkpoint
     * @return std::nullopt when none is stored
     */
    [[nodiscard]] auto load() -> result<std::optional<migration_checkpoint>>;

    [[nodiscard]] auto clear() -> result<void>;

    /**
     * @brief Whether a record exists, valid or not
     */
    [[nodiscard]] auto has_checkpoint() -> bool;

    [[nodiscard]] auto config() const -> const checkpoint_store_config& { return config_; }

    // ========================================================================
    // Format
    // ========================================================================

    [[nodiscard]] static auto serialize(const migration_checkpoint& checkpoint)
        -> std::string;

    /**
     * @brief Parse and verify a record; expiry is not checked here
     */
    [[nodiscard]] static auto deserialize(const std::string& json)
        -> result<migration_checkpoint>;

private:
    key_value_store& store_;
    checkpoint_store_config config_;
    std::mutex mutex_;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_CHECKPOINT_STORE_H
