/**
 * @file sync.h
 * @brief Main header for the matchops_sync library
 * @version 0.1.0
 *
 * Include this header to access the lock manager, checkpoint store, progress
 * estimator, migration engine and migration control.
 *
 * @code
 * #include <matchops/sync/sync.h>
 *
 * using namespace matchops::sync;
 *
 * resource_lock_manager locks;
 * auto saved = locks.with_lock(resource_names::roster, [&] {
 *     return roster.save();
 * });
 * @endcode
 */

#ifndef MATCHOPS_SYNC_SYNC_H
#define MATCHOPS_SYNC_SYNC_H

#include <cstdint>
#include <string>

// Core
#include "matchops/sync/core/types.h"
#include "matchops/sync/core/logging.h"
#include "matchops/sync/core/session_id.h"
#include "matchops/sync/core/checksum.h"

// Locking
#include "matchops/sync/lock/resource_lock_manager.h"

// Storage
#include "matchops/sync/storage/key_value_store.h"
#include "matchops/sync/storage/data_accessor.h"
#include "matchops/sync/storage/memory_data_accessor.h"
#include "matchops/sync/storage/active_source_pointer.h"

// Migration
#include "matchops/sync/migration/migration_types.h"
#include "matchops/sync/migration/migration_config.h"
#include "matchops/sync/migration/checkpoint_store.h"
#include "matchops/sync/migration/progress_estimator.h"
#include "matchops/sync/migration/migration_engine.h"
#include "matchops/sync/migration/migration_control.h"

// Adapters
#include "matchops/sync/adapters/thread_pool_adapter.h"

namespace matchops::sync {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_SYNC_H
