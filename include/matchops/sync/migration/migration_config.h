/**
 * @file migration_config.h
 * @brief Configuration for migration runs
 */

#ifndef MATCHOPS_SYNC_MIGRATION_MIGRATION_CONFIG_H
#define MATCHOPS_SYNC_MIGRATION_MIGRATION_CONFIG_H

#include <matchops/sync/core/types.h>
#include <matchops/sync/lock/resource_lock_manager.h>
#include <matchops/sync/migration/migration_types.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace matchops::sync {

/**
 * @brief Exponential backoff for transient transport failures
 */
struct retry_policy {
    uint32_t max_attempts = 3;                        ///< Attempts including the first
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before retry number @p attempt (1 = first retry)
     */
    [[nodiscard]] auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds {
        if (attempt == 0) {
            return std::chrono::milliseconds{0};
        }
        double scaled = static_cast<double>(initial_delay.count()) *
                        std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
        double capped = std::min(scaled, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds{static_cast<int64_t>(capped)};
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts == 0) {
            return unexpected(error(error_code::invalid_configuration,
                "retry max_attempts must be at least 1"));
        }
        if (initial_delay.count() < 0 || max_delay < initial_delay) {
            return unexpected(error(error_code::invalid_configuration,
                "retry delays must satisfy 0 <= initial_delay <= max_delay"));
        }
        if (backoff_multiplier < 1.0) {
            return unexpected(error(error_code::invalid_configuration,
                "backoff_multiplier must be >= 1.0"));
        }
        return {};
    }
};

/**
 * @brief When accumulated item errors abort a run
 *
 * Either limit may be disabled. The ratio is checked only once
 * min_items_for_ratio items have been processed.
 */
struct error_policy {
    std::optional<uint64_t> max_item_errors;
    std::optional<double> max_error_ratio{0.5};
    uint64_t min_items_for_ratio = 10;
    std::size_t max_recorded_errors = 3;

    [[nodiscard]] auto exceeded(uint64_t errors, uint64_t processed) const -> bool {
        if (max_item_errors && errors > *max_item_errors) {
            return true;
        }
        if (max_error_ratio && processed >= min_items_for_ratio && processed > 0) {
            double ratio = static_cast<double>(errors) / static_cast<double>(processed);
            return ratio > *max_error_ratio;
        }
        return false;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_error_ratio && (*max_error_ratio < 0.0 || *max_error_ratio > 1.0)) {
            return unexpected(error(error_code::invalid_configuration,
                "max_error_ratio must be within [0, 1]"));
        }
        return {};
    }
};

/**
 * @brief Configuration for migration_engine
 */
struct migration_config {
    std::size_t batch_size = 50;                         ///< Items per batch
    std::chrono::milliseconds lock_timeout{10000};       ///< Destination lock wait
    std::string destination_resource{resource_names::migration_destination};
    std::size_t verify_sample_size = 10;                 ///< Items hash-compared
    bool clear_destination_on_start = true;              ///< Fresh runs only
    std::chrono::milliseconds inter_batch_delay{0};      ///< Yield between batches
    migration_direction direction = migration_direction::local_to_cloud;
    retry_policy retry;
    error_policy errors;

    [[nodiscard]] auto validate() const -> result<void> {
        if (batch_size == 0) {
            return unexpected(error(error_code::invalid_configuration,
                "batch_size must be at least 1"));
        }
        if (lock_timeout.count() < 0 || inter_batch_delay.count() < 0) {
            return unexpected(error(error_code::invalid_configuration,
                "durations must not be negative"));
        }
        if (destination_resource.empty()) {
            return unexpected(error(error_code::invalid_configuration,
                "destination_resource must not be empty"));
        }
        if (auto r = retry.validate(); !r) {
            return r;
        }
        return errors.validate();
    }
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_MIGRATION_CONFIG_H
