/**
 * @file migration_control.h
 * @brief Pause, resume and cancel commands for a migration engine
 *
 * This file defines the migration_control class, the command surface used by
 * an application to steer a migration_engine. It also offers a pre-flight
 * estimate and a dry-run preview of the source store.
 */

#ifndef MATCHOPS_SYNC_MIGRATION_MIGRATION_CONTROL_H
#define MATCHOPS_SYNC_MIGRATION_MIGRATION_CONTROL_H

#include <matchops/sync/core/types.h>
#include <matchops/sync/migration/checkpoint_store.h>
#include <matchops/sync/migration/migration_engine.h>
#include <matchops/sync/migration/migration_types.h>
#include <matchops/sync/storage/data_accessor.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace matchops::sync {

/**
 * @brief Configuration for migration_control
 */
struct control_config {
    std::chrono::milliseconds rate_limit_window{60000};
    std::size_t max_operations_per_window = 10;   ///< Per command kind
    bool allow_pause = true;
    bool allow_resume = true;
    bool allow_cancel = true;

    [[nodiscard]] auto validate() const -> result<void> {
        if (rate_limit_window.count() <= 0) {
            return unexpected(error(error_code::invalid_configuration,
                "rate_limit_window must be positive"));
        }
        if (max_operations_per_window == 0) {
            return unexpected(error(error_code::invalid_configuration,
                "max_operations_per_window must be at least 1"));
        }
        return {};
    }
};

/**
 * @brief Details delivered with on_cancel
 */
struct cancellation_info {
    cancellation_reason reason{cancellation_reason::user_request};
    std::chrono::system_clock::time_point timestamp{};
    uint64_t items_processed{0};
    bool cleanup_completed{false};     ///< Checkpoint removed
    bool source_preserved{true};       ///< Active source pointer untouched
};

struct control_callbacks {
    std::function<void()> on_pause;
    std::function<void()> on_resume;
    std::function<void(const cancellation_info&)> on_cancel;
    std::function<void(const migration_progress&)> on_progress;
};

/**
 * @brief What the application may offer the user right now
 */
struct control_state {
    bool can_pause{false};
    bool can_cancel{false};
    bool can_resume{false};
    bool is_paused{false};
    bool is_cancelling{false};
    std::optional<migration_checkpoint> resume_data;
};

enum class estimate_confidence : uint8_t {
    low,
    medium,
    high
};

[[nodiscard]] constexpr auto to_string(estimate_confidence confidence) -> const char* {
    switch (confidence) {
        case estimate_confidence::low: return "low";
        case estimate_confidence::medium: return "medium";
        case estimate_confidence::high: return "high";
        default: return "unknown";
    }
}

/**
 * @brief Size and duration estimate derived from sampling the source
 */
struct migration_estimate {
    uint64_t item_count{0};
    uint64_t sampled_items{0};
    double average_item_bytes{0.0};
    uint64_t estimated_total_bytes{0};
    std::chrono::microseconds average_read_time{0};
    std::chrono::milliseconds estimated_duration{0};
    estimate_confidence confidence{estimate_confidence::low};
};

struct item_preview {
    std::string id;
    bool readable{false};
    std::size_t size_bytes{0};
};

/**
 * @brief Dry run over the first items of the source
 */
struct migration_preview {
    std::vector<item_preview> items;
    std::vector<std::string> warnings;
    bool can_proceed{false};
    bool estimated_success{false};
};

/**
 * @brief Command facade over migration_engine
 *
 * Commands are no-ops outside the states they apply to, so a user pressing
 * "pause" twice or "cancel" after completion does nothing. Each command kind
 * is limited to max_operations_per_window calls per rate_limit_window; the
 * call beyond that returns error_code::rate_limited.
 *
 * The control installs itself as the engine's phase listener.
 *
 * @code
 * migration_control control(engine, checkpoints, {
 *     .on_pause = [] { show_paused_banner(); },
 * });
 *
 * if (control.state().can_resume) {
 *     control.resume_migration();
 * }
 * @endcode
 */
class migration_control {
public:
    static constexpr std::size_t large_item_bytes = 1024 * 1024;

    /**
     * @brief Attach to an engine and pick up any stored checkpoint
     *
     * A stored checkpoint that is corrupted, unsupported or expired is
     * deleted.
     */
    migration_control(migration_engine& engine,
                      checkpoint_store& checkpoints,
                      control_callbacks callbacks = {},
                      control_config config = {});

    ~migration_control();

    migration_control(const migration_control&) = delete;
    auto operator=(const migration_control&) -> migration_control& = delete;

    [[nodiscard]] auto pause_migration() -> result<void>;

    [[nodiscard]] auto resume_migration() -> result<void>;

    [[nodiscard]] auto cancel_migration(
        cancellation_reason reason = cancellation_reason::user_request) -> result<void>;

    [[nodiscard]] auto state() const -> control_state;

    // ========================================================================
    // Pre-flight
    // ========================================================================

    /**
     * @brief Estimate size and duration by timing reads of sampled items
     * @param source Store to sample
     * @param sample_size Items to read; 0 picks a statistically sized sample
     */
    [[nodiscard]] auto estimate_migration(data_accessor& source,
                                          std::size_t sample_size = 0)
        -> result<migration_estimate>;

    /**
     * @brief Read the first @p max_items items and report problems
     */
    [[nodiscard]] auto preview_migration(data_accessor& source,
                                         std::size_t max_items = 10)
        -> result<migration_preview>;

    /**
     * @brief Sample size for 95% confidence and 5% margin, capped at 10%
     */
    [[nodiscard]] static auto optimal_sample_size(uint64_t total) -> uint64_t;

    [[nodiscard]] auto config() const -> const control_config& { return config_; }

private:
    auto allow_operation(const std::string& operation) -> bool;
    void on_phase_changed(migration_phase from, migration_phase to);
    void load_resume_data();

    migration_engine& engine_;
    checkpoint_store& checkpoints_;
    control_callbacks callbacks_;
    control_config config_;
    subscription_id progress_subscription_{0};

    struct operation_window {
        std::size_t count{0};
        std::chrono::steady_clock::time_point started{};
    };

    mutable std::mutex mutex_;
    std::map<std::string, operation_window> operations_;
    std::optional<migration_checkpoint> resume_data_;
    cancellation_reason pending_reason_{cancellation_reason::user_request};
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_MIGRATION_CONTROL_H
