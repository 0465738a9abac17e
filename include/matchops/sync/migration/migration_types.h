/**
 * @file migration_types.h
 * @brief Phase, checkpoint and progress types shared by the migration modules
 */

#ifndef MATCHOPS_SYNC_MIGRATION_MIGRATION_TYPES_H
#define MATCHOPS_SYNC_MIGRATION_MIGRATION_TYPES_H

#include <matchops/sync/core/session_id.h>
#include <matchops/sync/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matchops::sync {

// ============================================================================
// Phase state machine
// ============================================================================

/**
 * @brief Phase of a migration run
 *
 * idle -> scanning -> transferring -> verifying -> switching -> completed,
 * with paused reachable from scanning, transferring and verifying, and
 * cancelled / failed reachable from every non-terminal phase except that
 * switching cannot be cancelled.
 */
enum class migration_phase : uint8_t {
    idle,
    scanning,
    transferring,
    verifying,
    switching,
    paused,
    completed,
    cancelled,
    failed
};

[[nodiscard]] constexpr auto to_string(migration_phase phase) -> const char* {
    switch (phase) {
        case migration_phase::idle: return "idle";
        case migration_phase::scanning: return "scanning";
        case migration_phase::transferring: return "transferring";
        case migration_phase::verifying: return "verifying";
        case migration_phase::switching: return "switching";
        case migration_phase::paused: return "paused";
        case migration_phase::completed: return "completed";
        case migration_phase::cancelled: return "cancelled";
        case migration_phase::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Parse a phase name; unknown names yield std::nullopt
 */
[[nodiscard]] inline auto parse_phase(std::string_view name)
    -> std::optional<migration_phase> {
    if (name == "idle") return migration_phase::idle;
    if (name == "scanning") return migration_phase::scanning;
    if (name == "transferring") return migration_phase::transferring;
    if (name == "verifying") return migration_phase::verifying;
    if (name == "switching") return migration_phase::switching;
    if (name == "paused") return migration_phase::paused;
    if (name == "completed") return migration_phase::completed;
    if (name == "cancelled") return migration_phase::cancelled;
    if (name == "failed") return migration_phase::failed;
    return std::nullopt;
}

[[nodiscard]] constexpr auto is_terminal(migration_phase phase) noexcept -> bool {
    return phase == migration_phase::completed ||
           phase == migration_phase::cancelled ||
           phase == migration_phase::failed;
}

/**
 * @brief Phases in which the batch loop is doing work
 */
[[nodiscard]] constexpr auto is_active(migration_phase phase) noexcept -> bool {
    return phase == migration_phase::scanning ||
           phase == migration_phase::transferring ||
           phase == migration_phase::verifying ||
           phase == migration_phase::switching;
}

/**
 * @brief Phases a checkpoint may record as the point to resume from
 */
[[nodiscard]] constexpr auto is_resumable(migration_phase phase) noexcept -> bool {
    return phase == migration_phase::scanning ||
           phase == migration_phase::transferring ||
           phase == migration_phase::verifying;
}

[[nodiscard]] constexpr auto is_valid_transition(
    migration_phase from,
    migration_phase to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }

    switch (from) {
        case migration_phase::idle:
            return to == migration_phase::scanning ||
                   to == migration_phase::cancelled ||
                   to == migration_phase::failed;
        case migration_phase::scanning:
            return to == migration_phase::transferring ||
                   to == migration_phase::paused ||
                   to == migration_phase::cancelled ||
                   to == migration_phase::failed;
        case migration_phase::transferring:
            return to == migration_phase::verifying ||
                   to == migration_phase::paused ||
                   to == migration_phase::cancelled ||
                   to == migration_phase::failed;
        case migration_phase::verifying:
            return to == migration_phase::switching ||
                   to == migration_phase::paused ||
                   to == migration_phase::cancelled ||
                   to == migration_phase::failed;
        case migration_phase::switching:
            return to == migration_phase::completed ||
                   to == migration_phase::failed;
        case migration_phase::paused:
            return is_resumable(to) ||
                   to == migration_phase::cancelled ||
                   to == migration_phase::failed;
        default:
            return false;
    }
}

// ============================================================================
// Direction and cancellation
// ============================================================================

enum class migration_direction : uint8_t {
    local_to_cloud,
    cloud_to_local
};

[[nodiscard]] constexpr auto to_string(migration_direction direction) -> const char* {
    switch (direction) {
        case migration_direction::local_to_cloud: return "local_to_cloud";
        case migration_direction::cloud_to_local: return "cloud_to_local";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_direction(std::string_view name)
    -> std::optional<migration_direction> {
    if (name == "local_to_cloud") return migration_direction::local_to_cloud;
    if (name == "cloud_to_local") return migration_direction::cloud_to_local;
    return std::nullopt;
}

enum class cancellation_reason : uint8_t {
    user_request,
    app_shutdown,
    error_recovery
};

[[nodiscard]] constexpr auto to_string(cancellation_reason reason) -> const char* {
    switch (reason) {
        case cancellation_reason::user_request: return "user_request";
        case cancellation_reason::app_shutdown: return "app_shutdown";
        case cancellation_reason::error_recovery: return "error_recovery";
        default: return "unknown";
    }
}

/**
 * @brief Pause and cancel requests observed by the batch loop
 *
 * Requests are only honoured at batch boundaries.
 */
class cancellation_token {
public:
    void request_pause() noexcept { pause_requested_.store(true); }
    void clear_pause() noexcept { pause_requested_.store(false); }

    void request_cancel(cancellation_reason reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancel_requested_.load()) {
            reason_ = reason;
        }
        cancel_requested_.store(true);
    }

    [[nodiscard]] auto pause_requested() const noexcept -> bool {
        return pause_requested_.load();
    }

    [[nodiscard]] auto cancel_requested() const noexcept -> bool {
        return cancel_requested_.load();
    }

    [[nodiscard]] auto reason() const -> cancellation_reason {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        pause_requested_.store(false);
        cancel_requested_.store(false);
        reason_ = cancellation_reason::user_request;
    }

private:
    std::atomic<bool> pause_requested_{false};
    std::atomic<bool> cancel_requested_{false};
    mutable std::mutex mutex_;
    cancellation_reason reason_{cancellation_reason::user_request};
};

// ============================================================================
// Checkpoint
// ============================================================================

/**
 * @brief When a run entered a phase
 */
struct phase_transition_record {
    migration_phase phase{migration_phase::idle};
    std::chrono::system_clock::time_point at{};
};

/**
 * @brief Durable progress of one migration run
 *
 * items_processed counts source items handled in ID order, successfully or
 * with a recorded item error. A resumed run continues at that offset.
 */
struct migration_checkpoint {
    session_id session;
    migration_direction direction{migration_direction::local_to_cloud};
    migration_phase phase{migration_phase::idle};   ///< Phase to resume in
    uint64_t items_processed{0};
    std::optional<uint64_t> total_items;            ///< Unknown when not countable
    uint64_t error_count{0};
    std::vector<std::string> errors;                ///< First recorded item errors
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point last_updated_at{};
    std::vector<phase_transition_record> phase_timestamps;
    std::optional<std::chrono::system_clock::time_point> paused_at;
    std::string last_item_id;
    std::optional<std::string> failure;             ///< Cause of a failed run
    std::string source_name;
    std::string destination_name;

    /**
     * @brief Count an item error, keeping its message while under @p max_recorded
     */
    void record_error(std::string message, std::size_t max_recorded) {
        ++error_count;
        if (errors.size() < max_recorded) {
            errors.push_back(std::move(message));
        }
    }
};

// ============================================================================
// Progress snapshot
// ============================================================================

/**
 * @brief Derived, never persisted view of a run's progress
 */
struct migration_progress {
    migration_phase phase{migration_phase::idle};
    uint64_t items_processed{0};
    std::optional<uint64_t> total_items;
    std::optional<double> percentage;               ///< nullopt while indeterminate
    double transfer_speed{0.0};                     ///< Smoothed items per second
    std::optional<std::chrono::milliseconds> estimated_remaining;
    std::string estimated_time_remaining_text{"unknown"};
    std::chrono::milliseconds elapsed{0};
    uint64_t error_count{0};
    std::vector<std::string> recent_errors;

    [[nodiscard]] auto is_indeterminate() const noexcept -> bool {
        return !percentage.has_value();
    }
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_MIGRATION_TYPES_H
