/**
 * @file progress_estimator.h
 * @brief Percentage, smoothed speed and ETA for a migration run
 *
 * This file defines the progress_estimator class which derives a
 * migration_progress snapshot from a checkpoint and a short history of
 * "items processed" samples.
 */

#ifndef MATCHOPS_SYNC_MIGRATION_PROGRESS_ESTIMATOR_H
#define MATCHOPS_SYNC_MIGRATION_PROGRESS_ESTIMATOR_H

#include <matchops/sync/core/types.h>
#include <matchops/sync/migration/migration_types.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace matchops::sync {

using clock_time_point = std::chrono::system_clock::time_point;

/**
 * @brief Items processed at a point in time
 */
struct progress_sample {
    uint64_t items_processed{0};
    clock_time_point at{};
};

/**
 * @brief Bounded history of progress samples
 *
 * Samples that go backwards in items or time are rejected, so the window is
 * always monotonic.
 */
class sample_window {
public:
    explicit sample_window(std::size_t capacity = 10);

    /**
     * @brief Append a sample, evicting the oldest when full
     * @return false if the sample was not monotonic and was dropped
     */
    auto add(const progress_sample& sample) -> bool;

    void clear() { samples_.clear(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return samples_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return samples_.empty(); }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto samples() const -> const std::deque<progress_sample>& {
        return samples_;
    }

private:
    std::size_t capacity_;
    std::deque<progress_sample> samples_;
};

/**
 * @brief Progress estimation for migration runs
 *
 * estimate() is a pure function and never throws or divides by zero:
 * - percentage is clamped to [0, 100] and is std::nullopt when the total is
 *   unknown
 * - the ETA is "unknown" with fewer than two samples or a speed below
 *   config::min_speed
 *
 * @code
 * progress_estimator estimator;
 * estimator.record(checkpoint.items_processed, std::chrono::system_clock::now());
 * auto progress = estimator.snapshot(checkpoint, std::chrono::system_clock::now());
 * // progress.estimated_time_remaining_text == "3m 05s"
 * @endcode
 */
class progress_estimator {
public:
    struct config {
        double smoothing_factor = 0.3;   ///< EWMA weight of the newest rate
        std::size_t window_size = 10;    ///< Samples retained
        double min_speed = 1e-6;         ///< Items/s treated as stalled

        [[nodiscard]] auto validate() const -> result<void> {
            if (smoothing_factor <= 0.0 || smoothing_factor > 1.0) {
                return unexpected(error(error_code::invalid_configuration,
                    "smoothing_factor must be within (0, 1]"));
            }
            if (window_size < 2) {
                return unexpected(error(error_code::invalid_configuration,
                    "window_size must be at least 2"));
            }
            if (min_speed < 0.0) {
                return unexpected(error(error_code::invalid_configuration,
                    "min_speed must not be negative"));
            }
            return {};
        }
    };

    progress_estimator();
    explicit progress_estimator(config cfg);

    progress_estimator(const progress_estimator&) = delete;
    auto operator=(const progress_estimator&) -> progress_estimator& = delete;

    /**
     * @brief Derive progress from a checkpoint and sample history
     */
    [[nodiscard]] static auto estimate(const migration_checkpoint& checkpoint,
                                       const sample_window& samples,
                                       clock_time_point now,
                                       const config& cfg) -> migration_progress;

    [[nodiscard]] static auto estimate(const migration_checkpoint& checkpoint,
                                       const sample_window& samples,
                                       clock_time_point now) -> migration_progress;

    /**
     * @brief EWMA of items/s across consecutive samples; 0 if fewer than two
     */
    [[nodiscard]] static auto smoothed_speed(const sample_window& samples,
                                             double smoothing_factor) -> double;

    void record(uint64_t items_processed, clock_time_point at);

    [[nodiscard]] auto snapshot(const migration_checkpoint& checkpoint,
                                clock_time_point now) const -> migration_progress;

    void reset();

    [[nodiscard]] auto sample_count() const -> std::size_t;

    [[nodiscard]] auto get_config() const -> const config& { return config_; }

private:
    config config_;
    mutable std::mutex mutex_;
    sample_window window_;
};

/**
 * @brief Render a duration as "45s", "3m 05s" or "2h 07m"
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds duration) -> std::string;

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_PROGRESS_ESTIMATOR_H
