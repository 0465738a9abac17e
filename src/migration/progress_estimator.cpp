/**
 * @file progress_estimator.cpp
 * @brief Implementation of progress_estimator
 */

#include <matchops/sync/migration/progress_estimator.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace matchops::sync {

// ============================================================================
// sample_window
// ============================================================================

sample_window::sample_window(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 2)) {
}

auto sample_window::add(const progress_sample& sample) -> bool {
    if (!samples_.empty()) {
        const auto& last = samples_.back();
        if (sample.items_processed < last.items_processed || sample.at < last.at) {
            return false;
        }
        if (sample.at == last.at) {
            // Same instant: keep the newer count only.
            samples_.back().items_processed = sample.items_processed;
            return true;
        }
    }

    samples_.push_back(sample);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
    return true;
}

// ============================================================================
// progress_estimator
// ============================================================================

progress_estimator::progress_estimator()
    : progress_estimator(config{}) {
}

progress_estimator::progress_estimator(config cfg)
    : config_(std::move(cfg))
    , window_(config_.window_size) {
}

auto progress_estimator::smoothed_speed(const sample_window& samples,
                                        double smoothing_factor) -> double {
    const auto& history = samples.samples();
    if (history.size() < 2) {
        return 0.0;
    }

    double alpha = std::clamp(smoothing_factor, 0.0, 1.0);
    bool seeded = false;
    double ewma = 0.0;

    for (std::size_t i = 1; i < history.size(); ++i) {
        auto dt = std::chrono::duration<double>(history[i].at - history[i - 1].at).count();
        if (dt <= 0.0) {
            continue;
        }
        double rate = static_cast<double>(history[i].items_processed -
                                          history[i - 1].items_processed) / dt;
        if (!seeded) {
            ewma = rate;
            seeded = true;
        } else {
            ewma = alpha * rate + (1.0 - alpha) * ewma;
        }
    }

    return std::isfinite(ewma) && ewma > 0.0 ? ewma : 0.0;
}

auto progress_estimator::estimate(const migration_checkpoint& checkpoint,
                                  const sample_window& samples,
                                  clock_time_point now,
                                  const config& cfg) -> migration_progress {
    migration_progress progress;
    progress.phase = checkpoint.paused_at ? migration_phase::paused : checkpoint.phase;
    progress.items_processed = checkpoint.items_processed;
    progress.total_items = checkpoint.total_items;
    progress.error_count = checkpoint.error_count;
    progress.recent_errors = checkpoint.errors;

    if (checkpoint.started_at != clock_time_point{} && now > checkpoint.started_at) {
        progress.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - checkpoint.started_at);
    }

    bool completed = checkpoint.phase == migration_phase::completed;

    if (checkpoint.total_items) {
        uint64_t total = *checkpoint.total_items;
        double pct = total == 0
            ? 100.0
            : static_cast<double>(checkpoint.items_processed) /
                  static_cast<double>(total) * 100.0;
        progress.percentage = std::clamp(pct, 0.0, 100.0);
    } else if (completed) {
        progress.percentage = 100.0;
    }

    double speed = smoothed_speed(samples, cfg.smoothing_factor);
    progress.transfer_speed = speed;

    if (completed) {
        progress.estimated_remaining = std::chrono::milliseconds{0};
        progress.estimated_time_remaining_text = format_duration(std::chrono::milliseconds{0});
        return progress;
    }

    if (!checkpoint.total_items || samples.size() < 2 || speed <= cfg.min_speed) {
        progress.estimated_time_remaining_text = "unknown";
        return progress;
    }

    uint64_t total = *checkpoint.total_items;
    uint64_t remaining = total > checkpoint.items_processed
        ? total - checkpoint.items_processed
        : 0;
    double remaining_ms = static_cast<double>(remaining) * 1000.0 / speed;
    if (!std::isfinite(remaining_ms)) {
        progress.estimated_time_remaining_text = "unknown";
        return progress;
    }

    progress.estimated_remaining = std::chrono::milliseconds{
        static_cast<int64_t>(std::llround(remaining_ms))};
    progress.estimated_time_remaining_text = format_duration(*progress.estimated_remaining);
    return progress;
}

auto progress_estimator::estimate(const migration_checkpoint& checkpoint,
                                  const sample_window& samples,
                                  clock_time_point now) -> migration_progress {
    return estimate(checkpoint, samples, now, config{});
}

void progress_estimator::record(uint64_t items_processed, clock_time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.add({items_processed, at});
}

auto progress_estimator::snapshot(const migration_checkpoint& checkpoint,
                                  clock_time_point now) const -> migration_progress {
    std::lock_guard<std::mutex> lock(mutex_);
    return estimate(checkpoint, window_, now, config_);
}

void progress_estimator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
}

auto progress_estimator::sample_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

// ============================================================================
// format_duration
// ============================================================================

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    if (duration.count() <= 0) {
        return "0s";
    }

    int64_t total_seconds = (duration.count() + 500) / 1000;
    int64_t hours = total_seconds / 3600;
    int64_t minutes = (total_seconds % 3600) / 60;
    int64_t seconds = total_seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << 'm';
    } else if (minutes > 0) {
        oss << minutes << "m " << std::setw(2) << std::setfill('0') << seconds << 's';
    } else {
        oss << seconds << 's';
    }
    return oss.str();
}

}  // namespace matchops::sync
