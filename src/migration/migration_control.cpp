/**
 * @file migration_control.cpp
 * @brief Implementation of migration_control
 */

#include <matchops/sync/migration/migration_control.h>
#include <matchops/sync/core/logging.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace matchops::sync {

namespace {

template <typename Callback, typename... Args>
void notify(const Callback& callback, const char* name, Args&&... args) {
    if (!callback) {
        return;
    }
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        MS_LOG_WARN(log_category::control,
            std::string(name) + " callback threw: " + e.what());
    }
}

auto format_megabytes(std::size_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return oss.str();
}

}  // namespace

migration_control::migration_control(migration_engine& engine,
                                     checkpoint_store& checkpoints,
                                     control_callbacks callbacks,
                                     control_config config)
    : engine_(engine)
    , checkpoints_(checkpoints)
    , callbacks_(std::move(callbacks))
    , config_(std::move(config)) {
    load_resume_data();

    engine_.set_phase_listener([this](migration_phase from, migration_phase to) {
        on_phase_changed(from, to);
    });
    if (callbacks_.on_progress) {
        progress_subscription_ = engine_.subscribe([this](const migration_progress& p) {
            notify(callbacks_.on_progress, "on_progress", p);
        });
    }
}

migration_control::~migration_control() {
    engine_.set_phase_listener({});
    if (progress_subscription_ != 0) {
        engine_.unsubscribe(progress_subscription_);
    }
}

void migration_control::load_resume_data() {
    auto loaded = checkpoints_.load();
    if (loaded) {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_data_ = loaded.value();
        if (resume_data_) {
            MS_LOG_INFO(log_category::control,
                "Resumable migration found: " + resume_data_->session.to_string());
        }
        return;
    }

    switch (loaded.error().code) {
        case error_code::checkpoint_corrupted:
        case error_code::checkpoint_unsupported_phase:
        case error_code::checkpoint_expired:
            MS_LOG_WARN(log_category::control,
                "Discarding stored checkpoint: " + loaded.error().message);
            if (auto cleared = checkpoints_.clear(); !cleared) {
                MS_LOG_ERROR(log_category::control,
                    "Could not discard checkpoint: " + cleared.error().message);
            }
            break;
        default:
            MS_LOG_ERROR(log_category::control,
                "Could not read checkpoint: " + loaded.error().message);
            break;
    }
}

// ============================================================================
// Commands
// ============================================================================

auto migration_control::pause_migration() -> result<void> {
    if (!config_.allow_pause) {
        return unexpected(error(error_code::not_supported, "pause is disabled"));
    }

    auto phase = engine_.phase();
    if (!engine_.is_running() || phase == migration_phase::paused ||
        engine_.is_pause_pending() || !is_resumable(phase)) {
        MS_LOG_DEBUG(log_category::control,
            std::string("Pause ignored in phase ") + to_string(phase));
        return {};
    }

    if (!allow_operation("pause")) {
        return unexpected(error(error_code::rate_limited,
            "too many pause requests; try again later"));
    }

    if (auto requested = engine_.request_pause(); !requested) {
        MS_LOG_DEBUG(log_category::control, "Pause ignored: " + requested.error().message);
    }
    return {};
}

auto migration_control::resume_migration() -> result<void> {
    if (!config_.allow_resume) {
        return unexpected(error(error_code::not_supported, "resume is disabled"));
    }

    bool pause_pending = engine_.is_pause_pending();
    bool has_resume_data = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_resume_data = resume_data_.has_value();
    }

    if (engine_.is_running() && !pause_pending) {
        MS_LOG_DEBUG(log_category::control, "Resume ignored; migration is running");
        return {};
    }
    if (!pause_pending && !has_resume_data) {
        MS_LOG_DEBUG(log_category::control, "Resume ignored; nothing to resume");
        return {};
    }

    if (!allow_operation("resume")) {
        return unexpected(error(error_code::rate_limited,
            "too many resume requests; try again later"));
    }

    if (auto resumed = engine_.resume(); !resumed) {
        return resumed;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_data_.reset();
    }
    notify(callbacks_.on_resume, "on_resume");
    return {};
}

auto migration_control::cancel_migration(cancellation_reason reason) -> result<void> {
    if (!config_.allow_cancel) {
        return unexpected(error(error_code::not_supported, "cancel is disabled"));
    }

    auto phase = engine_.phase();
    bool has_resume_data = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_resume_data = resume_data_.has_value();
    }

    if (engine_.is_cancel_pending()) {
        return {};
    }
    bool engine_cancellable = (engine_.is_running() && !is_terminal(phase)) ||
                              phase == migration_phase::paused;
    if (!engine_cancellable && !has_resume_data) {
        MS_LOG_DEBUG(log_category::control,
            std::string("Cancel ignored in phase ") + to_string(phase));
        return {};
    }

    if (!allow_operation("cancel")) {
        return unexpected(error(error_code::rate_limited,
            "too many cancel requests; try again later"));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_reason_ = reason;
    }

    if (engine_cancellable) {
        if (auto requested = engine_.request_cancel(reason); requested) {
            return {};
        } else if (!has_resume_data) {
            MS_LOG_DEBUG(log_category::control,
                "Cancel ignored: " + requested.error().message);
            return {};
        }
    }

    // Only a stored checkpoint remains, left by an earlier process.
    cancellation_info info;
    info.reason = reason;
    info.timestamp = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info.items_processed = resume_data_ ? resume_data_->items_processed : 0;
    }

    auto cleared = checkpoints_.clear();
    info.cleanup_completed = cleared.has_value();
    if (!cleared) {
        MS_LOG_ERROR(log_category::control,
            "Could not remove checkpoint on cancel: " + cleared.error().message);
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_data_.reset();
    }

    MS_LOG_INFO(log_category::control,
        std::string("Stored migration cancelled (") + to_string(reason) + ")");
    notify(callbacks_.on_cancel, "on_cancel", info);
    return cleared;
}

auto migration_control::state() const -> control_state {
    control_state snapshot;

    auto phase = engine_.phase();
    bool running = engine_.is_running();
    bool pause_pending = engine_.is_pause_pending();

    snapshot.is_cancelling = engine_.is_cancel_pending();
    snapshot.is_paused = phase == migration_phase::paused || pause_pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.resume_data = resume_data_;
    }
    if (!running && !snapshot.resume_data && phase == migration_phase::paused) {
        snapshot.resume_data = engine_.checkpoint();
    }

    snapshot.can_pause = config_.allow_pause && running && is_resumable(phase) &&
                         !pause_pending && !snapshot.is_cancelling;
    snapshot.can_resume = config_.allow_resume &&
                          ((!running && snapshot.resume_data.has_value()) || pause_pending);
    snapshot.can_cancel = config_.allow_cancel && !snapshot.is_cancelling &&
                          ((running && phase != migration_phase::switching &&
                            !is_terminal(phase)) ||
                           snapshot.resume_data.has_value());
    return snapshot;
}

// ============================================================================
// Engine events
// ============================================================================

void migration_control::on_phase_changed(migration_phase from, migration_phase to) {
    MS_LOG_TRACE(log_category::control,
        std::string("Observed ") + to_string(from) + " -> " + to_string(to));

    switch (to) {
        case migration_phase::paused:
            {
                std::lock_guard<std::mutex> lock(mutex_);
                resume_data_ = engine_.checkpoint();
            }
            notify(callbacks_.on_pause, "on_pause");
            break;

        case migration_phase::failed:
            {
                std::lock_guard<std::mutex> lock(mutex_);
                resume_data_ = engine_.checkpoint();
            }
            break;

        case migration_phase::completed:
            {
                std::lock_guard<std::mutex> lock(mutex_);
                resume_data_.reset();
            }
            break;

        case migration_phase::cancelled: {
            cancellation_info info;
            info.timestamp = std::chrono::system_clock::now();
            if (auto cp = engine_.checkpoint()) {
                info.items_processed = cp->items_processed;
            }
            info.cleanup_completed = !checkpoints_.has_checkpoint();
            info.source_preserved = true;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                info.reason = pending_reason_;
                pending_reason_ = cancellation_reason::user_request;
                resume_data_.reset();
            }
            notify(callbacks_.on_cancel, "on_cancel", info);
            break;
        }

        default:
            break;
    }
}

auto migration_control::allow_operation(const std::string& operation) -> bool {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = operations_[operation];
    if (window.count == 0 || now - window.started > config_.rate_limit_window) {
        window.count = 0;
        window.started = now;
    }

    if (window.count >= config_.max_operations_per_window) {
        MS_LOG_WARN(log_category::control,
            "Rate limit exceeded for " + operation + " (" +
            std::to_string(window.count) + " in window)");
        return false;
    }

    ++window.count;
    return true;
}

// ============================================================================
// Pre-flight
// ============================================================================

auto migration_control::optimal_sample_size(uint64_t total) -> uint64_t {
    if (total <= 50) {
        return total;
    }

    constexpr double z = 1.96;
    constexpr double margin = 0.05;
    constexpr double proportion = 0.5;

    double base = std::ceil(z * z * proportion * (1.0 - proportion) / (margin * margin));
    double corrected = std::ceil(base / (1.0 + (base - 1.0) / static_cast<double>(total)));

    uint64_t min_sample = std::min<uint64_t>(20, total);
    uint64_t max_sample = std::min<uint64_t>(
        1000, static_cast<uint64_t>(std::ceil(static_cast<double>(total) * 0.1)));

    return std::max(min_sample, std::min(static_cast<uint64_t>(corrected), max_sample));
}

auto migration_control::estimate_migration(data_accessor& source, std::size_t sample_size)
    -> result<migration_estimate> {
    auto counted = source.count();
    if (!counted) {
        return unexpected(counted.error());
    }

    migration_estimate estimate;
    estimate.item_count = counted.value();
    if (estimate.item_count == 0) {
        estimate.confidence = estimate_confidence::high;
        return estimate;
    }

    uint64_t target = sample_size == 0
        ? optimal_sample_size(estimate.item_count)
        : std::min<uint64_t>(sample_size, estimate.item_count);

    uint64_t total_bytes = 0;
    std::chrono::microseconds total_read{0};
    auto sampling_started = std::chrono::steady_clock::now();

    for (uint64_t i = 0; i < target; ++i) {
        uint64_t offset = i * estimate.item_count / target;
        auto ids = source.list_item_ids(offset, 1);
        if (!ids) {
            return unexpected(ids.error());
        }
        if (ids.value().empty()) {
            continue;
        }

        auto started = std::chrono::steady_clock::now();
        auto record = source.read_item(ids.value().front());
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        if (!record) {
            continue;
        }

        ++estimate.sampled_items;
        total_bytes += record.value().id.size() + record.value().payload.size();
        total_read += elapsed;
    }

    auto sampling_time = std::chrono::steady_clock::now() - sampling_started;

    if (estimate.sampled_items > 0) {
        estimate.average_item_bytes =
            static_cast<double>(total_bytes) / static_cast<double>(estimate.sampled_items);
        estimate.estimated_total_bytes = static_cast<uint64_t>(
            estimate.average_item_bytes * static_cast<double>(estimate.item_count));
        estimate.average_read_time = total_read / static_cast<int64_t>(estimate.sampled_items);
        estimate.estimated_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            estimate.average_read_time * static_cast<int64_t>(estimate.item_count));
    }

    double ratio = static_cast<double>(estimate.sampled_items) /
                   static_cast<double>(estimate.item_count);
    if (sampling_time > std::chrono::seconds(5)) {
        estimate.confidence = estimate_confidence::low;
    } else if (ratio >= 0.1) {
        estimate.confidence = estimate_confidence::high;
    } else if (ratio >= 0.02) {
        estimate.confidence = estimate_confidence::medium;
    } else {
        estimate.confidence = estimate_confidence::low;
    }

    MS_LOG_INFO(log_category::control,
        "Migration estimate: " + std::to_string(estimate.item_count) + " items, " +
        std::to_string(estimate.estimated_total_bytes) + " bytes, confidence " +
        to_string(estimate.confidence));
    return estimate;
}

auto migration_control::preview_migration(data_accessor& source, std::size_t max_items)
    -> result<migration_preview> {
    migration_preview preview;

    auto ids = source.list_item_ids(0, max_items);
    if (!ids) {
        if (ids.error().code == error_code::fatal_transport_error ||
            ids.error().code == error_code::transport_unavailable) {
            preview.warnings.push_back("Source unreachable: " + ids.error().message);
            return preview;
        }
        return unexpected(ids.error());
    }

    for (const auto& id : ids.value()) {
        item_preview item;
        item.id = id;

        auto record = source.read_item(id);
        if (record) {
            item.readable = true;
            item.size_bytes = record.value().payload.size();
            if (item.size_bytes > large_item_bytes) {
                preview.warnings.push_back("Large item detected: " + id + " (" +
                                           format_megabytes(item.size_bytes) + ")");
            }
        } else {
            preview.warnings.push_back("Cannot access item: " + id);
        }
        preview.items.push_back(std::move(item));
    }

    if (engine_.is_running()) {
        preview.warnings.push_back("A migration is already running");
    }

    preview.can_proceed = !engine_.is_running();
    preview.estimated_success = preview.warnings.empty() &&
        std::all_of(preview.items.begin(), preview.items.end(),
                    [](const item_preview& item) { return item.readable; });
    return preview;
}

}  // namespace matchops::sync
