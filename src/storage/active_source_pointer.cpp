/**
 * @file active_source_pointer.cpp
 * @brief Implementation of active_source_pointer
 */

#include <matchops/sync/storage/active_source_pointer.h>
#include <matchops/sync/core/logging.h>

namespace matchops::sync {

active_source_pointer::active_source_pointer(key_value_store& store,
                                             std::string default_source)
    : store_(store)
    , current_(std::move(default_source)) {
    auto stored = store_.get(storage_key);
    if (!stored) {
        MS_LOG_WARN(log_category::storage,
            "Failed to read active data source, using '" + current_ + "': " +
            stored.error().message);
        return;
    }
    if (stored.value() && !stored.value()->empty()) {
        current_ = *stored.value();
    }
}

auto active_source_pointer::get() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

auto active_source_pointer::set(const std::string& source) -> result<void> {
    std::string previous;
    result<void> stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stored = store_.set(storage_key, source);
        if (stored) {
            previous = current_;
            current_ = source;
        }
    }

    if (!stored) {
        MS_LOG_ERROR(log_category::storage,
            "Failed to persist active data source: " + stored.error().message);
        return stored;
    }

    MS_LOG_INFO(log_category::storage,
        "Active data source switched: " + previous + " -> " + source);
    return {};
}

}  // namespace matchops::sync
