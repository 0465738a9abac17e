/**
 * @file resource_lock_manager.cpp
 * @brief Implementation of the FIFO resource lock manager
 */

#include <matchops/sync/lock/resource_lock_manager.h>
#include <matchops/sync/core/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace matchops::sync {

namespace detail {

// ============================================================================
// lock_table
// ============================================================================

enum class request_status : uint8_t {
    pending,
    granted,
    timed_out,
    cancelled
};

/**
 * @brief One pending or granted acquisition
 */
struct lock_request {
    uint64_t token{0};
    std::string resource;
    std::chrono::steady_clock::time_point deadline;
    std::atomic<request_status> status{request_status::pending};
    std::condition_variable cv;

    /**
     * @brief The only way a request leaves pending
     */
    auto transition(request_status to) -> bool {
        auto expected = request_status::pending;
        return status.compare_exchange_strong(expected, to);
    }
};

/**
 * @brief Holder and waiters of one resource
 */
struct lock_entry {
    uint64_t holder{0};
    std::deque<std::shared_ptr<lock_request>> waiters;
};

/**
 * @brief Shared state behind resource_lock_manager and its handles
 */
class lock_table : public std::enable_shared_from_this<lock_table> {
public:
    auto enqueue(const std::string& resource, std::chrono::milliseconds timeout)
        -> std::shared_ptr<lock_request> {
        auto request = std::make_shared<lock_request>();
        request->resource = resource;
        request->deadline = std::chrono::steady_clock::now() +
                            std::max(timeout, std::chrono::milliseconds(0));

        std::size_t queued = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request->token = ++next_token_;

            auto& entry = entries_[resource];
            if (entry.holder == 0 && entry.waiters.empty()) {
                request->transition(request_status::granted);
                entry.holder = request->token;
                ++stats_.total_acquisitions;
            } else {
                entry.waiters.push_back(request);
                ++stats_.contention_count;
                queued = entry.waiters.size();
            }
        }

        if (queued == 0) {
            MS_LOG_TRACE(log_category::lock, "Lock granted immediately: " + resource);
        } else {
            MS_LOG_DEBUG(log_category::lock,
                "Lock contended: " + resource + " (queue size " +
                std::to_string(queued) + ")");
        }
        return request;
    }

    auto await(const std::shared_ptr<lock_request>& request) -> result<lock_handle> {
        std::unique_lock<std::mutex> lock(mutex_);

        request->cv.wait_until(lock, request->deadline, [&request] {
            return request->status.load() != request_status::pending;
        });

        if (request->transition(request_status::timed_out)) {
            remove_waiter(*request);
        }

        switch (request->status.load()) {
            case request_status::granted:
                return lock_handle(weak_from_this(), request->resource, request->token);
            case request_status::cancelled:
                ++stats_.timeout_count;
                return unexpected(error(error_code::lock_timeout,
                    "lock on '" + request->resource + "' was force released"));
            default:
                ++stats_.timeout_count;
                lock.unlock();
                MS_LOG_WARN(log_category::lock,
                    "Lock acquisition timed out: " + request->resource);
                return unexpected(error(error_code::lock_timeout,
                    "timed out waiting for lock on '" + request->resource + "'"));
        }
    }

    void release(const std::string& resource, uint64_t token) {
        bool stale = false;
        bool handed_over = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = entries_.find(resource);
            if (it == entries_.end() || it->second.holder != token) {
                stale = true;
            } else {
                it->second.holder = 0;
                ++stats_.total_releases;
                handed_over = grant_next(it);
            }
        }

        if (stale) {
            MS_LOG_TRACE(log_category::lock, "Ignoring stale release: " + resource);
        } else if (handed_over) {
            MS_LOG_TRACE(log_category::lock, "Lock handed over: " + resource);
        }
    }

    auto is_locked(const std::string& resource) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(resource);
        return it != entries_.end() && it->second.holder != 0;
    }

    auto queue_size(const std::string& resource) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(resource);
        return it == entries_.end() ? 0 : it->second.waiters.size();
    }

    auto stats() const -> lock_manager_stats {
        std::lock_guard<std::mutex> lock(mutex_);
        auto snapshot = stats_;
        snapshot.active_locks = 0;
        snapshot.waiting_requests = 0;
        for (const auto& [name, entry] : entries_) {
            if (entry.holder != 0) ++snapshot.active_locks;
            snapshot.waiting_requests += entry.waiters.size();
        }
        return snapshot;
    }

    /**
     * @param skip_if_idle Leave statistics and log untouched when nothing is held or queued
     */
    void force_release_all(bool skip_if_idle = false) {
        std::size_t woken = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (skip_if_idle && entries_.empty()) {
                return;
            }

            for (auto& [name, entry] : entries_) {
                for (auto& waiter : entry.waiters) {
                    if (waiter->transition(request_status::cancelled)) {
                        waiter->cv.notify_all();
                        ++woken;
                    }
                }
            }
            entries_.clear();
            ++stats_.force_release_count;
        }

        MS_LOG_WARN(log_category::lock,
            "All locks force released (" + std::to_string(woken) + " waiters woken)");
    }

private:
    using entry_iterator = std::unordered_map<std::string, lock_entry>::iterator;

    /**
     * @return Whether a waiter received the lock. Caller holds mutex_.
     */
    auto grant_next(entry_iterator it) -> bool {
        auto& entry = it->second;
        auto now = std::chrono::steady_clock::now();

        while (!entry.waiters.empty()) {
            auto next = entry.waiters.front();
            entry.waiters.pop_front();

            if (next->deadline <= now) {
                // Timeout wins at the boundary.
                if (next->transition(request_status::timed_out)) {
                    next->cv.notify_all();
                }
                continue;
            }

            if (next->transition(request_status::granted)) {
                entry.holder = next->token;
                ++stats_.total_acquisitions;
                next->cv.notify_all();
                return true;
            }
        }

        entries_.erase(it);
        return false;
    }

    // Caller holds mutex_.
    void remove_waiter(const lock_request& request) {
        auto it = entries_.find(request.resource);
        if (it == entries_.end()) {
            return;
        }

        auto& waiters = it->second.waiters;
        for (auto w = waiters.begin(); w != waiters.end(); ++w) {
            if ((*w)->token == request.token) {
                waiters.erase(w);
                break;
            }
        }

        if (it->second.holder == 0 && waiters.empty()) {
            entries_.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, lock_entry> entries_;
    uint64_t next_token_{0};
    lock_manager_stats stats_;
};

}  // namespace detail

// ============================================================================
// lock_handle
// ============================================================================

lock_handle::lock_handle(std::weak_ptr<detail::lock_table> table,
                         std::string resource,
                         uint64_t token)
    : table_(std::move(table))
    , resource_(std::move(resource))
    , token_(token) {
}

lock_handle::~lock_handle() {
    release();
}

lock_handle::lock_handle(lock_handle&& other) noexcept
    : table_(std::move(other.table_))
    , resource_(std::move(other.resource_))
    , token_(std::exchange(other.token_, 0)) {
}

auto lock_handle::operator=(lock_handle&& other) noexcept -> lock_handle& {
    if (this != &other) {
        release();
        table_ = std::move(other.table_);
        resource_ = std::move(other.resource_);
        token_ = std::exchange(other.token_, 0);
    }
    return *this;
}

void lock_handle::release() {
    if (token_ == 0) {
        return;
    }
    if (auto table = table_.lock()) {
        table->release(resource_, token_);
    }
    token_ = 0;
    table_.reset();
}

// ============================================================================
// resource_lock_manager
// ============================================================================

resource_lock_manager::resource_lock_manager()
    : resource_lock_manager(lock_manager_config{}) {
}

resource_lock_manager::resource_lock_manager(lock_manager_config config)
    : config_(std::move(config))
    , table_(std::make_shared<detail::lock_table>()) {
}

resource_lock_manager::~resource_lock_manager() {
    if (table_) {
        table_->force_release_all(true);
    }
}

auto resource_lock_manager::acquire(const std::string& resource,
                                    std::chrono::milliseconds timeout)
    -> result<lock_handle> {
    auto request = table_->enqueue(resource, timeout);
    return table_->await(request);
}

auto resource_lock_manager::acquire(const std::string& resource) -> result<lock_handle> {
    return acquire(resource, config_.default_timeout);
}

auto resource_lock_manager::acquire_async(const std::string& resource,
                                          std::chrono::milliseconds timeout)
    -> std::future<result<lock_handle>> {
    auto request = table_->enqueue(resource, timeout);
    return std::async(std::launch::async,
        [table = table_, request]() { return table->await(request); });
}

auto resource_lock_manager::is_locked(const std::string& resource) const -> bool {
    return table_->is_locked(resource);
}

auto resource_lock_manager::get_queue_size(const std::string& resource) const
    -> std::size_t {
    return table_->queue_size(resource);
}

auto resource_lock_manager::get_stats() const -> lock_manager_stats {
    return table_->stats();
}

void resource_lock_manager::force_release_all() {
    table_->force_release_all();
}

}  // namespace matchops::sync
