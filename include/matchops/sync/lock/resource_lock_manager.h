/**
 * @file resource_lock_manager.h
 * @brief FIFO mutual exclusion over named logical resources
 *
 * This file defines the resource_lock_manager class which serialises access
 * to named resources (e.g. "roster") between the migration engine and
 * ordinary write operations. Each resource has at most one holder and an
 * ordered queue of waiters; grants are issued strictly in arrival order and
 * every waiter carries its own deadline.
 */

#ifndef MATCHOPS_SYNC_LOCK_RESOURCE_LOCK_MANAGER_H
#define MATCHOPS_SYNC_LOCK_RESOURCE_LOCK_MANAGER_H

#include <matchops/sync/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace matchops::sync {

// ============================================================================
// Configuration and statistics
// ============================================================================

/**
 * @brief Configuration for resource_lock_manager
 */
struct lock_manager_config {
    /// Timeout used by the acquire/with_lock overloads without an explicit one
    std::chrono::milliseconds default_timeout{10000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (default_timeout.count() < 0) {
            return unexpected(error(error_code::invalid_configuration,
                "default_timeout must not be negative"));
        }
        return {};
    }
};

/**
 * @brief Counters for lock manager diagnostics
 */
struct lock_manager_stats {
    std::size_t active_locks{0};        ///< Resources currently held
    std::size_t waiting_requests{0};    ///< Requests queued across all resources
    std::size_t total_acquisitions{0};  ///< Grants issued
    std::size_t total_releases{0};      ///< Releases of a current holder
    std::size_t timeout_count{0};       ///< Requests that failed with lock_timeout
    std::size_t force_release_count{0}; ///< force_release_all() invocations
    std::size_t contention_count{0};    ///< Requests that had to queue
};

/**
 * @brief Well-known resource names shared by callers of the lock manager
 */
struct resource_names {
    static constexpr std::string_view roster = "roster";
    static constexpr std::string_view saved_games = "saved_games";
    static constexpr std::string_view seasons = "seasons";
    static constexpr std::string_view tournaments = "tournaments";
    static constexpr std::string_view settings = "settings";
    static constexpr std::string_view migration_destination = "migration.destination";
    static constexpr std::string_view active_data_source = "active_data_source";
};

namespace detail {
class lock_table;

template <typename T>
struct is_result : std::false_type {};

template <typename T>
struct is_result<result<T>> : std::true_type {};

template <typename F, typename R = std::invoke_result_t<F>>
using with_lock_result_t = std::conditional_t<is_result<R>::value, R, result<R>>;
}  // namespace detail

// ============================================================================
// lock_handle
// ============================================================================

/**
 * @brief Ownership of one granted lock
 *
 * Move-only. The lock is released by release() or by the destructor,
 * whichever comes first. A handle that outlives force_release_all() or its
 * manager releases nothing.
 */
class lock_handle {
public:
    lock_handle() noexcept = default;
    ~lock_handle();

    lock_handle(const lock_handle&) = delete;
    auto operator=(const lock_handle&) -> lock_handle& = delete;
    lock_handle(lock_handle&& other) noexcept;
    auto operator=(lock_handle&& other) noexcept -> lock_handle&;

    /**
     * @brief Release the lock now; later calls do nothing
     */
    void release();

    [[nodiscard]] auto resource() const -> const std::string& { return resource_; }

    /**
     * @brief Whether this handle still refers to a grant it has not released
     */
    [[nodiscard]] auto owns_lock() const noexcept -> bool { return token_ != 0; }

private:
    friend class detail::lock_table;

    lock_handle(std::weak_ptr<detail::lock_table> table,
                std::string resource,
                uint64_t token);

    std::weak_ptr<detail::lock_table> table_;
    std::string resource_;
    uint64_t token_{0};
};

// ============================================================================
// resource_lock_manager
// ============================================================================

/**
 * @brief Per-resource FIFO lock manager with timed acquisition
 *
 * Explicitly constructed and shared by reference between the callers that
 * must exclude each other; different managers never interact.
 *
 * A request is in exactly one of the states pending, granted, timed_out or
 * cancelled. Leaving pending is a single compare-exchange, so a grant and a
 * timeout can never both apply. A request whose deadline has already passed
 * is never granted.
 *
 * @code
 * resource_lock_manager locks;
 *
 * auto handle = locks.acquire("roster", std::chrono::seconds(10));
 * if (!handle) {
 *     // error_code::lock_timeout
 * }
 *
 * auto saved = locks.with_lock("roster", [&] { return save_roster(); });
 * @endcode
 */
class resource_lock_manager {
public:
    resource_lock_manager();
    explicit resource_lock_manager(lock_manager_config config);

    /**
     * @brief Destructor; wakes every waiter with lock_timeout
     */
    ~resource_lock_manager();

    resource_lock_manager(const resource_lock_manager&) = delete;
    auto operator=(const resource_lock_manager&) -> resource_lock_manager& = delete;
    resource_lock_manager(resource_lock_manager&&) = delete;
    auto operator=(resource_lock_manager&&) -> resource_lock_manager& = delete;

    // ========================================================================
    // Acquisition
    // ========================================================================

    /**
     * @brief Block until the resource is granted or the timeout elapses
     * @param resource Resource name
     * @param timeout Maximum time to wait in the queue
     * @return Handle owning the lock, or error_code::lock_timeout
     */
    [[nodiscard]] auto acquire(const std::string& resource,
                               std::chrono::milliseconds timeout)
        -> result<lock_handle>;

    /**
     * @brief acquire() with the configured default timeout
     */
    [[nodiscard]] auto acquire(const std::string& resource) -> result<lock_handle>;

    /**
     * @brief Queue a request now and wait for the grant on another thread
     *
     * The queue position is taken before this call returns, so requests
     * issued in order A, B, C are granted in that order.
     */
    [[nodiscard]] auto acquire_async(const std::string& resource,
                                     std::chrono::milliseconds timeout)
        -> std::future<result<lock_handle>>;

    /**
     * @brief Run an operation while holding the resource
     *
     * The lock is released on every exit path, including exceptions thrown
     * by the operation, which propagate to the caller afterwards.
     *
     * @return The operation's result, or lock_timeout if it never ran.
     *         An operation returning result<T> is passed through unchanged.
     */
    template <typename F>
    auto with_lock(const std::string& resource,
                   F&& operation,
                   std::chrono::milliseconds timeout) -> detail::with_lock_result_t<F> {
        using return_type = std::invoke_result_t<F>;

        auto handle = acquire(resource, timeout);
        if (!handle) {
            return unexpected(handle.error());
        }

        if constexpr (std::is_void_v<return_type>) {
            std::invoke(std::forward<F>(operation));
            return {};
        } else {
            return std::invoke(std::forward<F>(operation));
        }
    }

    template <typename F>
    auto with_lock(const std::string& resource, F&& operation)
        -> detail::with_lock_result_t<F> {
        return with_lock(resource, std::forward<F>(operation), config_.default_timeout);
    }

    // ========================================================================
    // Introspection
    // ========================================================================

    [[nodiscard]] auto is_locked(const std::string& resource) const -> bool;

    /**
     * @brief Number of requests waiting behind the current holder
     */
    [[nodiscard]] auto get_queue_size(const std::string& resource) const -> std::size_t;

    [[nodiscard]] auto get_stats() const -> lock_manager_stats;

    [[nodiscard]] auto config() const -> const lock_manager_config& { return config_; }

    // ========================================================================
    // Recovery
    // ========================================================================

    /**
     * @brief Drop every holder and queued request
     *
     * Waiters fail with lock_timeout. Handles granted before the call become
     * inert. For recovery and test code only: a former holder may still be
     * running while a new caller acquires the same resource.
     */
    void force_release_all();

private:
    lock_manager_config config_;
    std::shared_ptr<detail::lock_table> table_;
};

/**
 * @brief Run an operation under the roster lock
 */
template <typename F>
auto with_roster_lock(resource_lock_manager& manager, F&& operation)
    -> detail::with_lock_result_t<F> {
    return manager.with_lock(std::string(resource_names::roster),
                             std::forward<F>(operation));
}

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_LOCK_RESOURCE_LOCK_MANAGER_H
