// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction that runs background migrations
 *
 * The migration engine drives its batch loop on a single worker obtained
 * from this interface. thread_system's thread_pool is used when the build
 * enables it; otherwise tasks run on std::async.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace matchops::sync::adapters {

/**
 * @brief Interface for submitting background work
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that completes with the task, carrying any exception it threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief task_pool_interface backed by thread_system::thread_pool
 */
class thread_system_task_pool : public task_pool_interface {
public:
    explicit thread_system_task_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        size_t worker_count = 0);

    ~thread_system_task_pool() override;

    thread_system_task_pool(const thread_system_task_pool&) = delete;
    thread_system_task_pool& operator=(const thread_system_task_pool&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name used by thread_system for diagnostics
     */
    [[nodiscard]] static std::shared_ptr<thread_system_task_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "matchops_sync_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread; there is no queue.
 */
class async_task_pool : public task_pool_interface {
public:
    async_task_pool();
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when available, std::async otherwise
 */
class task_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "matchops_sync_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace matchops::sync::adapters
