// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapters for background migrations
 */

#include <matchops/sync/adapters/thread_pool_adapter.h>

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace matchops::sync::adapters {

// ============================================================================
// thread_system_task_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Run @p task and settle @p promise with its outcome
 */
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_task_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> in_flight = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_task_pool::thread_system_task_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_task_pool::~thread_system_task_pool() {
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

std::shared_ptr<thread_system_task_pool>
thread_system_task_pool::create_default(size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_task_pool>(std::move(pool), worker_count);
}

std::future<void> thread_system_task_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto in_flight = pimpl_->in_flight;
    in_flight->fetch_add(1, std::memory_order_relaxed);

    auto wrapped = [task = std::move(task), promise, in_flight]() {
        run_into(task, *promise);
        in_flight->fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), "migration_task"));
    return future;
}

size_t thread_system_task_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_task_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_task_pool::pending_tasks() const {
    return pimpl_->in_flight->load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_task_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_task_pool
// ============================================================================

struct async_task_pool::impl {
    std::atomic<size_t> active_tasks{0};
};

async_task_pool::async_task_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto state = pimpl_;
    return std::async(std::launch::async,
                      [state, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

size_t async_task_pool::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

bool async_task_pool::is_running() const { return true; }

size_t async_task_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// task_pool_factory
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_task_pool::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_task_pool>();
#endif
}

}  // namespace matchops::sync::adapters
