/**
 * @file bench_lock_contention.cpp
 * @brief Benchmarks for resource_lock_manager under varying contention
 */

#include <benchmark/benchmark.h>

#include <matchops/sync/lock/resource_lock_manager.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <string>

namespace matchops::sync::benchmark {

using namespace std::chrono_literals;

/**
 * @brief Acquire and release with no other holder
 */
static void BM_Lock_Uncontended(::benchmark::State& state) {
    resource_lock_manager locks;

    for (auto _ : state) {
        auto handle = locks.acquire("roster", 1000ms);
        if (!handle) {
            state.SkipWithError("acquire failed");
            return;
        }
        ::benchmark::DoNotOptimize(handle.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief with_lock around a trivial operation
 */
static void BM_Lock_WithLock(::benchmark::State& state) {
    resource_lock_manager locks;
    int64_t counter = 0;

    for (auto _ : state) {
        auto result = locks.with_lock("roster", [&] { return ++counter; });
        ::benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief All threads queue on one resource
 */
static void BM_Lock_SharedResource(::benchmark::State& state) {
    static resource_lock_manager locks;
    int64_t work = 0;

    for (auto _ : state) {
        auto result = locks.with_lock("saved_games", [&] {
            ::benchmark::DoNotOptimize(++work);
        });
        if (!result) {
            state.SkipWithError("with_lock timed out");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Each thread uses its own resource
 */
static void BM_Lock_IndependentResources(::benchmark::State& state) {
    static resource_lock_manager locks;
    const auto resource = "resource_" + std::to_string(state.thread_index());

    for (auto _ : state) {
        auto handle = locks.acquire(resource, 1000ms);
        ::benchmark::DoNotOptimize(handle);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Queue depth inspection while the resource is held
 */
static void BM_Lock_IsLocked(::benchmark::State& state) {
    resource_lock_manager locks;
    auto held = locks.acquire("settings", 1000ms);

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(locks.is_locked("settings"));
        ::benchmark::DoNotOptimize(locks.get_queue_size("settings"));
    }
}

BENCHMARK(BM_Lock_Uncontended);
BENCHMARK(BM_Lock_WithLock);
BENCHMARK(BM_Lock_SharedResource)->ThreadRange(1, 8)->UseRealTime();
BENCHMARK(BM_Lock_IndependentResources)->ThreadRange(1, 8)->UseRealTime();
BENCHMARK(BM_Lock_IsLocked);

}  // namespace matchops::sync::benchmark
