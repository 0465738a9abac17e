/**
 * @file bench_migration_throughput.cpp
 * @brief End-to-end migration throughput between in-memory stores
 */

#include <benchmark/benchmark.h>

#include <matchops/sync/sync.h>

#include "utils/benchmark_helpers.h"

namespace matchops::sync::benchmark {

namespace {

struct migration_bench_env {
    memory_key_value_store kv;
    checkpoint_store checkpoints{kv};
    resource_lock_manager locks;
    memory_data_accessor local{"local"};
    memory_data_accessor cloud{"cloud"};
    active_source_pointer pointer{kv, "local"};
};

}  // namespace

/**
 * @brief Full run: scan, transfer, verify, switch
 * @param range(0) Item count
 * @param range(1) Batch size
 */
static void BM_Migration_FullRun(::benchmark::State& state) {
    const auto item_count = static_cast<std::size_t>(state.range(0));
    const auto batch_size = static_cast<std::size_t>(state.range(1));

    get_logger().set_sink_enabled(false);

    migration_bench_env env;
    test_data_generator::populate(env.local, item_count, sizes::small_item, 42);

    uint64_t payload_bytes = 0;
    for (const auto& item : env.local.items()) {
        payload_bytes += item.payload.size();
    }

    for (auto _ : state) {
        state.PauseTiming();
        if (!env.pointer.set("local")) {
            state.SkipWithError("pointer reset failed");
            return;
        }
        migration_engine engine(env.locks, env.checkpoints, env.local, env.cloud,
                                env.pointer, benchmark_config(batch_size));
        state.ResumeTiming();

        auto outcome = engine.run();
        if (!outcome || !outcome.value().succeeded()) {
            state.SkipWithError("migration did not complete");
            return;
        }
    }

    get_logger().set_sink_enabled(true);

    state.SetItemsProcessed(static_cast<int64_t>(item_count) *
                            static_cast<int64_t>(state.iterations()));
    state.SetBytesProcessed(static_cast<int64_t>(payload_bytes) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(payload_bytes));
}

/**
 * @brief Cost of one pause plus resume in the middle of a run
 */
static void BM_Migration_PauseResume(::benchmark::State& state) {
    const auto item_count = static_cast<std::size_t>(state.range(0));

    get_logger().set_sink_enabled(false);

    migration_bench_env env;
    test_data_generator::populate(env.local, item_count, sizes::small_item, 7);

    for (auto _ : state) {
        state.PauseTiming();
        if (!env.pointer.set("local")) {
            state.SkipWithError("pointer reset failed");
            return;
        }
        migration_engine engine(env.locks, env.checkpoints, env.local, env.cloud,
                                env.pointer, benchmark_config(50));
        const uint64_t pause_at = item_count / 2 / 50 * 50;
        engine.subscribe([&](const migration_progress& p) {
            if (p.phase == migration_phase::transferring && p.items_processed == pause_at) {
                static_cast<void>(engine.request_pause());
            }
        });
        state.ResumeTiming();

        auto paused = engine.run();
        auto resumed = engine.run_from_checkpoint();
        if (!paused || !resumed || !resumed.value().succeeded()) {
            state.SkipWithError("pause/resume cycle did not complete");
            return;
        }
    }

    get_logger().set_sink_enabled(true);

    state.SetItemsProcessed(static_cast<int64_t>(item_count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Pre-flight estimate over a large source
 */
static void BM_Migration_Estimate(::benchmark::State& state) {
    const auto item_count = static_cast<std::size_t>(state.range(0));

    get_logger().set_sink_enabled(false);

    migration_bench_env env;
    test_data_generator::populate(env.local, item_count, sizes::medium_item, 11);
    migration_engine engine(env.locks, env.checkpoints, env.local, env.cloud, env.pointer);
    migration_control control(engine, env.checkpoints);

    for (auto _ : state) {
        auto estimate = control.estimate_migration(env.local);
        if (!estimate) {
            state.SkipWithError("estimate failed");
            return;
        }
        ::benchmark::DoNotOptimize(estimate.value());
    }

    get_logger().set_sink_enabled(true);
}

BENCHMARK(BM_Migration_FullRun)
    ->Args({1000, 10})
    ->Args({1000, 50})
    ->Args({1000, 200})
    ->Args({10000, 50})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Migration_PauseResume)
    ->Arg(1000)
    ->Arg(5000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Migration_Estimate)
    ->Arg(1000)
    ->Arg(20000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace matchops::sync::benchmark
