/**
 * @file bench_checkpoint_store.cpp
 * @brief Benchmarks for checkpoint serialization and persistence
 */

#include <benchmark/benchmark.h>

#include <matchops/sync/migration/checkpoint_store.h>
#include <matchops/sync/storage/key_value_store.h>

#include "utils/benchmark_helpers.h"

namespace matchops::sync::benchmark {

static void BM_Checkpoint_Serialize(::benchmark::State& state) {
    auto cp = test_data_generator::make_checkpoint(
        4200, 10000, static_cast<std::size_t>(state.range(0)));

    int64_t bytes = 0;
    for (auto _ : state) {
        auto json = checkpoint_store::serialize(cp);
        bytes += static_cast<int64_t>(json.size());
        ::benchmark::DoNotOptimize(json);
    }

    state.SetBytesProcessed(bytes);
}

static void BM_Checkpoint_Deserialize(::benchmark::State& state) {
    auto json = checkpoint_store::serialize(test_data_generator::make_checkpoint(
        4200, 10000, static_cast<std::size_t>(state.range(0))));

    for (auto _ : state) {
        auto parsed = checkpoint_store::deserialize(json);
        if (!parsed) {
            state.SkipWithError("deserialize failed");
            return;
        }
        ::benchmark::DoNotOptimize(parsed.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(json.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief save() into the in-memory store, the per-batch cost with no disk
 */
static void BM_Checkpoint_SaveMemory(::benchmark::State& state) {
    memory_key_value_store kv;
    checkpoint_store store(kv);
    auto cp = test_data_generator::make_checkpoint(0, 100000);

    for (auto _ : state) {
        cp.items_processed += 50;
        if (!store.save(cp)) {
            state.SkipWithError("save failed");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief save() into the file store, including the atomic rename
 */
static void BM_Checkpoint_SaveFile(::benchmark::State& state) {
    temp_directory dir;
    file_key_value_store kv(dir.path());
    checkpoint_store store(kv);
    auto cp = test_data_generator::make_checkpoint(0, 100000);

    for (auto _ : state) {
        cp.items_processed += 50;
        if (!store.save(cp)) {
            state.SkipWithError("save failed");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Checkpoint_LoadFile(::benchmark::State& state) {
    temp_directory dir;
    file_key_value_store kv(dir.path());
    checkpoint_store store(kv);
    if (!store.save(test_data_generator::make_checkpoint(4200, 10000, 3))) {
        state.SkipWithError("save failed");
        return;
    }

    for (auto _ : state) {
        auto loaded = store.load();
        if (!loaded || !loaded.value()) {
            state.SkipWithError("load failed");
            return;
        }
        ::benchmark::DoNotOptimize(loaded.value());
    }
}

BENCHMARK(BM_Checkpoint_Serialize)->Arg(0)->Arg(3)->Arg(50);
BENCHMARK(BM_Checkpoint_Deserialize)->Arg(0)->Arg(3)->Arg(50);
BENCHMARK(BM_Checkpoint_SaveMemory);
BENCHMARK(BM_Checkpoint_SaveFile);
BENCHMARK(BM_Checkpoint_LoadFile);

}  // namespace matchops::sync::benchmark
