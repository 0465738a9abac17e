/**
 * @file bench_progress_estimator.cpp
 * @brief Benchmarks for progress estimation on the publish path
 */

#include <benchmark/benchmark.h>

#include <matchops/sync/migration/progress_estimator.h>

#include "utils/benchmark_helpers.h"

#include <chrono>

namespace matchops::sync::benchmark {

/**
 * @brief estimate() with a full sample window of the given size
 */
static void BM_Progress_Estimate(::benchmark::State& state) {
    const auto window_size = static_cast<std::size_t>(state.range(0));

    auto cp = test_data_generator::make_checkpoint(5000, 20000, 3);
    auto start = cp.started_at;

    sample_window window(window_size);
    for (std::size_t i = 0; i < window_size; ++i) {
        window.add({i * 50, start + std::chrono::milliseconds(i * 500)});
    }
    auto now = start + std::chrono::milliseconds(window_size * 500);

    for (auto _ : state) {
        auto progress = progress_estimator::estimate(cp, window, now);
        ::benchmark::DoNotOptimize(progress);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief record() then snapshot(), as done once per batch
 */
static void BM_Progress_RecordAndSnapshot(::benchmark::State& state) {
    progress_estimator estimator;
    auto cp = test_data_generator::make_checkpoint(0, 1'000'000);
    auto at = cp.started_at;

    for (auto _ : state) {
        cp.items_processed += 50;
        at += std::chrono::milliseconds(250);
        estimator.record(cp.items_processed, at);
        auto progress = estimator.snapshot(cp, at);
        ::benchmark::DoNotOptimize(progress);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Progress_FormatDuration(::benchmark::State& state) {
    const auto duration = std::chrono::milliseconds(state.range(0));

    for (auto _ : state) {
        auto text = format_duration(duration);
        ::benchmark::DoNotOptimize(text);
    }
}

BENCHMARK(BM_Progress_Estimate)->RangeMultiplier(2)->Range(2, 64);
BENCHMARK(BM_Progress_RecordAndSnapshot);
BENCHMARK(BM_Progress_FormatDuration)->Arg(45'000)->Arg(185'000)->Arg(7'650'000);

}  // namespace matchops::sync::benchmark
