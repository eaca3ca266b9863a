// bench/analyzer_bench.cpp
// Image analyzer benchmarks: single-image checks and parallel batches.

#include <benchmark/benchmark.h>
#include "bench_common.hpp"

using namespace onboard;
using namespace onboard_bench;

// --- blur_score ---

static void BM_BlurScore(benchmark::State& state) {
    const auto& scenario = IMAGE_SCENARIOS[state.range(0)];
    auto image = generate_image(scenario.width, scenario.height);
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            ImageAnalyzer::blur_score(image.grayscale.data(), scenario.width, scenario.height));
    }
    state.SetLabel(scenario.name);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(scenario.pixels()));
}
BENCHMARK(BM_BlurScore)->DenseRange(0, static_cast<int>(IMAGE_SCENARIO_COUNT) - 1);

// --- analyze ---

static void BM_Analyze(benchmark::State& state) {
    const auto& scenario = IMAGE_SCENARIOS[state.range(0)];
    auto image = generate_image(scenario.width, scenario.height);
    ImageAnalyzer analyzer;
    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.analyze(image));
    }
    state.SetLabel(scenario.name);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Analyze)->DenseRange(0, static_cast<int>(IMAGE_SCENARIO_COUNT) - 1);

// --- analyze_batch ---

static void BM_AnalyzeBatch(benchmark::State& state) {
    size_t parallel = static_cast<size_t>(state.range(0));
    std::vector<DecodedImage> batch;
    for (int i = 0; i < 16; i++) {
        batch.push_back(generate_image(1280, 720));
    }
    ImageAnalyzer analyzer;
    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.analyze_batch(batch, parallel));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(batch.size()));
}
BENCHMARK(BM_AnalyzeBatch)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

BENCHMARK_MAIN();
