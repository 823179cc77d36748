#include "metrics/metrics_aggregator.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <random>
#include <thread>

using namespace surge;

// Concurrent record() from worker threads sharing one aggregator
static void BM_Record_Contention(benchmark::State &state) {
  static MetricsAggregator metrics{100'000};

  auto outcome = Outcome::ok(std::chrono::microseconds{250}, 200);
  outcome.workload = "bench";
  for (auto _ : state) {
    benchmark::DoNotOptimize(metrics.record(outcome, Phase::Measuring));
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Record_Contention)
    ->ThreadRange(1, std::thread::hardware_concurrency());

// Outcomes with custom metrics and failures mixed in
static void BM_Record_Mixed(benchmark::State &state) {
  MetricsAggregator metrics{100'000, 7};
  metrics.start();
  std::mt19937_64 rng{42};
  std::uniform_int_distribution<int> latency_us(100, 5000);

  for (auto _ : state) {
    state.PauseTiming();
    auto outcome =
        (rng() % 10 == 0)
            ? Outcome::failure("server_error: bench",
                               std::chrono::microseconds{latency_us(rng)}, 500)
            : Outcome::ok(std::chrono::microseconds{latency_us(rng)}, 200);
    outcome.custom = {{"bytes", 512.0}};
    state.ResumeTiming();
    benchmark::DoNotOptimize(metrics.record(outcome, Phase::Measuring));
  }
}

BENCHMARK(BM_Record_Mixed);

// Snapshot cost grows with the retained sample count (sort for percentiles)
static void BM_GetStatistics(benchmark::State &state) {
  const auto samples = static_cast<std::size_t>(state.range(0));
  MetricsAggregator metrics{samples, 7};
  metrics.start();
  std::mt19937_64 rng{42};
  std::uniform_int_distribution<int> latency_us(100, 5000);
  for (std::size_t i = 0; i < samples; ++i) {
    (void)metrics.record(
        Outcome::ok(std::chrono::microseconds{latency_us(rng)}, 200),
        Phase::Measuring);
  }

  for (auto _ : state) {
    auto snapshot = metrics.get_statistics();
    benchmark::DoNotOptimize(snapshot);
  }
}

BENCHMARK(BM_GetStatistics)->RangeMultiplier(10)->Range(1'000, 1'000'000);

BENCHMARK_MAIN();
