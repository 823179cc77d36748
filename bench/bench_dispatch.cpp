#include "pattern/rate_pattern.hpp"
#include "workload/function_workload.hpp"
#include "workload/workload_registry.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>

using namespace surge;

// Weighted selection over n registered workloads
static void BM_Registry_Select(benchmark::State &state) {
  const auto n = static_cast<std::size_t>(state.range(0));
  WorkloadRegistry registry;
  for (std::size_t i = 0; i < n; ++i) {
    (void)registry.add(std::make_shared<FunctionWorkload>(
                           "w" + std::to_string(i), [](ExecutionContext &) {}),
                       static_cast<double>(i + 1));
  }
  if (!registry.freeze()) {
    state.SkipWithError("freeze failed");
    return;
  }

  WorkloadRegistry::Engine engine{42};
  for (auto _ : state) {
    benchmark::DoNotOptimize(&registry.select(engine));
  }
}

BENCHMARK(BM_Registry_Select)->RangeMultiplier(4)->Range(1, 1024);

// rate_at() is evaluated once per scheduler tick
static void BM_RateAt_Ramp(benchmark::State &state) {
  auto pattern = RatePattern::ramp(10.0, 1000.0, Seconds{60.0}).value();
  double t = 0.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(pattern.rate_at(Seconds{t}));
    t += 0.001;
  }
}

static void BM_RateAt_Jittered(benchmark::State &state) {
  auto pattern =
      RatePattern::jittered(500.0, 0.2, Distribution::Gaussian, 42).value();
  for (auto _ : state) {
    benchmark::DoNotOptimize(pattern.rate_at(Seconds{1.0}));
  }
}

static void BM_RateAt_Chaos(benchmark::State &state) {
  auto pattern = RatePattern::chaos({.min_rate = 10.0,
                                     .max_rate = 1000.0,
                                     .change_interval = Seconds{1.0},
                                     .seed = 42})
                     .value();
  double t = 0.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(pattern.rate_at(Seconds{t}));
    t += 0.01;
  }
}

BENCHMARK(BM_RateAt_Ramp);
BENCHMARK(BM_RateAt_Jittered);
BENCHMARK(BM_RateAt_Chaos);

BENCHMARK_MAIN();
