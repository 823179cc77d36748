#pragma once
/// @file run_config.hpp
/// @brief Run configuration and its validation.

#include "core/error.hpp"
#include "core/types.hpp"
#include "metrics/metrics_aggregator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace surge {

/// @brief Configuration for one load-test run.
struct RunConfig {
  std::string name = "Load Test";        ///< Cosmetic label.
  Seconds duration{60.0};                ///< Measured seconds (> 0).
  Seconds warmup_duration{5.0};          ///< Excluded from metrics (>= 0).
  std::size_t max_concurrent = 1000;     ///< Admission ceiling (>= 1).
  bool console_output = true;            ///< Live progress on stdout.

  /// Events waiting for a slot; 0 drops immediately as throttled.
  std::size_t queue_capacity = 0;
  /// How long Draining waits for in-flight work before abandoning it.
  Seconds grace_timeout{30.0};
  /// Per-execution budget, counted from the moment a worker starts the
  /// execution; unset = unbounded.
  std::optional<Seconds> execution_timeout;
  std::chrono::milliseconds tick_interval{10};
  /// Worker pool size; 0 = one thread per admission slot. A smaller pool
  /// queues admitted executions until a worker is free.
  std::size_t worker_threads = 0;
  /// Seeds workload selection and the reservoir sampler.
  std::optional<std::uint64_t> seed;
  std::size_t max_samples = MetricsAggregator::kDefaultMaxSamples;
  Seconds progress_interval{1.0};
  /// Start the live dashboard on this port (0 = ephemeral).
  std::optional<unsigned short> dashboard_port;
};

/// @brief Check every field; the first violation is returned.
[[nodiscard]] auto validate(const RunConfig &cfg) -> std::expected<void, Error>;

/// @brief Worker pool size actually used for @p cfg.
[[nodiscard]] auto effective_workers(const RunConfig &cfg) -> std::size_t;

} // namespace surge
