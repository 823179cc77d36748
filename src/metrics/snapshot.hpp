#pragma once
/// @file snapshot.hpp
/// @brief Read-only aggregate view of a run, partial or final.

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace surge {

/// @brief Response-time distribution (milliseconds).
struct LatencyStats {
  std::size_t samples = 0; ///< Durations the percentiles are computed from.
  double min_ms = 0.0;
  double mean_ms = 0.0;
  double max_ms = 0.0;
  double p50_ms = 0.0;
  double p90_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  double p999_ms = 0.0;
};

/// @brief Statistics of one custom metric series.
struct SeriesStats {
  std::size_t count = 0;
  double sum = 0.0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
};

/// @brief Per-workload outcome counts (measured phase only).
struct WorkloadCounts {
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t timed_out = 0;
};

/// @brief Snapshot of aggregate metrics.
///
/// total_requests counts completed measured executions:
/// successful + failed + timed_out. Throttled and abandoned events are
/// reported separately and are not part of the total.
struct MetricsSnapshot {
  std::size_t total_requests = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;    ///< Application-level failures.
  std::size_t timed_out = 0; ///< Per-execution budget exceeded.
  std::size_t throttled = 0; ///< No admission slot / queue full.
  std::size_t abandoned = 0; ///< Pending at cancel or drain timeout.
  std::size_t warmup = 0;    ///< Completed during warmup, excluded above.

  LatencyStats latency;

  std::map<int, std::size_t> status_codes;
  std::map<std::string, std::size_t> errors; ///< Keyed by error type.
  std::map<std::string, WorkloadCounts> workloads;
  std::map<std::string, SeriesStats> custom_metrics;

  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point ended_at{};
  double elapsed_seconds = 0.0;
  bool final = false;

  /// @brief Successful share of total, in percent; 0 when total is 0.
  [[nodiscard]] auto success_rate() const -> double {
    return total_requests > 0 ? static_cast<double>(successful) /
                                    static_cast<double>(total_requests) *
                                    100.0
                              : 0.0;
  }

  /// @brief Failed + timed-out share of total, in percent.
  [[nodiscard]] auto error_rate() const -> double {
    return total_requests > 0 ? static_cast<double>(failed + timed_out) /
                                    static_cast<double>(total_requests) *
                                    100.0
                              : 0.0;
  }

  /// @brief Completed requests per second.
  [[nodiscard]] auto throughput_rps() const -> double {
    return elapsed_seconds > 0.0
               ? static_cast<double>(total_requests) / elapsed_seconds
               : 0.0;
  }
};

} // namespace surge
