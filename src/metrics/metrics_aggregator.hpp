#pragma once
/// @file metrics_aggregator.hpp
/// @brief Concurrency-safe running aggregator of execution outcomes.

#include "core/types.hpp"
#include "metrics/outcome.hpp"
#include "metrics/snapshot.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace surge {

/// @brief Value at percentile @p p (0-100) of @p sorted, linearly
///        interpolated between ranks; 0 for an empty input.
[[nodiscard]] auto percentile(const std::vector<double> &sorted, double p)
    -> double;

/// @brief Lock-free view of the running counters, for progress output.
struct LiveCounters {
  std::uint64_t total = 0;
  std::uint64_t successful = 0;
  std::uint64_t failed = 0;
  std::uint64_t timed_out = 0;
  std::uint64_t throttled = 0;
  std::uint64_t abandoned = 0;
  std::uint64_t warmup = 0;
};

/// @brief Thread-safe metrics aggregator.
///
/// record() may be called concurrently from many completing executions.
/// Counters are atomics; durations, histograms and custom series are
/// guarded by one mutex held only for the update. get_statistics() copies
/// under the lock and sorts outside it, so max_samples also bounds how long
/// a snapshot blocks recorders.
///
/// Durations are retained exactly up to max_samples; beyond that a uniform
/// reservoir sample is kept, so percentiles become estimates while min, max
/// and mean stay exact.
class MetricsAggregator {
public:
  static constexpr std::size_t kDefaultMaxSamples = 100'000;

  explicit MetricsAggregator(std::size_t max_samples = kDefaultMaxSamples,
                             std::optional<std::uint64_t> seed = std::nullopt);

  MetricsAggregator(const MetricsAggregator &) = delete;
  MetricsAggregator &operator=(const MetricsAggregator &) = delete;

  /// @brief Mark the start of the measured window.
  void start();

  /// @brief Fold one outcome into the aggregate.
  /// @return false if the aggregator is already finalized (nothing recorded).
  auto record(const Outcome &outcome, Phase phase) -> bool;

  /// @brief Compute a snapshot (partial while running, final afterwards).
  [[nodiscard]] auto get_statistics() const -> MetricsSnapshot;

  /// @brief Freeze the aggregate; later record() calls are rejected.
  void finalize();

  [[nodiscard]] auto finalized() const noexcept -> bool {
    return finalized_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto counters() const noexcept -> LiveCounters;

  /// @brief Clear everything, including the finalized flag.
  void reset();

private:
  /// Exact min/max/sum over all values plus a bounded sample.
  struct Series {
    std::vector<double> sample;
    std::uint64_t seen = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
  };

  void add_to_series(Series &s, double value);
  [[nodiscard]] static auto summarize(Series &s) -> SeriesStats;

  std::size_t max_samples_;

  std::atomic<std::uint64_t> total_{0};
  std::atomic<std::uint64_t> ok_{0};
  std::atomic<std::uint64_t> fail_{0};
  std::atomic<std::uint64_t> timeout_{0};
  std::atomic<std::uint64_t> throttled_{0};
  std::atomic<std::uint64_t> abandoned_{0};
  std::atomic<std::uint64_t> warmup_{0};
  std::atomic<bool> finalized_{false};

  mutable std::mutex mu_;
  Series durations_ms_;
  std::unordered_map<int, std::size_t> status_codes_;
  std::unordered_map<std::string, std::size_t> errors_;
  std::unordered_map<std::string, WorkloadCounts> workloads_;
  std::unordered_map<std::string, Series> custom_;
  std::mt19937_64 reservoir_rng_;
  std::chrono::system_clock::time_point started_at_{};
  std::chrono::system_clock::time_point ended_at_{};
  Clock::time_point start_mono_{};
  Clock::time_point end_mono_{};
};

} // namespace surge
