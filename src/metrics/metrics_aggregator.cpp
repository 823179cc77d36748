/// @file metrics_aggregator.cpp
/// @brief MetricsAggregator implementation.

#include "metrics/metrics_aggregator.hpp"

#include <algorithm>
#include <utility>

namespace surge {

namespace {

auto error_type(const std::string &error) -> std::string {
  auto colon = error.find(':');
  return colon == std::string::npos ? error : error.substr(0, colon);
}

auto to_ms(Outcome::Duration d) -> double {
  return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace

auto percentile(const std::vector<double> &sorted, double p) -> double {
  if (sorted.empty()) {
    return 0.0;
  }
  const double k =
      static_cast<double>(sorted.size() - 1) * std::clamp(p, 0.0, 100.0) /
      100.0;
  const auto lo = static_cast<std::size_t>(k);
  const auto hi = std::min(lo + 1, sorted.size() - 1);
  if (lo == hi) {
    return sorted[lo];
  }
  const double frac = k - static_cast<double>(lo);
  return sorted[lo] * (1.0 - frac) + sorted[hi] * frac;
}

MetricsAggregator::MetricsAggregator(std::size_t max_samples,
                                     std::optional<std::uint64_t> seed)
    : max_samples_{max_samples > 0 ? max_samples : 1},
      reservoir_rng_{seed.value_or(std::random_device{}())} {}

void MetricsAggregator::start() {
  std::lock_guard lock(mu_);
  started_at_ = std::chrono::system_clock::now();
  start_mono_ = Clock::now();
}

auto MetricsAggregator::record(const Outcome &outcome, Phase phase) -> bool {
  std::lock_guard lock(mu_);
  if (finalized_.load(std::memory_order_relaxed)) {
    return false;
  }

  if (phase == Phase::Warmup) {
    warmup_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  switch (outcome.status) {
  case OutcomeStatus::Throttled:
    throttled_.fetch_add(1, std::memory_order_relaxed);
    return true;
  case OutcomeStatus::Abandoned:
    abandoned_.fetch_add(1, std::memory_order_relaxed);
    return true;
  case OutcomeStatus::Success:
    ok_.fetch_add(1, std::memory_order_relaxed);
    break;
  case OutcomeStatus::Failure:
    fail_.fetch_add(1, std::memory_order_relaxed);
    break;
  case OutcomeStatus::Timeout:
    timeout_.fetch_add(1, std::memory_order_relaxed);
    break;
  }
  total_.fetch_add(1, std::memory_order_relaxed);

  add_to_series(durations_ms_, to_ms(outcome.duration));

  if (outcome.status_code.has_value()) {
    ++status_codes_[*outcome.status_code];
  }
  if (outcome.error.has_value() && !outcome.success()) {
    ++errors_[error_type(*outcome.error)];
  }

  auto &w = workloads_[outcome.workload];
  ++w.total;
  if (outcome.status == OutcomeStatus::Success) {
    ++w.successful;
  } else if (outcome.status == OutcomeStatus::Failure) {
    ++w.failed;
  } else {
    ++w.timed_out;
  }

  for (const auto &[name, value] : outcome.custom) {
    add_to_series(custom_[name], value);
  }
  return true;
}

// Caller holds mu_.
void MetricsAggregator::add_to_series(Series &s, double value) {
  if (s.seen == 0) {
    s.min = s.max = value;
  } else {
    s.min = std::min(s.min, value);
    s.max = std::max(s.max, value);
  }
  s.sum += value;
  ++s.seen;

  if (s.sample.size() < max_samples_) {
    s.sample.push_back(value);
    return;
  }
  // Reservoir sampling (Algorithm R).
  std::uniform_int_distribution<std::uint64_t> d(0, s.seen - 1);
  auto j = d(reservoir_rng_);
  if (j < max_samples_) {
    s.sample[static_cast<std::size_t>(j)] = value;
  }
}

// Sorts s.sample in place.
auto MetricsAggregator::summarize(Series &s) -> SeriesStats {
  SeriesStats out;
  if (s.seen == 0) {
    return out;
  }
  auto &sorted = s.sample;
  std::sort(sorted.begin(), sorted.end());
  out.count = static_cast<std::size_t>(s.seen);
  out.sum = s.sum;
  out.min = s.min;
  out.max = s.max;
  out.mean = s.sum / static_cast<double>(s.seen);
  out.p50 = percentile(sorted, 50.0);
  out.p95 = percentile(sorted, 95.0);
  out.p99 = percentile(sorted, 99.0);
  return out;
}

auto MetricsAggregator::get_statistics() const -> MetricsSnapshot {
  MetricsSnapshot m;
  Series durations;
  std::unordered_map<std::string, Series> custom;

  {
    std::lock_guard lock(mu_);
    m.total_requests = total_.load(std::memory_order_relaxed);
    m.successful = ok_.load(std::memory_order_relaxed);
    m.failed = fail_.load(std::memory_order_relaxed);
    m.timed_out = timeout_.load(std::memory_order_relaxed);
    m.throttled = throttled_.load(std::memory_order_relaxed);
    m.abandoned = abandoned_.load(std::memory_order_relaxed);
    m.warmup = warmup_.load(std::memory_order_relaxed);
    m.final = finalized_.load(std::memory_order_relaxed);

    durations = durations_ms_;
    custom = custom_;
    m.status_codes.insert(status_codes_.begin(), status_codes_.end());
    m.errors.insert(errors_.begin(), errors_.end());
    m.workloads.insert(workloads_.begin(), workloads_.end());

    m.started_at = started_at_;
    const auto end_mono = m.final ? end_mono_ : Clock::now();
    m.ended_at = m.final ? ended_at_ : std::chrono::system_clock::now();
    if (start_mono_ != Clock::time_point{}) {
      m.elapsed_seconds = to_seconds(end_mono - start_mono_);
    }
  }

  // Sorting happens outside the lock.
  auto lat = summarize(durations);
  m.latency = LatencyStats{
      .samples = durations.sample.size(),
      .min_ms = lat.min,
      .mean_ms = lat.mean,
      .max_ms = lat.max,
      .p50_ms = lat.p50,
      .p90_ms = 0.0,
      .p95_ms = lat.p95,
      .p99_ms = lat.p99,
      .p999_ms = 0.0,
  };
  if (!durations.sample.empty()) {
    m.latency.p90_ms = percentile(durations.sample, 90.0);
    m.latency.p999_ms = percentile(durations.sample, 99.9);
  }

  for (auto &[name, series] : custom) {
    m.custom_metrics.emplace(name, summarize(series));
  }
  return m;
}

void MetricsAggregator::finalize() {
  std::lock_guard lock(mu_);
  if (finalized_.load(std::memory_order_relaxed)) {
    return;
  }
  ended_at_ = std::chrono::system_clock::now();
  end_mono_ = Clock::now();
  finalized_.store(true, std::memory_order_release);
}

auto MetricsAggregator::counters() const noexcept -> LiveCounters {
  return LiveCounters{
      .total = total_.load(std::memory_order_relaxed),
      .successful = ok_.load(std::memory_order_relaxed),
      .failed = fail_.load(std::memory_order_relaxed),
      .timed_out = timeout_.load(std::memory_order_relaxed),
      .throttled = throttled_.load(std::memory_order_relaxed),
      .abandoned = abandoned_.load(std::memory_order_relaxed),
      .warmup = warmup_.load(std::memory_order_relaxed),
  };
}

void MetricsAggregator::reset() {
  std::lock_guard lock(mu_);
  total_ = ok_ = fail_ = timeout_ = 0;
  throttled_ = abandoned_ = warmup_ = 0;
  finalized_ = false;
  durations_ms_ = Series{};
  status_codes_.clear();
  errors_.clear();
  workloads_.clear();
  custom_.clear();
  started_at_ = ended_at_ = std::chrono::system_clock::time_point{};
  start_mono_ = end_mono_ = Clock::time_point{};
}

} // namespace surge
