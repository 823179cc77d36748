#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for snapshots, results and progress.

#include "metrics/snapshot.hpp"
#include "orchestrator/result.hpp"
#include "scheduler/scheduler.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace surge {

namespace detail {

inline auto epoch_ms(std::chrono::system_clock::time_point t)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

} // namespace detail

inline void to_json(nlohmann::json &j, const LatencyStats &l) {
  j = nlohmann::json{
      {"samples", l.samples}, {"min_ms", l.min_ms}, {"mean_ms", l.mean_ms},
      {"max_ms", l.max_ms},   {"p50_ms", l.p50_ms}, {"p90_ms", l.p90_ms},
      {"p95_ms", l.p95_ms},   {"p99_ms", l.p99_ms}, {"p999_ms", l.p999_ms},
  };
}

inline void to_json(nlohmann::json &j, const SeriesStats &s) {
  j = nlohmann::json{
      {"count", s.count}, {"sum", s.sum}, {"min", s.min}, {"max", s.max},
      {"mean", s.mean},   {"p50", s.p50}, {"p95", s.p95}, {"p99", s.p99},
  };
}

inline void to_json(nlohmann::json &j, const WorkloadCounts &w) {
  j = nlohmann::json{
      {"total", w.total},
      {"successful", w.successful},
      {"failed", w.failed},
      {"timed_out", w.timed_out},
  };
}

inline void to_json(nlohmann::json &j, const MetricsSnapshot &s) {
  j = nlohmann::json{
      {"total_requests", s.total_requests},
      {"successful", s.successful},
      {"failed", s.failed},
      {"timed_out", s.timed_out},
      {"throttled", s.throttled},
      {"abandoned", s.abandoned},
      {"warmup", s.warmup},
      {"success_rate", s.success_rate()},
      {"error_rate", s.error_rate()},
      {"throughput_rps", s.throughput_rps()},
      {"latency", s.latency},
      {"workloads", s.workloads},
      {"custom_metrics", s.custom_metrics},
      {"errors", s.errors},
      {"started_at_ms", detail::epoch_ms(s.started_at)},
      {"ended_at_ms", detail::epoch_ms(s.ended_at)},
      {"elapsed_seconds", s.elapsed_seconds},
      {"final", s.final},
  };
  // Object keys must be strings.
  auto codes = nlohmann::json::object();
  for (const auto &[code, count] : s.status_codes) {
    codes[std::to_string(code)] = count;
  }
  j["status_codes"] = std::move(codes);
}

inline void to_json(nlohmann::json &j, const RunConfig &c) {
  j = nlohmann::json{
      {"name", c.name},
      {"duration_seconds", c.duration.count()},
      {"warmup_seconds", c.warmup_duration.count()},
      {"max_concurrent", c.max_concurrent},
      {"queue_capacity", c.queue_capacity},
      {"grace_timeout_seconds", c.grace_timeout.count()},
      {"tick_interval_ms", c.tick_interval.count()},
      {"worker_threads", effective_workers(c)},
  };
  if (c.execution_timeout) {
    j["execution_timeout_seconds"] = c.execution_timeout->count();
  } else {
    j["execution_timeout_seconds"] = nullptr;
  }
}

inline void to_json(nlohmann::json &j, const Result &r) {
  j = nlohmann::json{
      {"type", "result"},
      {"config", r.config},
      {"pattern", r.pattern},
      {"final_phase", to_string(r.final_phase)},
      {"dispatched", r.dispatched},
      {"admitted", r.admitted},
      {"peak_in_flight", r.peak_in_flight},
      {"peak_running", r.peak_running},
      {"metrics", r.snapshot},
  };
}

inline void to_json(nlohmann::json &j, const LiveCounters &c) {
  j = nlohmann::json{
      {"total", c.total},         {"successful", c.successful},
      {"failed", c.failed},       {"timed_out", c.timed_out},
      {"throttled", c.throttled}, {"abandoned", c.abandoned},
      {"warmup", c.warmup},
  };
}

inline void to_json(nlohmann::json &j, const ProgressUpdate &p) {
  j = nlohmann::json{
      {"type", "progress"},
      {"phase", to_string(p.phase)},
      {"elapsed_seconds", p.elapsed_seconds},
      {"target_rate", p.target_rate},
      {"in_flight", p.in_flight},
      {"running", p.running},
      {"queued", p.queued},
      {"dispatched", p.dispatched},
      {"counters", p.counters},
  };
}

} // namespace surge
