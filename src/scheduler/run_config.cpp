/// @file run_config.cpp
/// @brief RunConfig validation.

#include "scheduler/run_config.hpp"

#include <cmath>

namespace surge {

namespace {

auto finite(Seconds s) -> bool { return std::isfinite(s.count()); }

} // namespace

auto validate(const RunConfig &cfg) -> std::expected<void, Error> {
  if (!finite(cfg.duration) || cfg.duration.count() <= 0.0) {
    return std::unexpected(configuration_error("duration must be > 0"));
  }
  if (!finite(cfg.warmup_duration) || cfg.warmup_duration.count() < 0.0) {
    return std::unexpected(
        configuration_error("warmup_duration must be >= 0"));
  }
  if (cfg.max_concurrent < 1) {
    return std::unexpected(configuration_error("max_concurrent must be >= 1"));
  }
  if (cfg.grace_timeout.count() < 0.0 || std::isnan(cfg.grace_timeout.count())) {
    return std::unexpected(configuration_error("grace_timeout must be >= 0"));
  }
  if (cfg.execution_timeout.has_value() &&
      (!finite(*cfg.execution_timeout) ||
       cfg.execution_timeout->count() <= 0.0)) {
    return std::unexpected(
        configuration_error("execution_timeout must be > 0"));
  }
  if (cfg.tick_interval.count() <= 0) {
    return std::unexpected(configuration_error("tick_interval must be > 0"));
  }
  if (!finite(cfg.progress_interval) || cfg.progress_interval.count() <= 0.0) {
    return std::unexpected(
        configuration_error("progress_interval must be > 0"));
  }
  if (cfg.max_samples == 0) {
    return std::unexpected(configuration_error("max_samples must be >= 1"));
  }
  return {};
}

auto effective_workers(const RunConfig &cfg) -> std::size_t {
  if (cfg.worker_threads > 0) {
    return cfg.worker_threads;
  }
  return cfg.max_concurrent;
}

} // namespace surge
