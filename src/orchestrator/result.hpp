#pragma once
/// @file result.hpp
/// @brief Final outcome of a LoadTest run.

#include "core/types.hpp"
#include "metrics/snapshot.hpp"
#include "scheduler/run_config.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace surge {

/// @brief Configuration, final snapshot and scheduler totals of one run.
struct Result {
  RunConfig config;
  std::string pattern; ///< RatePattern::describe() of the driving pattern.
  MetricsSnapshot snapshot;
  Phase final_phase = Phase::Stopped;
  std::uint64_t dispatched = 0;
  std::uint64_t admitted = 0;
  std::size_t peak_in_flight = 0; ///< Peak admission slots held.
  std::size_t peak_running = 0;   ///< Peak executions on a worker at once.

  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return final_phase == Phase::Cancelled;
  }
};

} // namespace surge
