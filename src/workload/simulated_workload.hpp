#pragma once
/// @file simulated_workload.hpp
/// @brief In-process stand-in for a remote service: configurable latency
///        and failure rate, no I/O.

#include "workload/workload.hpp"

#include <chrono>
#include <string>

namespace surge {

/// @brief Simulated service configuration.
struct SimulatedServiceConfig {
  /// Latency is drawn uniformly from [min_latency, max_latency].
  std::chrono::microseconds min_latency{0};
  std::chrono::microseconds max_latency{0};
  /// Probability in [0, 1] that a call fails with a 500.
  double failure_rate = 0.0;
  /// Payload size recorded as the "bytes" custom metric (0 = none).
  std::size_t payload_bytes = 0;
};

/// @brief Simulated request/response call.
///
/// Sleeps in short slices so that a timed-out or cancelled execution
/// returns promptly once its stop token fires.
class SimulatedWorkload final : public Workload {
public:
  explicit SimulatedWorkload(std::string name,
                             SimulatedServiceConfig cfg = {}) noexcept;

  [[nodiscard]] auto execute(ExecutionContext &ctx) -> Outcome override;

  [[nodiscard]] auto config() const noexcept -> const SimulatedServiceConfig & {
    return cfg_;
  }

private:
  SimulatedServiceConfig cfg_;
};

} // namespace surge
