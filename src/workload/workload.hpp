#pragma once
/// @file workload.hpp
/// @brief Execution capability interface for synthetic workloads.
///
/// A workload has one required operation, execute(), plus optional
/// setup()/teardown() hooks called once per run on the scheduling thread.
/// execute() runs on a worker thread and may be invoked concurrently.

#include "core/types.hpp"
#include "metrics/outcome.hpp"
#include "workload/shared_context.hpp"

#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace surge {

/// @brief Capability family of a workload.
enum class WorkloadKind : std::uint8_t {
  NetworkCall, ///< Request/response call (HTTP).
  Socket,      ///< Long-lived socket exchange (WebSocket).
  Custom,      ///< User-defined or simulated.
};

[[nodiscard]] constexpr auto to_string(WorkloadKind k) -> const char * {
  switch (k) {
  case WorkloadKind::NetworkCall:
    return "network";
  case WorkloadKind::Socket:
    return "socket";
  case WorkloadKind::Custom:
    return "custom";
  }
  return "unknown";
}

/// @brief Per-execution view handed to Workload::execute().
class ExecutionContext {
public:
  ExecutionContext(const DispatchEvent &event, Phase phase,
                   SharedContext &shared, std::stop_token stop) noexcept
      : event_{event}, phase_{phase}, shared_{shared}, stop_{std::move(stop)} {}

  [[nodiscard]] auto event() const noexcept -> const DispatchEvent & {
    return event_;
  }

  /// @brief Phase at admission time.
  [[nodiscard]] auto phase() const noexcept -> Phase { return phase_; }

  [[nodiscard]] auto shared() noexcept -> SharedContext & { return shared_; }

  /// @brief Set when the execution timed out or the run was cancelled.
  /// Long-running workloads should poll this and return early.
  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stop_.stop_requested();
  }

  [[nodiscard]] auto stop_token() const noexcept -> std::stop_token {
    return stop_;
  }

  /// @brief Record a custom numeric metric; merged into the outcome.
  void record(std::string name, double value) {
    custom_.emplace_back(std::move(name), value);
  }

  [[nodiscard]] auto take_custom() noexcept -> CustomMetrics {
    return std::exchange(custom_, {});
  }

private:
  const DispatchEvent &event_;
  Phase phase_;
  SharedContext &shared_;
  std::stop_token stop_;
  CustomMetrics custom_;
};

/// @brief Abstract workload.
class Workload {
public:
  explicit Workload(std::string name) : name_{std::move(name)} {}
  virtual ~Workload() = default;

  Workload(const Workload &) = delete;
  Workload &operator=(const Workload &) = delete;

  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return name_;
  }

  [[nodiscard]] virtual auto kind() const noexcept -> WorkloadKind {
    return WorkloadKind::Custom;
  }

  /// @brief Called once before the first dispatch. Throwing aborts the run
  /// with a scheduler fault.
  virtual void setup(SharedContext & /*shared*/) {}

  /// @brief Perform one unit of work. Exceptions are recorded as failures.
  [[nodiscard]] virtual auto execute(ExecutionContext &ctx) -> Outcome = 0;

  /// @brief Called once after the run has drained.
  virtual void teardown(SharedContext & /*shared*/) {}

private:
  std::string name_;
};

} // namespace surge
