#pragma once
/// @file outcome.hpp
/// @brief Immutable result of one dispatched execution.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace surge {

/// @brief Classification of an outcome.
enum class OutcomeStatus : std::uint8_t {
  Success,
  Failure,   ///< Application-level failure reported by the workload.
  Timeout,   ///< Exceeded the per-execution budget.
  Throttled, ///< Dropped for lack of an admission slot.
  Abandoned, ///< Still pending at cancel() or the drain grace timeout.
};

[[nodiscard]] constexpr auto to_string(OutcomeStatus s) -> const char * {
  switch (s) {
  case OutcomeStatus::Success:
    return "success";
  case OutcomeStatus::Failure:
    return "failure";
  case OutcomeStatus::Timeout:
    return "timeout";
  case OutcomeStatus::Throttled:
    return "throttled";
  case OutcomeStatus::Abandoned:
    return "abandoned";
  }
  return "unknown";
}

using CustomMetrics = std::vector<std::pair<std::string, double>>;

/// @brief Result of one execution. Built once, consumed once by the
/// aggregator.
struct Outcome {
  using Duration = std::chrono::nanoseconds;

  OutcomeStatus status = OutcomeStatus::Success;
  Duration duration{0};
  std::optional<int> status_code; ///< e.g. an HTTP status.
  std::optional<std::string> error;
  CustomMetrics custom;
  std::string workload; ///< Filled in by the scheduler.

  [[nodiscard]] auto success() const noexcept -> bool {
    return status == OutcomeStatus::Success;
  }

  [[nodiscard]] static auto ok(Duration d = Duration{0},
                               std::optional<int> code = std::nullopt)
      -> Outcome {
    return Outcome{.status = OutcomeStatus::Success,
                   .duration = d,
                   .status_code = code,
                   .error = std::nullopt,
                   .custom = {},
                   .workload = {}};
  }

  [[nodiscard]] static auto failure(std::string error,
                                    Duration d = Duration{0},
                                    std::optional<int> code = std::nullopt)
      -> Outcome {
    return Outcome{.status = OutcomeStatus::Failure,
                   .duration = d,
                   .status_code = code,
                   .error = std::move(error),
                   .custom = {},
                   .workload = {}};
  }

  [[nodiscard]] static auto timeout(Duration d) -> Outcome {
    return Outcome{.status = OutcomeStatus::Timeout,
                   .duration = d,
                   .status_code = std::nullopt,
                   .error = std::string{"timeout: execution budget exceeded"},
                   .custom = {},
                   .workload = {}};
  }

  [[nodiscard]] static auto throttled() -> Outcome {
    return Outcome{.status = OutcomeStatus::Throttled,
                   .duration = Duration{0},
                   .status_code = std::nullopt,
                   .error = std::nullopt,
                   .custom = {},
                   .workload = {}};
  }

  [[nodiscard]] static auto abandoned(Duration d = Duration{0}) -> Outcome {
    return Outcome{.status = OutcomeStatus::Abandoned,
                   .duration = d,
                   .status_code = std::nullopt,
                   .error = std::nullopt,
                   .custom = {},
                   .workload = {}};
  }
};

} // namespace surge
