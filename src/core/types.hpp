#pragma once
/// @file types.hpp
/// @brief Clock aliases, run phases and dispatch events shared by every
///        component.

#include <chrono>
#include <cstdint>

namespace surge {

using Clock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

/// @brief Lifecycle phase of a run.
enum class Phase : std::uint8_t {
  Idle,
  Warmup,    ///< Outcomes excluded from the final snapshot.
  Measuring, ///< Outcomes recorded.
  Draining,  ///< No new dispatches; in-flight work finishes or is abandoned.
  Stopped,
  Cancelled,
};

[[nodiscard]] constexpr auto to_string(Phase p) -> const char * {
  switch (p) {
  case Phase::Idle:
    return "idle";
  case Phase::Warmup:
    return "warmup";
  case Phase::Measuring:
    return "measuring";
  case Phase::Draining:
    return "draining";
  case Phase::Stopped:
    return "stopped";
  case Phase::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

/// @brief One owed execution produced by the rate accumulator.
struct DispatchEvent {
  std::uint64_t sequence = 0;      ///< Monotonic, starts at 1.
  Clock::time_point scheduled_at;  ///< Intended dispatch instant.
  Seconds elapsed{0.0};            ///< scheduled_at - run start.
};

/// @brief Seconds as a plain double.
[[nodiscard]] inline auto to_seconds(Clock::duration d) -> double {
  return std::chrono::duration_cast<Seconds>(d).count();
}

} // namespace surge
