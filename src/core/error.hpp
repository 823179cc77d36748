#pragma once
/// @file error.hpp
/// @brief Error taxonomy for configuration and API misuse.
///
/// Per-execution problems (failures, timeouts, abandonment) are never
/// errors: they are Outcome statuses folded into the metrics.

#include <cstdint>
#include <string>
#include <utility>

namespace surge {

/// @brief Category of an error returned through std::expected.
enum class ErrorKind : std::uint8_t {
  Configuration, ///< Invalid RunConfig, pattern parameters or weights.
  State,         ///< API misuse (e.g. run() twice, mutation after start).
  Scheduler,     ///< Unrecoverable fault inside the scheduler.
};

/// @brief Human-readable description of an ErrorKind.
[[nodiscard]] constexpr auto to_string(ErrorKind k) -> const char * {
  switch (k) {
  case ErrorKind::Configuration:
    return "configuration error";
  case ErrorKind::State:
    return "state error";
  case ErrorKind::Scheduler:
    return "scheduler fault";
  }
  return "unknown";
}

/// @brief An error kind plus a message naming the offending value.
struct Error {
  ErrorKind kind = ErrorKind::Configuration;
  std::string message;

  [[nodiscard]] auto what() const -> std::string {
    return std::string{to_string(kind)} + ": " + message;
  }
};

[[nodiscard]] inline auto configuration_error(std::string msg) -> Error {
  return Error{.kind = ErrorKind::Configuration, .message = std::move(msg)};
}

[[nodiscard]] inline auto state_error(std::string msg) -> Error {
  return Error{.kind = ErrorKind::State, .message = std::move(msg)};
}

[[nodiscard]] inline auto scheduler_error(std::string msg) -> Error {
  return Error{.kind = ErrorKind::Scheduler, .message = std::move(msg)};
}

} // namespace surge
