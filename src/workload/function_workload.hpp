#pragma once
/// @file function_workload.hpp
/// @brief Custom workload wrapping a callable.

#include "workload/workload.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace surge {

/// @brief Workload whose execute() forwards to a callable.
///
/// The callable either returns an Outcome (used as-is, duration filled in by
/// the scheduler when zero) or returns void, in which case returning normally
/// is a success and throwing is a failure.
class FunctionWorkload final : public Workload {
public:
  using Fn = std::function<Outcome(ExecutionContext &)>;

  FunctionWorkload(std::string name, Fn fn)
      : Workload{std::move(name)}, fn_{std::move(fn)} {}

  /// @brief Build from a void-returning callable.
  template <typename F>
    requires std::is_void_v<std::invoke_result_t<F &, ExecutionContext &>>
  FunctionWorkload(std::string name, F fn)
      : Workload{std::move(name)},
        fn_{[fn = std::move(fn)](ExecutionContext &ctx) mutable -> Outcome {
          fn(ctx);
          return Outcome::ok();
        }} {}

  auto execute(ExecutionContext &ctx) -> Outcome override { return fn_(ctx); }

private:
  Fn fn_;
};

} // namespace surge
