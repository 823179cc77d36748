/// @file simulated_workload.cpp
/// @brief SimulatedWorkload implementation.

#include "workload/simulated_workload.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace surge {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds{5};

} // namespace

SimulatedWorkload::SimulatedWorkload(std::string name,
                                     SimulatedServiceConfig cfg) noexcept
    : Workload{std::move(name)}, cfg_{cfg} {
  if (cfg_.max_latency < cfg_.min_latency) {
    cfg_.max_latency = cfg_.min_latency;
  }
}

auto SimulatedWorkload::execute(ExecutionContext &ctx) -> Outcome {
  auto &data = ctx.shared().data();

  auto latency = cfg_.min_latency;
  if (cfg_.max_latency > cfg_.min_latency) {
    latency = std::chrono::microseconds{
        data.integer(cfg_.min_latency.count(), cfg_.max_latency.count())};
  }

  const auto deadline = Clock::now() + latency;
  while (Clock::now() < deadline) {
    if (ctx.stop_requested()) {
      return Outcome::failure("cancelled: stop requested");
    }
    auto remaining = deadline - Clock::now();
    std::this_thread::sleep_for(
        std::min<Clock::duration>(remaining, kSleepSlice));
  }

  if (cfg_.payload_bytes > 0) {
    ctx.record("bytes", static_cast<double>(cfg_.payload_bytes));
  }

  if (data.chance(cfg_.failure_rate)) {
    return Outcome::failure("server_error: simulated failure",
                            Outcome::Duration{0}, 500);
  }
  return Outcome::ok(Outcome::Duration{0}, 200);
}

} // namespace surge
