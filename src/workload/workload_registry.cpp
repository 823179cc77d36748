/// @file workload_registry.cpp
/// @brief WorkloadRegistry implementation.

#include "workload/workload_registry.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace surge {

auto WorkloadRegistry::add(std::shared_ptr<Workload> workload, double weight)
    -> std::expected<void, Error> {
  if (frozen_) {
    return std::unexpected(state_error("workload registry is frozen"));
  }
  if (!workload) {
    return std::unexpected(configuration_error("workload must not be null"));
  }
  if (!std::isfinite(weight) || weight <= 0.0) {
    return std::unexpected(configuration_error(
        "weight for '" + std::string{workload->name()} +
        "' must be positive, got " + std::to_string(weight)));
  }

  cumulative_.push_back(total_weight() + weight);
  entries_.push_back(WorkloadEntry{.workload = std::move(workload),
                                   .weight = weight});
  return {};
}

auto WorkloadRegistry::freeze() -> std::expected<void, Error> {
  if (entries_.empty()) {
    return std::unexpected(configuration_error("no workloads registered"));
  }
  if (!(total_weight() > 0.0)) {
    return std::unexpected(configuration_error("total weight must be > 0"));
  }
  frozen_ = true;
  return {};
}

auto WorkloadRegistry::select(Engine &engine) const -> const WorkloadEntry & {
  std::uniform_real_distribution<double> dist(0.0, total_weight());
  const double r = dist(engine);

  // First entry whose cumulative weight exceeds r.
  auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), r);
  auto index = static_cast<std::size_t>(it - cumulative_.begin());
  index = std::min(index, entries_.size() - 1);
  return entries_[index];
}

auto WorkloadRegistry::probability(std::size_t index) const -> double {
  if (index >= entries_.size() || total_weight() <= 0.0) {
    return 0.0;
  }
  return entries_[index].weight / total_weight();
}

} // namespace surge
