#pragma once
/// @file workload_registry.hpp
/// @brief Weighted workload set with O(log n) random selection.

#include "core/error.hpp"
#include "workload/workload.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <random>
#include <vector>

namespace surge {

/// @brief One registered workload and its relative weight.
struct WorkloadEntry {
  std::shared_ptr<Workload> workload;
  double weight = 1.0;
};

/// @brief Ordered (workload, weight) pairs.
///
/// Built single-threaded during configuration, then frozen. After freeze()
/// the registry is read-only and select() may be called from any number of
/// threads, each with its own random engine.
class WorkloadRegistry {
public:
  using Engine = std::mt19937_64;

  /// @brief Register @p workload with a positive @p weight.
  auto add(std::shared_ptr<Workload> workload, double weight = 1.0)
      -> std::expected<void, Error>;

  /// @brief Check the total weight and make the registry read-only.
  auto freeze() -> std::expected<void, Error>;

  /// @brief Weighted draw with replacement. Requires a frozen, non-empty
  /// registry.
  [[nodiscard]] auto select(Engine &engine) const -> const WorkloadEntry &;

  /// @brief Probability of selecting entry @p index (weight / total).
  [[nodiscard]] auto probability(std::size_t index) const -> double;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
  [[nodiscard]] auto total_weight() const noexcept -> double {
    return cumulative_.empty() ? 0.0 : cumulative_.back();
  }
  [[nodiscard]] auto frozen() const noexcept -> bool { return frozen_; }
  [[nodiscard]] auto entries() const noexcept
      -> const std::vector<WorkloadEntry> & {
    return entries_;
  }

private:
  std::vector<WorkloadEntry> entries_;
  std::vector<double> cumulative_; ///< Running sum of weights.
  bool frozen_ = false;
};

} // namespace surge
