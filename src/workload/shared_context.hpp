#pragma once
/// @file shared_context.hpp
/// @brief Run-wide resources handed to every workload execution.
///
/// Built once by the orchestrator and passed explicitly into every
/// execution, so workloads never reach for process-wide state.

#include <any>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

namespace surge {

/// @brief Thread-safe generator of realistic-looking test data.
class TestDataGenerator {
public:
  explicit TestDataGenerator(std::optional<std::uint64_t> seed = std::nullopt);

  [[nodiscard]] auto integer(std::int64_t lo, std::int64_t hi) -> std::int64_t;
  [[nodiscard]] auto real(double lo, double hi) -> double;
  [[nodiscard]] auto chance(double probability) -> bool;

  /// @brief Lowercase alphanumeric string of @p length characters.
  [[nodiscard]] auto token(std::size_t length) -> std::string;
  [[nodiscard]] auto first_name() -> std::string;
  [[nodiscard]] auto last_name() -> std::string;
  [[nodiscard]] auto email() -> std::string;
  /// @brief Random RFC 4122 version-4 UUID string.
  [[nodiscard]] auto uuid() -> std::string;

private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

/// @brief Shared resources for one run.
///
/// Resources are registered single-threaded during setup; lookups during the
/// run are read-only. Stored objects must themselves be thread-safe if
/// workloads mutate them concurrently.
class SharedContext {
public:
  explicit SharedContext(std::optional<std::uint64_t> seed = std::nullopt)
      : data_{seed} {}

  SharedContext(const SharedContext &) = delete;
  SharedContext &operator=(const SharedContext &) = delete;

  [[nodiscard]] auto data() noexcept -> TestDataGenerator & { return data_; }

  /// @brief Store (or replace) a named resource.
  template <typename T> void put(std::string key, T value) {
    std::lock_guard lock(mutex_);
    resources_[std::move(key)] = std::move(value);
  }

  /// @brief Look up a named resource; nullptr if absent or of another type.
  template <typename T> [[nodiscard]] auto get(std::string_view key) -> T * {
    std::lock_guard lock(mutex_);
    auto it = resources_.find(std::string{key});
    if (it == resources_.end()) {
      return nullptr;
    }
    return std::any_cast<T>(&it->second);
  }

  [[nodiscard]] auto contains(std::string_view key) const -> bool {
    std::lock_guard lock(mutex_);
    return resources_.contains(std::string{key});
  }

private:
  TestDataGenerator data_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::any> resources_;
};

} // namespace surge
