#pragma once
/// @file rate_pattern.hpp
/// @brief Time-varying target rate functions (requests per second).
///
/// A RatePattern is an immutable tagged variant. Every variant is a pure
/// function of elapsed time except the jittered and chaos variants, which
/// draw from a private random engine (reproducible only when seeded).
///
/// Usage:
/// @code
///   auto ramp = surge::RatePattern::ramp(5.0, 50.0, std::chrono::seconds{60});
///   double r = ramp->rate_at(surge::Seconds{30}); // 27.5
/// @endcode

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace surge {

/// @brief Variant tag.
enum class PatternKind : std::uint8_t {
  Constant,
  Ramp,
  Spike,
  Burst,
  Jittered,
  StepLadder,
  Chaos,
  Curve,
};

[[nodiscard]] constexpr auto to_string(PatternKind k) -> const char * {
  switch (k) {
  case PatternKind::Constant:
    return "constant";
  case PatternKind::Ramp:
    return "ramp";
  case PatternKind::Spike:
    return "spike";
  case PatternKind::Burst:
    return "burst";
  case PatternKind::Jittered:
    return "steady";
  case PatternKind::StepLadder:
    return "step";
  case PatternKind::Chaos:
    return "chaos";
  case PatternKind::Curve:
    return "curve";
  }
  return "unknown";
}

/// @brief Random distribution used by the jittered and chaos variants.
enum class Distribution : std::uint8_t {
  Uniform,
  Gaussian,
  Exponential, ///< Chaos only.
};

// ─── Per-kind parameters ────────────────────────────────────────────────

struct ConstantRate {
  double rate = 0.0;
};

struct RampRate {
  double start_rate = 0.0;
  double end_rate = 0.0;
  Seconds ramp_duration{0.0};
};

struct SpikeRate {
  double baseline_rate = 0.0;
  double spike_rate = 0.0;
  Seconds spike_duration{0.0};
  Seconds interval{0.0};
};

struct BurstRate {
  double initial_rate = 0.0;
  double burst_rate = 0.0;
  Seconds burst_duration{0.0};
  Seconds delay{0.0};
};

struct JitteredRate {
  double target_rate = 0.0;
  double jitter = 0.0; ///< Fraction of target, in [0, 1).
  Distribution distribution = Distribution::Uniform;
};

struct StepLadderRate {
  double start_rate = 0.0;
  double end_rate = 0.0;
  std::size_t steps = 2;
  Seconds step_duration{0.0};
};

struct ChaosRate {
  double min_rate = 10.0;
  double max_rate = 500.0;
  Distribution distribution = Distribution::Uniform;
  /// 0 = fresh draw on every evaluation; otherwise one draw per window.
  Seconds change_interval{0.0};
};

struct CurveRate {
  std::function<double(double)> fn; ///< elapsed seconds -> rate.
};

/// @brief Parameters for RatePattern::chaos().
struct ChaosParams {
  double min_rate = 10.0;
  double max_rate = 500.0;
  Distribution distribution = Distribution::Uniform;
  Seconds change_interval{0.0};
  std::optional<std::uint64_t> seed;
};

// ─── RatePattern ────────────────────────────────────────────────────────

class RatePattern {
public:
  using Params = std::variant<ConstantRate, RampRate, SpikeRate, BurstRate,
                              JitteredRate, StepLadderRate, ChaosRate,
                              CurveRate>;

  [[nodiscard]] static auto constant(double rate)
      -> std::expected<RatePattern, Error>;

  /// @brief Linear interpolation from @p start to @p end over
  ///        @p ramp_duration, holding @p end afterwards.
  [[nodiscard]] static auto ramp(double start, double end,
                                 Seconds ramp_duration)
      -> std::expected<RatePattern, Error>;

  /// @brief @p spike_rate during the first @p spike_duration of every
  ///        @p interval, @p baseline otherwise.
  [[nodiscard]] static auto spike(double baseline, double spike_rate,
                                  Seconds spike_duration, Seconds interval)
      -> std::expected<RatePattern, Error>;

  /// @brief A single burst of @p burst_rate starting at @p delay.
  [[nodiscard]] static auto burst(double initial_rate, double burst_rate,
                                  Seconds burst_duration, Seconds delay)
      -> std::expected<RatePattern, Error>;

  /// @brief Steady state around @p target_rate with relative @p jitter.
  [[nodiscard]] static auto
  jittered(double target_rate, double jitter,
           Distribution distribution = Distribution::Uniform,
           std::optional<std::uint64_t> seed = std::nullopt)
      -> std::expected<RatePattern, Error>;

  /// @brief @p steps discrete levels from @p start to @p end.
  [[nodiscard]] static auto step_ladder(double start, double end,
                                        std::size_t steps,
                                        Seconds step_duration)
      -> std::expected<RatePattern, Error>;

  [[nodiscard]] static auto chaos(ChaosParams params)
      -> std::expected<RatePattern, Error>;

  /// @brief User-supplied curve; negative results are floored at 0.
  [[nodiscard]] static auto curve(std::function<double(double)> fn)
      -> std::expected<RatePattern, Error>;

  /// @brief Target rate at @p elapsed (negative elapsed is treated as 0).
  [[nodiscard]] auto rate_at(Seconds elapsed) const -> double;

  [[nodiscard]] auto kind() const noexcept -> PatternKind;
  [[nodiscard]] auto params() const noexcept -> const Params &;

  /// @brief One-line summary, e.g. "ramp(5 -> 50 over 60s)".
  [[nodiscard]] auto describe() const -> std::string;

private:
  struct RandomState {
    explicit RandomState(std::uint64_t seed) : engine{seed} {}
    std::mutex mutex;
    std::mt19937_64 engine;
    std::int64_t window = -1;
    double held = 0.0;
  };

  explicit RatePattern(Params params,
                       std::shared_ptr<RandomState> random = nullptr);

  [[nodiscard]] auto jittered_rate(const JitteredRate &p) const -> double;
  [[nodiscard]] auto chaos_rate(const ChaosRate &p, double t) const -> double;
  [[nodiscard]] auto draw_chaos(const ChaosRate &p) const -> double;

  Params params_;
  // Shared by copies; guarded by its own mutex.
  std::shared_ptr<RandomState> random_;
};

} // namespace surge
