/// @file rate_pattern.cpp
/// @brief RatePattern factories, validation and evaluation.

#include "pattern/rate_pattern.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace surge {

namespace {

auto valid_rate(double r) -> bool { return std::isfinite(r) && r >= 0.0; }

auto valid_duration(Seconds d) -> bool {
  return std::isfinite(d.count()) && d.count() > 0.0;
}

auto make_seed(std::optional<std::uint64_t> seed) -> std::uint64_t {
  if (seed.has_value()) {
    return *seed;
  }
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

RatePattern::RatePattern(Params params, std::shared_ptr<RandomState> random)
    : params_{std::move(params)}, random_{std::move(random)} {}

// ─── Factories ──────────────────────────────────────────────────────────

auto RatePattern::constant(double rate) -> std::expected<RatePattern, Error> {
  if (!valid_rate(rate)) {
    return std::unexpected(
        configuration_error("constant rate must be non-negative"));
  }
  return RatePattern{ConstantRate{.rate = rate}};
}

auto RatePattern::ramp(double start, double end, Seconds ramp_duration)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(start) || !valid_rate(end)) {
    return std::unexpected(
        configuration_error("ramp rates must be non-negative"));
  }
  if (!valid_duration(ramp_duration)) {
    return std::unexpected(
        configuration_error("ramp_duration must be positive"));
  }
  return RatePattern{RampRate{
      .start_rate = start,
      .end_rate = end,
      .ramp_duration = ramp_duration,
  }};
}

auto RatePattern::spike(double baseline, double spike_rate,
                        Seconds spike_duration, Seconds interval)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(baseline) || !valid_rate(spike_rate)) {
    return std::unexpected(
        configuration_error("spike rates must be non-negative"));
  }
  if (!valid_duration(spike_duration)) {
    return std::unexpected(
        configuration_error("spike_duration must be positive"));
  }
  if (!valid_duration(interval)) {
    return std::unexpected(configuration_error("interval must be positive"));
  }
  return RatePattern{SpikeRate{
      .baseline_rate = baseline,
      .spike_rate = spike_rate,
      .spike_duration = spike_duration,
      .interval = interval,
  }};
}

auto RatePattern::burst(double initial_rate, double burst_rate,
                        Seconds burst_duration, Seconds delay)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(initial_rate) || !valid_rate(burst_rate)) {
    return std::unexpected(
        configuration_error("burst rates must be non-negative"));
  }
  if (!valid_duration(burst_duration)) {
    return std::unexpected(
        configuration_error("burst_duration must be positive"));
  }
  if (!std::isfinite(delay.count()) || delay.count() < 0.0) {
    return std::unexpected(configuration_error("delay must be non-negative"));
  }
  return RatePattern{BurstRate{
      .initial_rate = initial_rate,
      .burst_rate = burst_rate,
      .burst_duration = burst_duration,
      .delay = delay,
  }};
}

auto RatePattern::jittered(double target_rate, double jitter,
                           Distribution distribution,
                           std::optional<std::uint64_t> seed)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(target_rate)) {
    return std::unexpected(
        configuration_error("target_rate must be non-negative"));
  }
  if (!(jitter >= 0.0 && jitter < 1.0)) {
    return std::unexpected(configuration_error("jitter must be in [0, 1)"));
  }
  if (distribution == Distribution::Exponential) {
    return std::unexpected(configuration_error(
        "jitter distribution must be uniform or gaussian"));
  }
  return RatePattern{JitteredRate{.target_rate = target_rate,
                                  .jitter = jitter,
                                  .distribution = distribution},
                     std::make_shared<RandomState>(make_seed(seed))};
}

auto RatePattern::step_ladder(double start, double end, std::size_t steps,
                              Seconds step_duration)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(start) || !valid_rate(end)) {
    return std::unexpected(
        configuration_error("step rates must be non-negative"));
  }
  if (steps < 2) {
    return std::unexpected(configuration_error("steps must be at least 2"));
  }
  if (!valid_duration(step_duration)) {
    return std::unexpected(
        configuration_error("step_duration must be positive"));
  }
  return RatePattern{StepLadderRate{
      .start_rate = start,
      .end_rate = end,
      .steps = steps,
      .step_duration = step_duration,
  }};
}

auto RatePattern::chaos(ChaosParams params)
    -> std::expected<RatePattern, Error> {
  if (!valid_rate(params.min_rate) || !valid_rate(params.max_rate)) {
    return std::unexpected(
        configuration_error("chaos rates must be non-negative"));
  }
  if (params.min_rate > params.max_rate) {
    return std::unexpected(
        configuration_error("min_rate must not exceed max_rate"));
  }
  if (!std::isfinite(params.change_interval.count()) ||
      params.change_interval.count() < 0.0) {
    return std::unexpected(
        configuration_error("change_interval must be non-negative"));
  }
  return RatePattern{ChaosRate{
                         .min_rate = params.min_rate,
                         .max_rate = params.max_rate,
                         .distribution = params.distribution,
                         .change_interval = params.change_interval,
                     },
                     std::make_shared<RandomState>(make_seed(params.seed))};
}

auto RatePattern::curve(std::function<double(double)> fn)
    -> std::expected<RatePattern, Error> {
  if (!fn) {
    return std::unexpected(configuration_error("curve function is empty"));
  }
  return RatePattern{CurveRate{.fn = std::move(fn)}};
}

// ─── Evaluation ─────────────────────────────────────────────────────────

auto RatePattern::rate_at(Seconds elapsed) const -> double {
  const double t = std::max(0.0, elapsed.count());

  const double rate = std::visit(
      overloaded{
          [](const ConstantRate &p) { return p.rate; },
          [t](const RampRate &p) {
            const double progress =
                std::clamp(t / p.ramp_duration.count(), 0.0, 1.0);
            return p.start_rate + (p.end_rate - p.start_rate) * progress;
          },
          [t](const SpikeRate &p) {
            return std::fmod(t, p.interval.count()) < p.spike_duration.count()
                       ? p.spike_rate
                       : p.baseline_rate;
          },
          [t](const BurstRate &p) {
            const double begin = p.delay.count();
            const double end = begin + p.burst_duration.count();
            return (t >= begin && t < end) ? p.burst_rate : p.initial_rate;
          },
          [this](const JitteredRate &p) { return jittered_rate(p); },
          [t](const StepLadderRate &p) {
            auto index = static_cast<std::size_t>(t / p.step_duration.count());
            index = std::min(index, p.steps - 1);
            return p.start_rate + (p.end_rate - p.start_rate) *
                                      static_cast<double>(index) /
                                      static_cast<double>(p.steps - 1);
          },
          [this, t](const ChaosRate &p) { return chaos_rate(p, t); },
          [t](const CurveRate &p) { return p.fn(t); },
      },
      params_);

  if (!std::isfinite(rate) || rate < 0.0) {
    return 0.0;
  }
  return rate;
}

auto RatePattern::jittered_rate(const JitteredRate &p) const -> double {
  if (p.jitter == 0.0) {
    return p.target_rate;
  }
  double variation = 0.0;
  {
    std::lock_guard lock(random_->mutex);
    if (p.distribution == Distribution::Gaussian) {
      std::normal_distribution<double> d(0.0, p.jitter / 3.0);
      variation = std::clamp(d(random_->engine), -p.jitter, p.jitter);
    } else {
      std::uniform_real_distribution<double> d(-p.jitter, p.jitter);
      variation = d(random_->engine);
    }
  }
  return std::max(0.0, p.target_rate * (1.0 + variation));
}

auto RatePattern::chaos_rate(const ChaosRate &p, double t) const -> double {
  std::lock_guard lock(random_->mutex);
  if (p.change_interval.count() <= 0.0) {
    return draw_chaos(p);
  }
  const auto window =
      static_cast<std::int64_t>(t / p.change_interval.count());
  if (window != random_->window) {
    random_->window = window;
    random_->held = draw_chaos(p);
  }
  return random_->held;
}

// Caller holds random_->mutex.
auto RatePattern::draw_chaos(const ChaosRate &p) const -> double {
  auto &engine = random_->engine;
  const double span = p.max_rate - p.min_rate;
  if (span <= 0.0) {
    return p.min_rate;
  }
  switch (p.distribution) {
  case Distribution::Gaussian: {
    std::normal_distribution<double> d((p.min_rate + p.max_rate) / 2.0,
                                       span / 6.0);
    return std::clamp(d(engine), p.min_rate, p.max_rate);
  }
  case Distribution::Exponential: {
    std::exponential_distribution<double> d(1.0 / (span / 5.0));
    return std::min(p.min_rate + d(engine), p.max_rate);
  }
  case Distribution::Uniform:
    break;
  }
  std::uniform_real_distribution<double> d(p.min_rate, p.max_rate);
  return d(engine);
}

// ─── Introspection ──────────────────────────────────────────────────────

auto RatePattern::kind() const noexcept -> PatternKind {
  return static_cast<PatternKind>(params_.index());
}

auto RatePattern::params() const noexcept -> const Params & {
  return params_;
}

auto RatePattern::describe() const -> std::string {
  std::ostringstream os;
  std::visit(
      overloaded{
          [&](const ConstantRate &p) { os << "constant(" << p.rate << "/s)"; },
          [&](const RampRate &p) {
            os << "ramp(" << p.start_rate << " -> " << p.end_rate << " over "
               << p.ramp_duration.count() << "s)";
          },
          [&](const SpikeRate &p) {
            os << "spike(" << p.baseline_rate << "/s, " << p.spike_rate
               << "/s for " << p.spike_duration.count() << "s every "
               << p.interval.count() << "s)";
          },
          [&](const BurstRate &p) {
            os << "burst(" << p.initial_rate << "/s, " << p.burst_rate
               << "/s for " << p.burst_duration.count() << "s after "
               << p.delay.count() << "s)";
          },
          [&](const JitteredRate &p) {
            os << "steady(" << p.target_rate << "/s +/-" << p.jitter * 100.0
               << "%)";
          },
          [&](const StepLadderRate &p) {
            os << "step(" << p.start_rate << " -> " << p.end_rate << " in "
               << p.steps << " steps of " << p.step_duration.count() << "s)";
          },
          [&](const ChaosRate &p) {
            os << "chaos(" << p.min_rate << ".." << p.max_rate << "/s)";
          },
          [&](const CurveRate &) { os << "curve"; },
      },
      params_);
  return os.str();
}

} // namespace surge
