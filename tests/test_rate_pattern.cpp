/// @file test_rate_pattern.cpp
/// @brief Unit tests for RatePattern variants.

#include "pattern/rate_pattern.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace surge;

namespace {

auto at(const RatePattern &p, double t) -> double {
  return p.rate_at(Seconds{t});
}

} // namespace

TEST(RatePatternTest, ConstantIsFlat) {
  auto p = RatePattern::constant(25.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->kind(), PatternKind::Constant);
  EXPECT_DOUBLE_EQ(at(*p, 0.0), 25.0);
  EXPECT_DOUBLE_EQ(at(*p, 1234.5), 25.0);
}

TEST(RatePatternTest, RampInterpolatesAndHolds) {
  auto p = RatePattern::ramp(5.0, 50.0, Seconds{60.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 0.0), 5.0);
  EXPECT_DOUBLE_EQ(at(*p, 30.0), 27.5);
  EXPECT_DOUBLE_EQ(at(*p, 60.0), 50.0);
  EXPECT_DOUBLE_EQ(at(*p, 61.0), 50.0);
  EXPECT_DOUBLE_EQ(at(*p, 600.0), 50.0);
}

TEST(RatePatternTest, RampDown) {
  auto p = RatePattern::ramp(100.0, 0.0, Seconds{10.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 5.0), 50.0);
  EXPECT_DOUBLE_EQ(at(*p, 20.0), 0.0);
}

TEST(RatePatternTest, NegativeElapsedIsTreatedAsZero) {
  auto p = RatePattern::ramp(5.0, 50.0, Seconds{60.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, -10.0), 5.0);
}

TEST(RatePatternTest, SpikeRepeatsEveryInterval) {
  auto p = RatePattern::spike(10.0, 200.0, Seconds{2.0}, Seconds{10.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 0.0), 200.0);
  EXPECT_DOUBLE_EQ(at(*p, 1.9), 200.0);
  EXPECT_DOUBLE_EQ(at(*p, 2.0), 10.0);
  EXPECT_DOUBLE_EQ(at(*p, 9.9), 10.0);
  EXPECT_DOUBLE_EQ(at(*p, 10.5), 200.0);
  EXPECT_DOUBLE_EQ(at(*p, 25.0), 10.0);
}

TEST(RatePatternTest, BurstHappensOnce) {
  auto p = RatePattern::burst(5.0, 500.0, Seconds{3.0}, Seconds{10.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 9.99), 5.0);
  EXPECT_DOUBLE_EQ(at(*p, 10.0), 500.0);
  EXPECT_DOUBLE_EQ(at(*p, 12.9), 500.0);
  EXPECT_DOUBLE_EQ(at(*p, 13.0), 5.0);
  EXPECT_DOUBLE_EQ(at(*p, 40.0), 5.0);
}

TEST(RatePatternTest, StepLadderLevels) {
  auto p = RatePattern::step_ladder(10.0, 50.0, 5, Seconds{4.0});
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(at(*p, 4.0), 20.0);
  EXPECT_DOUBLE_EQ(at(*p, 9.0), 30.0);
  EXPECT_DOUBLE_EQ(at(*p, 16.0), 50.0);
  EXPECT_DOUBLE_EQ(at(*p, 100.0), 50.0);
}

TEST(RatePatternTest, JitterStaysWithinBand) {
  auto p = RatePattern::jittered(100.0, 0.2, Distribution::Uniform, 42);
  ASSERT_TRUE(p.has_value());
  for (int i = 0; i < 1000; ++i) {
    const double r = at(*p, i * 0.01);
    EXPECT_GE(r, 80.0);
    EXPECT_LE(r, 120.0);
  }
}

TEST(RatePatternTest, GaussianJitterStaysWithinBand) {
  auto p = RatePattern::jittered(50.0, 0.5, Distribution::Gaussian, 7);
  ASSERT_TRUE(p.has_value());
  for (int i = 0; i < 1000; ++i) {
    const double r = at(*p, 1.0);
    EXPECT_GE(r, 25.0);
    EXPECT_LE(r, 75.0);
  }
}

TEST(RatePatternTest, ZeroJitterIsExact) {
  auto p = RatePattern::jittered(42.0, 0.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 3.0), 42.0);
}

TEST(RatePatternTest, SeededPatternsAreReproducible) {
  auto a = RatePattern::chaos({.min_rate = 1.0, .max_rate = 100.0, .seed = 9});
  auto b = RatePattern::chaos({.min_rate = 1.0, .max_rate = 100.0, .seed = 9});
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  for (int i = 0; i < 50; ++i) {
    EXPECT_DOUBLE_EQ(at(*a, i), at(*b, i));
  }
}

TEST(RatePatternTest, ChaosHoldsValueWithinWindow) {
  auto p = RatePattern::chaos({.min_rate = 10.0,
                               .max_rate = 500.0,
                               .change_interval = Seconds{5.0},
                               .seed = 3});
  ASSERT_TRUE(p.has_value());
  const double first = at(*p, 0.5);
  EXPECT_DOUBLE_EQ(at(*p, 1.0), first);
  EXPECT_DOUBLE_EQ(at(*p, 4.9), first);
}

TEST(RatePatternTest, ChaosStaysInRangeForEveryDistribution) {
  for (auto dist : {Distribution::Uniform, Distribution::Gaussian,
                    Distribution::Exponential}) {
    auto p = RatePattern::chaos(
        {.min_rate = 10.0, .max_rate = 20.0, .distribution = dist, .seed = 1});
    ASSERT_TRUE(p.has_value());
    for (int i = 0; i < 500; ++i) {
      const double r = at(*p, i);
      EXPECT_GE(r, 10.0);
      EXPECT_LE(r, 20.0);
    }
  }
}

TEST(RatePatternTest, CurveIsFlooredAtZero) {
  auto p = RatePattern::curve([](double t) { return 10.0 - t; });
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(at(*p, 4.0), 6.0);
  EXPECT_DOUBLE_EQ(at(*p, 20.0), 0.0);

  auto nan = RatePattern::curve(
      [](double) { return std::numeric_limits<double>::quiet_NaN(); });
  ASSERT_TRUE(nan.has_value());
  EXPECT_DOUBLE_EQ(at(*nan, 1.0), 0.0);
}

TEST(RatePatternTest, RateIsNeverNegative) {
  std::vector<RatePattern> patterns;
  patterns.push_back(*RatePattern::constant(0.0));
  patterns.push_back(*RatePattern::ramp(0.0, 10.0, Seconds{1.0}));
  patterns.push_back(*RatePattern::spike(0.0, 10.0, Seconds{1.0}, Seconds{2.0}));
  patterns.push_back(*RatePattern::burst(0.0, 10.0, Seconds{1.0}, Seconds{0.0}));
  patterns.push_back(*RatePattern::jittered(1.0, 0.99, Distribution::Gaussian, 5));
  patterns.push_back(*RatePattern::step_ladder(10.0, 0.0, 3, Seconds{1.0}));
  patterns.push_back(*RatePattern::chaos({.min_rate = 0.0, .max_rate = 1.0}));
  for (const auto &p : patterns) {
    for (double t = 0.0; t < 10.0; t += 0.25) {
      EXPECT_GE(at(p, t), 0.0) << p.describe() << " at " << t;
    }
  }
}

TEST(RatePatternTest, InvalidParametersAreConfigurationErrors) {
  auto expect_config_error = [](const auto &r) {
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Configuration);
  };
  expect_config_error(RatePattern::constant(-1.0));
  expect_config_error(
      RatePattern::constant(std::numeric_limits<double>::infinity()));
  expect_config_error(RatePattern::ramp(1.0, 2.0, Seconds{0.0}));
  expect_config_error(RatePattern::ramp(-1.0, 2.0, Seconds{1.0}));
  expect_config_error(RatePattern::spike(1.0, 2.0, Seconds{1.0}, Seconds{0.0}));
  expect_config_error(RatePattern::burst(1.0, 2.0, Seconds{1.0}, Seconds{-1.0}));
  expect_config_error(RatePattern::jittered(10.0, 1.0));
  expect_config_error(
      RatePattern::jittered(10.0, 0.1, Distribution::Exponential));
  expect_config_error(RatePattern::step_ladder(1.0, 2.0, 1, Seconds{1.0}));
  expect_config_error(
      RatePattern::chaos({.min_rate = 50.0, .max_rate = 10.0}));
  expect_config_error(RatePattern::curve({}));
}

TEST(RatePatternTest, DescribeNamesTheVariant) {
  EXPECT_EQ(RatePattern::ramp(5.0, 50.0, Seconds{60.0})->describe(),
            "ramp(5 -> 50 over 60s)");
  EXPECT_EQ(RatePattern::constant(10.0)->describe(), "constant(10/s)");
}
