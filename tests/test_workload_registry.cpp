/// @file test_workload_registry.cpp
/// @brief Unit tests for WorkloadRegistry weighted selection.

#include "workload/function_workload.hpp"
#include "workload/workload_registry.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <map>
#include <string>

using namespace surge;

namespace {

auto named(const std::string &name) -> std::shared_ptr<Workload> {
  return std::make_shared<FunctionWorkload>(name,
                                            [](ExecutionContext &) {});
}

} // namespace

class WorkloadRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.add(named("a"), 80.0).has_value());
    ASSERT_TRUE(registry_.add(named("b"), 20.0).has_value());
    ASSERT_TRUE(registry_.freeze().has_value());
  }

  WorkloadRegistry registry_;
  WorkloadRegistry::Engine engine_{12345};
};

TEST_F(WorkloadRegistryTest, WeightedSplitOverTenThousandDraws) {
  std::map<std::string, int> counts;
  for (int i = 0; i < 10'000; ++i) {
    ++counts[std::string{registry_.select(engine_).workload->name()}];
  }
  EXPECT_NEAR(counts["a"], 8000, 300);
  EXPECT_NEAR(counts["b"], 2000, 300);
}

TEST_F(WorkloadRegistryTest, Probabilities) {
  EXPECT_DOUBLE_EQ(registry_.total_weight(), 100.0);
  EXPECT_DOUBLE_EQ(registry_.probability(0), 0.8);
  EXPECT_DOUBLE_EQ(registry_.probability(1), 0.2);
  EXPECT_DOUBLE_EQ(registry_.probability(2), 0.0);
}

TEST_F(WorkloadRegistryTest, AddAfterFreezeIsStateError) {
  auto r = registry_.add(named("c"), 1.0);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::State);
  EXPECT_EQ(registry_.size(), 2u);
}

TEST(WorkloadRegistryValidation, RejectsBadWeights) {
  WorkloadRegistry registry;
  for (double w : {0.0, -1.0, std::numeric_limits<double>::infinity(),
                   std::numeric_limits<double>::quiet_NaN()}) {
    auto r = registry.add(named("x"), w);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Configuration);
  }
  auto null = registry.add(nullptr, 1.0);
  ASSERT_FALSE(null.has_value());
  EXPECT_EQ(null.error().kind, ErrorKind::Configuration);
  EXPECT_TRUE(registry.empty());
}

TEST(WorkloadRegistryValidation, FreezeRequiresEntries) {
  WorkloadRegistry registry;
  auto r = registry.freeze();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::Configuration);
  EXPECT_FALSE(registry.frozen());
}

TEST(WorkloadRegistryValidation, SingleEntryAlwaysSelected) {
  WorkloadRegistry registry;
  ASSERT_TRUE(registry.add(named("only"), 0.5).has_value());
  ASSERT_TRUE(registry.freeze().has_value());
  WorkloadRegistry::Engine engine{1};
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(registry.select(engine).workload->name(), "only");
  }
}

TEST(WorkloadRegistryValidation, ManyEntriesFollowWeights) {
  WorkloadRegistry registry;
  for (int i = 1; i <= 10; ++i) {
    ASSERT_TRUE(
        registry.add(named("w" + std::to_string(i)), static_cast<double>(i))
            .has_value());
  }
  ASSERT_TRUE(registry.freeze().has_value());

  WorkloadRegistry::Engine engine{99};
  std::map<std::string, int> counts;
  constexpr int kDraws = 55'000;
  for (int i = 0; i < kDraws; ++i) {
    ++counts[std::string{registry.select(engine).workload->name()}];
  }
  for (int i = 1; i <= 10; ++i) {
    const double expected = kDraws * registry.probability(i - 1);
    EXPECT_NEAR(counts["w" + std::to_string(i)], expected, expected * 0.15);
  }
}
