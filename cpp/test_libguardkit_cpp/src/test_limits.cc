#include <gtest/gtest.h>
#include <stdint.h>
#include <stdlib.h>

#include "guardkit/guardkit.hpp"

namespace {

using guardkit::ErrorCode;
using guardkit::ResourceLimits;

static ResourceLimits SmallLimits() {
  ResourceLimits l = ResourceLimits::Defaults();
  l.max_dimension = 1000;
  l.max_image_bytes = 1000 * 1000 * 4;
  l.max_expansion_ratio = 10;
  l.max_expanded_bytes = 1000;
  return l;
}

TEST(Dimensions, Case001_AcceptsWithinLimits) {
  auto r = guardkit::CheckDimensions(1000, 1000, 4, SmallLimits());
  ASSERT_TRUE(r) << r.Message();
  EXPECT_EQ(*r, 4000000u);
}

TEST(Dimensions, Case002_RejectsZeroAndOversizedSides) {
  EXPECT_EQ(guardkit::CheckDimensions(0, 10, 4, SmallLimits()).Code(),
            ErrorCode::kInvalidArgument);
  EXPECT_EQ(guardkit::CheckDimensions(10, 10, 0, SmallLimits()).Code(),
            ErrorCode::kInvalidArgument);
  EXPECT_EQ(guardkit::CheckDimensions(1001, 10, 4, SmallLimits()).Code(),
            ErrorCode::kLimitExceeded);
  EXPECT_EQ(guardkit::CheckDimensions(10, 1001, 4, SmallLimits()).Code(),
            ErrorCode::kLimitExceeded);
}

TEST(Dimensions, Case003_RejectsTotalOverLimit) {
  auto r = guardkit::CheckDimensions(1000, 1000, 5, SmallLimits());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.Code(), ErrorCode::kLimitExceeded);
}

/**
 * @brief Case004: Size product that overflows 64 bits.
 *
 * Purpose:
 * - A declared size whose product wraps must not pass as a small buffer.
 * Steps:
 * - Lift every ceiling to UINT64_MAX; declare 2^32 x 2^32 x 1.
 * Expected:
 * - kOverflow, not a wrapped byte count.
 */
TEST(Dimensions, Case004_ProductOverflow) {
  ResourceLimits l = ResourceLimits::Defaults();
  l.max_dimension = UINT64_MAX;
  l.max_image_bytes = UINT64_MAX;
  auto r = guardkit::CheckDimensions(UINT64_C(1) << 32, UINT64_C(1) << 32, 1, l);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.Code(), ErrorCode::kOverflow);
}

TEST(Expansion, Case010_RatioEnforced) {
  guardkit::ExpansionMeter meter(SmallLimits());
  ASSERT_TRUE(meter.AddInput(10));
  ASSERT_TRUE(meter.AddOutput(100));
  EXPECT_DOUBLE_EQ(meter.Ratio(), 10.0);

  auto r = meter.AddOutput(1);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.Code(), ErrorCode::kExpansionExceeded);
  EXPECT_EQ(meter.Output(), 100u);

  ASSERT_TRUE(meter.AddInput(1));
  EXPECT_TRUE(meter.AddOutput(10));
}

TEST(Expansion, Case011_OutputBeforeInputRejected) {
  guardkit::ExpansionMeter meter(SmallLimits());
  EXPECT_EQ(meter.AddOutput(1).Code(), ErrorCode::kExpansionExceeded);
  EXPECT_DOUBLE_EQ(meter.Ratio(), 0.0);
}

TEST(Expansion, Case012_AbsoluteCeiling) {
  ResourceLimits l = SmallLimits();
  l.max_expansion_ratio = 0;  // ratio check off
  guardkit::ExpansionMeter meter(l);
  ASSERT_TRUE(meter.AddOutput(1000));
  auto r = meter.AddOutput(1);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.Code(), ErrorCode::kLimitExceeded);
  EXPECT_EQ(meter.Output(), 1000u);
}

TEST(Expansion, Case013_InputCounterOverflow) {
  guardkit::ExpansionMeter meter(SmallLimits());
  ASSERT_TRUE(meter.AddInput(UINT64_MAX));
  EXPECT_EQ(meter.AddInput(1).Code(), ErrorCode::kOverflow);
  // allowance input * ratio overflows; only the absolute ceiling applies
  EXPECT_TRUE(meter.AddOutput(1000));
}

/**
 * @brief Case020: A loop over malformed input stops at the budget.
 *
 * Steps:
 * - Walk a "linked list" whose next index points back at itself, stepping
 *   the budget on each hop.
 * Expected:
 * - The walk ends with kIterationLimit after exactly max steps.
 */
TEST(Iteration, Case020_CyclicInputTerminates) {
  const int next[] = {1, 2, 1};
  guardkit::IterationBudget budget(50);
  int node = 0;
  int hops = 0;
  guardkit::Result<void> r;
  while (node >= 0) {
    r = budget.Step();
    if (!r) break;
    node = next[node];
    ++hops;
  }
  EXPECT_EQ(r.Code(), ErrorCode::kIterationLimit);
  EXPECT_EQ(hops, 50);
  EXPECT_EQ(budget.Remaining(), 0u);

  budget.Reset();
  EXPECT_EQ(budget.Remaining(), 50u);
  EXPECT_TRUE(budget.Step());
}

TEST(Iteration, Case021_CeilingFromLimits) {
  ResourceLimits l = ResourceLimits::Defaults();
  l.max_iterations = 3;
  guardkit::IterationBudget budget(l);
  EXPECT_EQ(budget.Remaining(), 3u);
  for (int i = 0; i < 3; ++i) ASSERT_TRUE(budget.Step());
  guardkit::Result<void> r = budget.Step();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.Code(), ErrorCode::kIterationLimit);

  guardkit::IterationBudget defaults(ResourceLimits::Defaults());
  EXPECT_EQ(defaults.Remaining(), 1000000u);
}

class LimitsEnv : public ::testing::Test {
 protected:
  void TearDown() override {
    unsetenv("GUARDKIT_MAX_OUTPUT_BYTES");
    unsetenv("GUARDKIT_MAX_DIMENSION");
    unsetenv("GUARDKIT_MAX_LOG_BYTES");
  }
};

TEST_F(LimitsEnv, Case030_DefaultsWithoutEnvironment) {
  unsetenv("GUARDKIT_MAX_OUTPUT_BYTES");
  auto r = guardkit::LoadLimitsFromEnv();
  ASSERT_TRUE(r) << r.Message();
  const ResourceLimits d = ResourceLimits::Defaults();
  EXPECT_EQ(r->max_output_bytes, d.max_output_bytes);
  EXPECT_EQ(r->max_dimension, 16384u);
  EXPECT_EQ(r->max_iterations, 1000000u);
}

TEST_F(LimitsEnv, Case031_Overrides) {
  ASSERT_EQ(setenv("GUARDKIT_MAX_OUTPUT_BYTES", "4096", 1), 0);
  ASSERT_EQ(setenv("GUARDKIT_MAX_DIMENSION", "18446744073709551615", 1), 0);
  auto r = guardkit::LoadLimitsFromEnv();
  ASSERT_TRUE(r) << r.Message();
  EXPECT_EQ(r->max_output_bytes, 4096u);
  EXPECT_EQ(r->max_dimension, UINT64_MAX);
  EXPECT_EQ(r->max_log_bytes, ResourceLimits::Defaults().max_log_bytes);
}

TEST_F(LimitsEnv, Case032_RejectsMalformedValues) {
  const char* bad[] = {"", "-1", " 12", "12kb", "18446744073709551616"};
  for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
    ASSERT_EQ(setenv("GUARDKIT_MAX_LOG_BYTES", bad[i], 1), 0);
    auto r = guardkit::LoadLimitsFromEnv();
    ASSERT_FALSE(r) << "accepted '" << bad[i] << "'";
    EXPECT_EQ(r.Code(), ErrorCode::kInvalidArgument);
    EXPECT_NE(r.Message().find("GUARDKIT_MAX_LOG_BYTES"), std::string::npos);
  }
}

}  // namespace
