// =============================================================================
// reprice_policy_test.cpp
// =============================================================================
// Unit tests for the IRepricePolicy family and build_reprice_policy().
//
// Validates:
//   - AlwaysRepricePolicy approves everything
//   - MinChangeRepricePolicy threshold (inclusive) and the zero-old-price case
//   - ElapsedOverrideRepricePolicy bypasses its inner policy once old enough
//   - CompositeRepricePolicy requires every member to approve
//   - build_reprice_policy() picks the right shape from the config
// =============================================================================

#include "ordex/execution/reprice_policy.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

using namespace ordex;

// -----------------------------------------------------------------------------
// 1. Always means always.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, AlwaysApproves) {
  AlwaysRepricePolicy policy;
  EXPECT_TRUE(policy.should_reprice(100.0, 100.0, 0.0));
  EXPECT_TRUE(policy.should_reprice(100.0, 100.01, 5.0));
}

// -----------------------------------------------------------------------------
// 2. A 0.5% move does not clear a 1% threshold; a 1% move does.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, MinChangeThreshold) {
  MinChangeRepricePolicy policy(0.01);
  EXPECT_FALSE(policy.should_reprice(100.0, 100.5, 0.0));
  EXPECT_TRUE(policy.should_reprice(100.0, 101.0, 0.0));
  EXPECT_TRUE(policy.should_reprice(100.0, 99.0, 0.0));
  EXPECT_DOUBLE_EQ(policy.min_change_pct(), 0.01);
}

// -----------------------------------------------------------------------------
// 3. Without an old price any non-zero new price is a change.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, MinChangeWithoutOldPrice) {
  MinChangeRepricePolicy policy(0.5);
  EXPECT_TRUE(policy.should_reprice(0.0, 10.0, 0.0));
  EXPECT_FALSE(policy.should_reprice(0.0, 0.0, 0.0));
}

// -----------------------------------------------------------------------------
// 4. Before the override age the inner policy decides; after it, any
//    difference is enough.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, ElapsedOverride) {
  ElapsedOverrideRepricePolicy policy(
      30.0, std::make_unique<MinChangeRepricePolicy>(0.01));

  EXPECT_FALSE(policy.should_reprice(100.0, 100.3, 10.0));
  EXPECT_TRUE(policy.should_reprice(100.0, 100.3, 30.0));
  EXPECT_FALSE(policy.should_reprice(100.0, 100.0, 45.0));
}

// -----------------------------------------------------------------------------
// 5. Composite is a logical AND.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, CompositeRequiresAll) {
  std::vector<std::unique_ptr<IRepricePolicy>> policies;
  policies.push_back(std::make_unique<AlwaysRepricePolicy>());
  policies.push_back(std::make_unique<MinChangeRepricePolicy>(0.02));
  CompositeRepricePolicy policy(std::move(policies));

  EXPECT_FALSE(policy.should_reprice(100.0, 101.0, 0.0));
  EXPECT_TRUE(policy.should_reprice(100.0, 102.0, 0.0));
}

// -----------------------------------------------------------------------------
// 6. Config -> policy.
// -----------------------------------------------------------------------------
TEST(RepricePolicyTest, BuildFromConfig) {
  ExecutorConfig config;
  auto always = build_reprice_policy(config);
  EXPECT_TRUE(always->should_reprice(100.0, 100.001, 0.0));

  config.min_reprice_threshold_pct = 0.01;
  auto min_change = build_reprice_policy(config);
  EXPECT_FALSE(min_change->should_reprice(100.0, 100.5, 1000.0));

  config.reprice_override_after_seconds = 60.0;
  auto with_override = build_reprice_policy(config);
  EXPECT_FALSE(with_override->should_reprice(100.0, 100.5, 59.0));
  EXPECT_TRUE(with_override->should_reprice(100.0, 100.5, 60.0));

  config.min_reprice_threshold_pct = 0.0;
  auto override_only = build_reprice_policy(config);
  EXPECT_TRUE(override_only->should_reprice(100.0, 100.5, 1.0));
}
