#include "ordex/execution/reprice_policy.hpp"

#include <cmath>
#include <utility>

namespace ordex {

namespace {

// Absorbs binary rounding so a change of exactly the threshold (e.g. 100 ->
// 101 at 1%) compares as inclusive.
constexpr double kThresholdTolerance = 1e-12;

}  // namespace

bool AlwaysRepricePolicy::should_reprice(double, double, double) const {
  return true;
}

MinChangeRepricePolicy::MinChangeRepricePolicy(double min_change_pct)
    : min_change_pct_(min_change_pct) {}

bool MinChangeRepricePolicy::should_reprice(double old_price, double new_price,
                                            double) const {
  if (old_price == 0.0) {
    return new_price != 0.0;
  }
  double change_pct = std::fabs(new_price - old_price) / old_price;
  return change_pct + kThresholdTolerance >= min_change_pct_;
}

ElapsedOverrideRepricePolicy::ElapsedOverrideRepricePolicy(
    double override_after_seconds, std::unique_ptr<IRepricePolicy> inner)
    : override_after_seconds_(override_after_seconds),
      inner_(std::move(inner)) {}

bool ElapsedOverrideRepricePolicy::should_reprice(
    double old_price, double new_price, double elapsed_seconds) const {
  if (elapsed_seconds >= override_after_seconds_) {
    return old_price != new_price;
  }
  return inner_->should_reprice(old_price, new_price, elapsed_seconds);
}

CompositeRepricePolicy::CompositeRepricePolicy(
    std::vector<std::unique_ptr<IRepricePolicy>> policies)
    : policies_(std::move(policies)) {}

bool CompositeRepricePolicy::should_reprice(double old_price, double new_price,
                                            double elapsed_seconds) const {
  for (const auto& policy : policies_) {
    if (!policy->should_reprice(old_price, new_price, elapsed_seconds)) {
      return false;
    }
  }
  return true;
}

std::unique_ptr<IRepricePolicy> build_reprice_policy(
    const ExecutorConfig& config) {
  const bool has_min_change = config.min_reprice_threshold_pct > 0.0;
  const bool has_elapsed = config.reprice_override_after_seconds > 0.0;

  if (!has_min_change && !has_elapsed) {
    return std::make_unique<AlwaysRepricePolicy>();
  }
  if (!has_elapsed) {
    return std::make_unique<MinChangeRepricePolicy>(
        config.min_reprice_threshold_pct);
  }

  std::unique_ptr<IRepricePolicy> inner;
  if (has_min_change) {
    inner = std::make_unique<MinChangeRepricePolicy>(
        config.min_reprice_threshold_pct);
  } else {
    inner = std::make_unique<AlwaysRepricePolicy>();
  }
  return std::make_unique<ElapsedOverrideRepricePolicy>(
      config.reprice_override_after_seconds, std::move(inner));
}

}  // namespace ordex
