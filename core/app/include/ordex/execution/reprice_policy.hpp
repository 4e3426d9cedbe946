#pragma once

#include "ordex/config/executor_config.hpp"

#include <memory>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// IRepricePolicy
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a resting maker order should be cancelled and
//         replaced at a new price.
//
// @details
// Consulted by both executors each time the book moves while an order rests.
// Every cancel-and-replace costs two venue round-trips and loses queue
// priority, so small moves can be suppressed. Implementations are pure and
// stateless: safe to share between concurrent orders.
// -----------------------------------------------------------------------------
class IRepricePolicy {
 public:
  virtual ~IRepricePolicy() = default;

  // -------------------------------------------------------------------------
  // should_reprice(old_price, new_price, elapsed_seconds)
  // -------------------------------------------------------------------------
  // @param  old_price        Price the order currently rests at (0 if none).
  // @param  new_price        Price the latest book suggests.
  // @param  elapsed_seconds  Age of the order execution.
  // @return true if the cancel-and-replace should proceed.
  // -------------------------------------------------------------------------
  virtual bool should_reprice(double old_price, double new_price,
                              double elapsed_seconds) const = 0;
};

// Always reprices. Used when no threshold is configured.
class AlwaysRepricePolicy final : public IRepricePolicy {
 public:
  bool should_reprice(double old_price, double new_price,
                      double elapsed_seconds) const override;
};

// -----------------------------------------------------------------------------
// MinChangeRepricePolicy
// -----------------------------------------------------------------------------
// Reprices when |new - old| / old >= min_change_pct (inclusive). With no
// current price (old == 0) it reprices iff the new price is non-zero.
// -----------------------------------------------------------------------------
class MinChangeRepricePolicy final : public IRepricePolicy {
 public:
  explicit MinChangeRepricePolicy(double min_change_pct);

  bool should_reprice(double old_price, double new_price,
                      double elapsed_seconds) const override;

  double min_change_pct() const { return min_change_pct_; }

 private:
  double min_change_pct_;
};

// -----------------------------------------------------------------------------
// ElapsedOverrideRepricePolicy
// -----------------------------------------------------------------------------
// Once the order is at least `override_after_seconds` old, any actual price
// change reprices. Before that the inner policy decides.
// -----------------------------------------------------------------------------
class ElapsedOverrideRepricePolicy final : public IRepricePolicy {
 public:
  ElapsedOverrideRepricePolicy(double override_after_seconds,
                               std::unique_ptr<IRepricePolicy> inner);

  bool should_reprice(double old_price, double new_price,
                      double elapsed_seconds) const override;

 private:
  double override_after_seconds_;
  std::unique_ptr<IRepricePolicy> inner_;
};

// Logical AND of every constituent policy. Empty composite reprices.
class CompositeRepricePolicy final : public IRepricePolicy {
 public:
  explicit CompositeRepricePolicy(
      std::vector<std::unique_ptr<IRepricePolicy>> policies);

  bool should_reprice(double old_price, double new_price,
                      double elapsed_seconds) const override;

 private:
  std::vector<std::unique_ptr<IRepricePolicy>> policies_;
};

// -------------------------------------------------------------------------
// build_reprice_policy
// -------------------------------------------------------------------------
//   no thresholds           -> AlwaysRepricePolicy
//   min change only         -> MinChangeRepricePolicy
//   min change and elapsed  -> ElapsedOverride(MinChange)
//   elapsed only            -> ElapsedOverride(Always)
// -------------------------------------------------------------------------
std::unique_ptr<IRepricePolicy> build_reprice_policy(
    const ExecutorConfig& config);

}  // namespace ordex
