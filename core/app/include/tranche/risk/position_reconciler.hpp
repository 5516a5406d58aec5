#pragma once

#include "tranche/risk/i_reconciler.hpp"

namespace tranche {

// Reconciles by position only: the correction is the signed difference of
// the two books' current positions. Average prices and PnL are not compared;
// the actual book carries the broker's prices by construction.
class PositionReconciler final : public IReconciler {
 public:
  domain::Quantity discrepancy(const PositionManager& theo,
                               const PositionManager& actual) const override;

  std::optional<domain::OrderRequest> proposeCorrection(
      const PositionManager& theo, const PositionManager& actual,
      const std::string& instrument, double price) const override;
};

}  // namespace tranche
