#include "tranche/risk/position_reconciler.hpp"

#include <cstdlib>
#include <iostream>

namespace tranche {

domain::Quantity PositionReconciler::discrepancy(
    const PositionManager& theo, const PositionManager& actual) const {
  return theo.currentPosition() - actual.currentPosition();
}

std::optional<domain::OrderRequest> PositionReconciler::proposeCorrection(
    const PositionManager& theo, const PositionManager& actual,
    const std::string& instrument, double price) const {
  const domain::Quantity theo_position = theo.currentPosition();
  const domain::Quantity actual_position = actual.currentPosition();
  const domain::Quantity gap = theo_position - actual_position;
  if (gap == 0) {
    return std::nullopt;
  }

  std::cout << "[PositionReconciler] Position discrepancy: theo="
            << theo_position << " actual=" << actual_position
            << " diff=" << gap << "\n";

  domain::OrderRequest request;
  request.side = gap > 0 ? domain::Side::Buy : domain::Side::Sell;
  request.quantity = std::llabs(gap);
  request.limit_price = price;
  request.instrument = instrument;
  return request;
}

}  // namespace tranche
