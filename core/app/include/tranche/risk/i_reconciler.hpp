#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/position/position_manager.hpp"

#include <optional>
#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// IReconciler
// -----------------------------------------------------------------------------
//
// @brief  Compares the theoretical book (what the Levels say we hold) with
//         the actual book (what the broker filled) and proposes an order
//         that brings actual back in line.
//
// @details
// Kept outside the Level/Position data model: LevelEngine decides whether to
// act on a proposal (EngineConfig::reconcile_positions) and only does so
// while no order is live, so a correction never races an in-flight entry or
// exit.
//
// Thread model:
//   Implementations only read the two books through their thread-safe
//   queries; they hold no state of their own that needs locking.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  // theo position - actual position. Positive: actual is short of theo.
  virtual domain::Quantity discrepancy(const PositionManager& theo,
                                       const PositionManager& actual) const = 0;

  // -------------------------------------------------------------------------
  // proposeCorrection(theo, actual, instrument, price)
  // -------------------------------------------------------------------------
  // @return An OrderRequest for |discrepancy| units on the side that closes
  //         the gap, limited at `price`; std::nullopt when the books agree.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::OrderRequest> proposeCorrection(
      const PositionManager& theo, const PositionManager& actual,
      const std::string& instrument, double price) const = 0;
};

}  // namespace tranche
