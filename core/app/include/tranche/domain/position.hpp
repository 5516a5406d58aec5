#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/time/timestamp.hpp"

#include <optional>
#include <string>

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// PositionSnapshot: read-only view of one PositionManager book
// -----------------------------------------------------------------------------
//
// @details
// Sign convention for current_position:
//   positive → long, negative → short, zero → flat.
//
// average_price is the volume-weighted entry price of the open aggregate
// position. It is only meaningful while current_position != 0, so it is
// empty when flat.
//
// Snapshots are copied out under a shared lock and carried in
// PositionUpdateEvent and IPC STATUS replies; they never alias engine state.
// -----------------------------------------------------------------------------
struct PositionSnapshot {
  std::string book;                     // "theo" or "actual"
  Quantity current_position{0};         // Signed aggregate position
  std::optional<double> average_price;  // Empty while flat
  double realized_pnl{0.0};             // Cumulative since reset()
  double unrealized_pnl{0.0};           // As of the last mark
  double last_price{0.0};               // Last fill or mark price
  Timestamp first_entry_time{};
  Timestamp last_entry_time{};
  std::size_t completed_cycles{0};
};

}  // namespace domain
}  // namespace tranche
