#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/time/timestamp.hpp"

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// TradeCycleRecord: audit record of one completed flat-to-flat cycle
// -----------------------------------------------------------------------------
//
// @details
// Produced by TradeMetrics::toRecord() when a PositionManager closes its
// aggregate position, published once in CycleCompletedEvent and appended
// once to the audit log. Records are never rewritten.
//
// Units:
//   cycle_time_minutes, time_since_last_fill_minutes: minutes.
//   average_price_delta: price units, measured from the cycle's first entry
//                         price (positive = favourable).
//   pnl: sum of the PnL realized by every reducing fill of the cycle.
// -----------------------------------------------------------------------------
struct TradeCycleRecord {
  Timestamp first_fill{};
  Timestamp last_fill{};
  Side side{Side::Buy};
  double average_price{0.0};
  double exit_price{0.0};
  double average_price_delta{0.0};
  double cycle_time_minutes{0.0};
  double max_adverse_excursion{0.0};
  double max_favorable_excursion{0.0};
  Quantity max_position{0};
  double time_since_last_fill_minutes{0.0};
  double pnl{0.0};
};

}  // namespace domain
}  // namespace tranche
