#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/domain/trade_cycle_record.hpp"
#include "tranche/time/timestamp.hpp"

namespace tranche {

// -----------------------------------------------------------------------------
// TradeMetrics: analytics for one aggregate trade cycle
// -----------------------------------------------------------------------------
//
// @brief  Tracks a PositionManager's open cycle from the first fill out of
//         flat to the fill that returns it to flat, then produces the
//         TradeCycleRecord for audit.
//
// @details
// Immutable after construction: first fill time, entry price, side.
//
// Excursions are measured from the ENTRY price, not the running average
// price. Adding to a position moves the average; MAE/MFE must still report
// how far the market went against/for the original entry.
//
//   delta = price - entry   (Buy)
//   delta = entry - price   (Sell)
//   MFE   = max(0, max delta seen)
//   MAE   = min(0, min delta seen)
//
// pnl is the sum of what every reducing fill of the cycle realized
// (addRealized), so the archived record agrees with the book's realized
// PnL over the same fills. finalize() fixes the exit price and computes
//   average_price_delta = directional(exit - entry)
//
// While the cycle is open exit_price follows the latest mark.
//
// Thread model:
//   Plain value type. Owned by PositionManager and mutated only under its
//   lock; copies handed out are snapshots.
// -----------------------------------------------------------------------------
class TradeMetrics {
 public:
  TradeMetrics(Timestamp first_fill, double entry_price,
               domain::Quantity position, domain::Side side);

  // -------------------------------------------------------------------------
  // updateFill(position, average_price, time)
  // -------------------------------------------------------------------------
  // @brief  Records an addition to the open position.
  //
  // @param  position       Absolute position after the addition.
  // @param  average_price  Blended average price after the addition.
  // @param  time           Fill time.
  //
  // @details
  // Raises max_position when exceeded, stamps last_fill and resets the
  // time-since-last-fill counter. Does not touch entry_price.
  // -------------------------------------------------------------------------
  void updateFill(domain::Quantity position, double average_price,
                  Timestamp time);

  // -------------------------------------------------------------------------
  // updatePrice(price, now)
  // -------------------------------------------------------------------------
  // @brief  Marks the cycle against a new price.
  //
  // @details
  // Updates MFE/MAE from entry_price, cycle time (now - first_fill) and time
  // since last fill (now - last_fill), both in minutes. exit_price becomes
  // the running mark; average_price_delta stays 0 until finalize().
  // -------------------------------------------------------------------------
  void updatePrice(double price, Timestamp now);

  // Stamps the time of a reducing fill without changing size or average.
  void touchFill(Timestamp time) { last_fill_ = time; }

  // Adds the PnL a reducing fill realized to the cycle total.
  void addRealized(double pnl) { pnl_ += pnl; }

  // -------------------------------------------------------------------------
  // finalize(exit_price, last_fill)
  // -------------------------------------------------------------------------
  // @brief  Closes the cycle: sets exit price and last fill, then computes
  //         average_price_delta from the entry price. pnl is left as the
  //         accumulated realized total.
  // -------------------------------------------------------------------------
  void finalize(double exit_price, Timestamp last_fill);

  domain::TradeCycleRecord toRecord() const;

  Timestamp firstFill() const { return first_fill_; }
  Timestamp lastFill() const { return last_fill_; }
  domain::Side side() const { return side_; }
  double entryPrice() const { return entry_price_; }
  double averagePrice() const { return average_price_; }
  double exitPrice() const { return exit_price_; }
  double averagePriceDelta() const { return average_price_delta_; }
  double cycleTime() const { return cycle_time_; }
  double maximumAdverseExcursion() const { return max_adverse_excursion_; }
  double maximumFavorableExcursion() const { return max_favorable_excursion_; }
  domain::Quantity maxPosition() const { return max_position_; }
  double timeSinceLastFill() const { return time_since_last_fill_; }
  double pnl() const { return pnl_; }

 private:
  Timestamp first_fill_;
  Timestamp last_fill_;
  domain::Side side_;
  double entry_price_;
  double average_price_;
  double exit_price_{0.0};
  double average_price_delta_{0.0};
  double cycle_time_{0.0};
  double max_adverse_excursion_{0.0};
  double max_favorable_excursion_{0.0};
  domain::Quantity max_position_;
  double time_since_last_fill_{0.0};
  double pnl_{0.0};
};

}  // namespace tranche
