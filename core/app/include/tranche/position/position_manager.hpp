#pragma once

#include "tranche/domain/bar.hpp"
#include "tranche/domain/order.hpp"
#include "tranche/domain/position.hpp"
#include "tranche/domain/trade_cycle_record.hpp"
#include "tranche/eventbus/event_bus.hpp"
#include "tranche/position/trade_metrics.hpp"
#include "tranche/time/timestamp.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tranche {

// -----------------------------------------------------------------------------
// computeRealizedPnL
// -----------------------------------------------------------------------------
// @brief  PnL realized by closing `closed` units of a position.
//
// @param  position_sign  +1 when the closed position was long, -1 short.
// @param  closed         Units closed (absolute). 0 yields exactly 0.
//
// @return position_sign * closed * (exit_price - average_price) * factor
// -----------------------------------------------------------------------------
double computeRealizedPnL(int position_sign, domain::Quantity closed,
                          double exit_price, double average_price,
                          double instrument_factor);

// -----------------------------------------------------------------------------
// PositionManager
// -----------------------------------------------------------------------------
//
// @brief  Aggregate signed position of one book ("theo" or "actual") with
//         average price, realized/unrealized PnL and per-cycle analytics.
//
// @details
// Independent of LevelManager: it only sees fills. LevelEngine feeds every
// theoretical fill to the "theo" book and every broker fill to the "actual"
// book, each exactly once.
//
// Fill classification (q = signed fill, p = current position):
//
//   p == 0        open       new TradeMetrics, average = price
//   q / p < -1    reversal   realize all of p at price, archive the cycle,
//                            open p + q at price
//   q / p > 0     addition   volume-weighted average, TradeMetrics grows
//   otherwise     reduction  realize |q|; archive the cycle if flat,
//                            otherwise mark the TradeMetrics
//
// A fill of exactly -p is a reduction that closes the cycle, not a reversal.
//
// Invariant: current_position equals the signed sum of every fill applied
// since construction or reset().
//
// Each archived cycle is appended to cycleMetrics() and published as a
// CycleCompletedEvent; each applied fill publishes a PositionUpdateEvent.
//
// Thread model:
//   std::shared_mutex; mutations unique, queries shared. Events are
//   published after the lock is released.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  // @throws std::invalid_argument when instrument_factor <= 0.
  PositionManager(EventBus& bus, std::string book, double instrument_factor);

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;

  // -------------------------------------------------------------------------
  // updatePosition(time, side, quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Applies one fill.
  //
  // @return false (nothing changes, nothing is published) when quantity <= 0.
  // -------------------------------------------------------------------------
  bool updatePosition(Timestamp time, domain::Side side,
                      domain::Quantity quantity, double price);

  // -------------------------------------------------------------------------
  // updateTradeMetric(bar)
  // -------------------------------------------------------------------------
  // @brief  Marks the book to bar.close.
  //
  // @details
  // unrealized = |p| * sign(p) * (close - average) * factor, and the close
  // feeds the open TradeMetrics' excursion and timing. Flat book: unrealized
  // becomes 0 and nothing else changes.
  // -------------------------------------------------------------------------
  void updateTradeMetric(const domain::Bar& bar);

  // Back to flat with no history. Publishes nothing.
  void reset();

  const std::string& book() const { return book_; }
  double instrumentFactor() const { return instrument_factor_; }

  domain::PositionSnapshot snapshot() const;
  domain::Quantity currentPosition() const;
  std::optional<double> averagePrice() const;
  double realizedPnL() const;
  double unrealizedPnL() const;
  bool isFlat() const { return currentPosition() == 0; }

  std::vector<domain::TradeCycleRecord> cycleMetrics() const;
  std::optional<TradeMetrics> currentTradeMetric() const;

 private:
  // Caller holds mutex_ exclusively. Archived cycles are appended to
  // `archived` for publishing once the lock is gone.
  void openPosition(Timestamp time, domain::Quantity signed_quantity,
                    double price);
  void addToPosition(Timestamp time, domain::Quantity signed_quantity,
                     double price);
  void reducePosition(Timestamp time, domain::Quantity signed_quantity,
                      double price,
                      std::vector<domain::TradeCycleRecord>& archived);
  void closeCycle(Timestamp time, double price,
                  std::vector<domain::TradeCycleRecord>& archived);

  domain::PositionSnapshot snapshotLocked() const;

  EventBus& bus_;
  const std::string book_;
  const double instrument_factor_;

  mutable std::shared_mutex mutex_;
  domain::Quantity current_position_{0};
  double average_price_{0.0};
  double realized_pnl_{0.0};
  double unrealized_pnl_{0.0};
  double last_price_{0.0};
  Timestamp first_entry_time_{};
  Timestamp last_entry_time_{};
  std::optional<TradeMetrics> current_trade_metric_;
  std::vector<domain::TradeCycleRecord> cycle_metrics_;
};

}  // namespace tranche
