#pragma once

#include "tranche/domain/level_order.hpp"
#include "tranche/domain/order.hpp"
#include "tranche/domain/order_status.hpp"
#include "tranche/events/level_events.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tranche {

// -----------------------------------------------------------------------------
// Level: one entry tranche with partitioned exits
// -----------------------------------------------------------------------------
//
// @brief  A single unit of exposure opened when the signal crosses one entry
//         threshold, then closed piece by piece as the signal reverts through
//         its exit thresholds.
//
// @details
// Lifecycle:
//   constructed (not entered) ─executeEntry()─> entered ─executeExit()*─>
//   complete (current_position == 0)
//
// Exit partition:
//   At entry, position_size is split across exit_levels.size() tranches:
//   size / n each, with the remainder (size % n) given one-by-one to the
//   lowest indices. Size 10 over 3 exits gives {4, 3, 3}.
//
//   Invariant: sum(exit_level_status) == |current_position| at all times.
//
// Exit trigger (mean reversion):
//   threshold_i = entry_signal_threshold * exit_levels[i]
//   Buy  level: exit i fires when signal >= -threshold_i
//   Sell level: exit i fires when signal <=  threshold_i
//
// Orders:
//   A Level keeps its own book of LevelOrders keyed by order id. Status and
//   fills are recorded here so the Level can answer hasPendingOrders() without
//   asking the TradeManager.
//
// Thread model:
//   Not thread-safe. Owned by LevelManager and only mutated under its
//   exclusive lock. Copies handed out by LevelManager are snapshots.
// -----------------------------------------------------------------------------
class Level {
 public:
  using OrderBook = std::map<domain::OrderId, domain::LevelOrder>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  id                      Unique id from LevelManager (never 0).
  // @param  entry_index             Index into the configured entry levels.
  // @param  entry_signal_threshold  Threshold magnitude that opens the Level.
  // @param  exit_levels             Multipliers of the entry threshold, one
  //                                 per exit tranche. Must be non-empty;
  //                                 LevelManager validates this.
  // -------------------------------------------------------------------------
  Level(LevelId id, std::size_t entry_index, double entry_signal_threshold,
        std::vector<double> exit_levels);

  // -------------------------------------------------------------------------
  // executeEntry(time, side, size, price, signal)
  // -------------------------------------------------------------------------
  // @brief  Enters the Level and partitions its exits.
  //
  // @return false (and changes nothing) when the Level was already entered
  //         or size <= 0.
  // -------------------------------------------------------------------------
  bool executeEntry(Timestamp time, domain::Side side, domain::Quantity size,
                    double price, double signal);

  // Exit indices (ascending) with remaining quantity whose threshold the
  // signal has reached. Empty before entry and once complete.
  std::vector<std::size_t> triggeredExitLevels(double signal) const;

  // -------------------------------------------------------------------------
  // executeExit(exit_index, price, time)
  // -------------------------------------------------------------------------
  // @brief  Closes one exit tranche in full.
  //
  // @return The quantity exited (the tranche's remaining size). 0 when the
  //         index is unknown or already exhausted; nothing changes then.
  // -------------------------------------------------------------------------
  domain::Quantity executeExit(std::size_t exit_index, double price,
                               Timestamp time);

  // Threshold for one exit tranche, or std::nullopt for an unknown index.
  std::optional<double> exitThreshold(std::size_t exit_index) const;

  // --- Order book ------------------------------------------------------------

  // Records an order against this Level. Rejects id 0 and ids already in the
  // book (returns false).
  bool addOrder(const domain::LevelOrder& order);

  // Stores the latest broker status. false for an unknown id.
  bool updateOrderStatus(domain::OrderId order_id, domain::OrderStatus status);

  // -------------------------------------------------------------------------
  // applyFill(order_id, quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Accumulates a fill against one of this Level's orders.
  //
  // @details
  // filled_quantity is clamped to the order quantity; an over-fill is logged
  // and the excess ignored. The order moves to Filled when fully filled,
  // otherwise to PartiallyFilled. The price is not stored here; positions and
  // PnL are the PositionManager's job.
  //
  // @return false for an unknown id or quantity <= 0.
  // -------------------------------------------------------------------------
  bool applyFill(domain::OrderId order_id, domain::Quantity quantity,
                 double price);

  // Drops Filled, Cancelled and Rejected orders. Returns how many went.
  std::size_t cleanupCompletedOrders();

  // True if any order is PendingNew, New or PartiallyFilled.
  bool hasPendingOrders() const;

  bool hasOrder(domain::OrderId order_id) const;

  std::optional<domain::LevelOrder> order(domain::OrderId order_id) const;

  const OrderBook& orders() const { return orders_; }

  // --- Queries ---------------------------------------------------------------

  domain::Quantity totalRemainingExitQuantity() const;

  // Remaining quantity of one tranche; 0 for an unknown index.
  domain::Quantity exitQuantityForLevel(std::size_t exit_index) const;

  // |current_position| * directional(price - entry_price) * factor.
  double calculateUnrealizedPnL(double price,
                                double instrument_factor = 1.0) const;

  bool isEntryComplete() const { return entry_complete_; }

  // Entered and fully exited.
  bool isComplete() const { return entry_complete_ && current_position_ == 0; }

  std::string toString() const;

  LevelId id() const { return id_; }
  std::size_t entryIndex() const { return entry_index_; }
  double entrySignalThreshold() const { return entry_signal_threshold_; }
  double actualEntrySignal() const { return actual_entry_signal_; }
  double entryPrice() const { return entry_price_; }
  Timestamp entryTime() const { return entry_time_; }
  domain::Side side() const { return side_; }
  domain::Quantity positionSize() const { return position_size_; }
  domain::Quantity currentPosition() const { return current_position_; }
  const std::vector<double>& exitLevels() const { return exit_levels_; }
  const std::map<std::size_t, domain::Quantity>& exitLevelStatus() const {
    return exit_level_status_;
  }
  std::optional<double> lastExitPrice() const { return last_exit_price_; }
  std::optional<Timestamp> lastExitTime() const { return last_exit_time_; }

 private:
  void partitionExits();

  LevelId id_;
  std::size_t entry_index_;
  double entry_signal_threshold_;
  std::vector<double> exit_levels_;

  double actual_entry_signal_{0.0};
  double entry_price_{0.0};
  Timestamp entry_time_{};
  domain::Side side_{domain::Side::Buy};
  domain::Quantity position_size_{0};
  domain::Quantity current_position_{0};  // Signed: +long, -short
  bool entry_complete_{false};

  std::map<std::size_t, domain::Quantity> exit_level_status_;
  OrderBook orders_;

  std::optional<double> last_exit_price_;
  std::optional<Timestamp> last_exit_time_;
};

}  // namespace tranche
