#pragma once

#include "tranche/domain/level_order.hpp"
#include "tranche/domain/order.hpp"
#include "tranche/domain/order_status.hpp"
#include "tranche/eventbus/event_bus.hpp"
#include "tranche/levels/level.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tranche {

// Summary counts for telemetry and the STATUS command.
struct LevelManagerStats {
  std::size_t active_levels{0};
  std::size_t completed_levels{0};
  domain::Quantity total_position{0};
  std::size_t long_levels{0};
  std::size_t short_levels{0};
  std::size_t pending_orders{0};
};

// Outcome of LevelManager::createLevel().
enum class CreateOutcome {
  Created,          // New Level entered and active
  Duplicate,        // A Level with the same threshold and side is active
  CapacityReached,  // max_concurrent_levels already active
  Rejected,         // Unknown entry index or size <= 0
};

const char* toString(CreateOutcome outcome);

// -----------------------------------------------------------------------------
// CreateLevelResult
// -----------------------------------------------------------------------------
// level holds a snapshot of the new Level (Created) or of the existing one
// (Duplicate); it is empty for CapacityReached and Rejected.
// -----------------------------------------------------------------------------
struct CreateLevelResult {
  CreateOutcome outcome{CreateOutcome::Rejected};
  std::optional<Level> level;

  bool created() const { return outcome == CreateOutcome::Created; }
};

// -----------------------------------------------------------------------------
// LevelManager
// -----------------------------------------------------------------------------
//
// @brief  Owns every Level of one instrument: decides which entries and exits
//         the signal triggers, executes them, and routes order callbacks to
//         the Level that owns each order.
//
// @details
// State:
//   active_      level id → Level, ordered by id.
//   completed_   append-only, in completion order. A Level appears at most
//                once.
//   order_index_ order id → owning level id, for active Levels only. An
//                order id belongs to at most one Level.
//
// Ids come from a counter starting at 1 and are never reused.
//
// Entry rules:
//   Buy  index i triggers when signal < -entry_levels[i]
//   Sell index i triggers when signal >  entry_levels[i]
//   An index is skipped while an active Level holds the same threshold and
//   side. Results are capped at the remaining capacity.
//
// Exit accounting:
//   executeExit() computes the tranche's PnL from the Level's entry price,
//   scaled by instrument_factor, and moves a Level that went flat into
//   completed_ in the same locked step, so no reader ever sees it in both
//   collections.
//
// Failure semantics:
//   Construction validates its parameters and throws std::invalid_argument.
//   Everything else treats unknown ids and repeated calls as no-ops with a
//   defined return value (0, false, std::nullopt, empty).
//
// Thread model:
//   std::shared_mutex: mutations take a unique_lock, queries a shared_lock.
//   Events are published on the calling thread after the lock is released.
//   All getters return copies.
// -----------------------------------------------------------------------------
class LevelManager {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  bus                    Sink for LevelCreatedEvent, LevelExitEvent
  //                                and LevelsFlattenedEvent.
  // @param  entry_levels           Entry thresholds; non-empty, each > 0.
  // @param  exit_levels            Exit multipliers; non-empty, each >= 0.
  // @param  max_concurrent_levels  Capacity; > 0.
  // @param  instrument_factor      Contract multiplier for PnL; > 0.
  //
  // @throws std::invalid_argument on any violation above.
  // -------------------------------------------------------------------------
  LevelManager(EventBus& bus, std::vector<double> entry_levels,
               std::vector<double> exit_levels,
               std::size_t max_concurrent_levels, double instrument_factor);

  LevelManager(const LevelManager&) = delete;
  LevelManager& operator=(const LevelManager&) = delete;

  // --- Entry ---------------------------------------------------------------

  // Entry indices (ascending) the signal triggers for `side`. See class doc.
  std::vector<std::size_t> triggeredEntryLevels(double signal,
                                                domain::Side side) const;

  // -------------------------------------------------------------------------
  // createLevel(entry_index, side, size, price, signal, time)
  // -------------------------------------------------------------------------
  // @brief  Creates, enters and activates a Level for one entry threshold.
  //
  // @details
  // Checked in order: entry_index and size (Rejected), an active Level with
  // the same threshold and side (Duplicate), capacity (CapacityReached).
  // Publishes LevelCreatedEvent on success.
  // -------------------------------------------------------------------------
  CreateLevelResult createLevel(std::size_t entry_index, domain::Side side,
                                domain::Quantity size, double price,
                                double signal, Timestamp time);

  // --- Exit ----------------------------------------------------------------

  // Level id → triggered exit indices, for every active Level with at least
  // one trigger.
  std::map<LevelId, std::vector<std::size_t>> allTriggeredExitLevels(
      double signal) const;

  // -------------------------------------------------------------------------
  // executeExit(level_id, exit_index, price, time)
  // -------------------------------------------------------------------------
  // @return Quantity exited; 0 for an unknown/inactive level id or an
  //         exhausted tranche. Publishes LevelExitEvent when > 0.
  // -------------------------------------------------------------------------
  domain::Quantity executeExit(LevelId level_id, std::size_t exit_index,
                               double price, Timestamp time);

  // --- Orders --------------------------------------------------------------

  // Attaches an order to an active Level. false when the Level is not active,
  // the id is 0, or the id is already owned by a Level.
  bool addOrderToLevel(LevelId level_id, const domain::LevelOrder& order);

  // Routes a status to the owning Level. false for an unknown order id.
  bool updateOrderStatus(domain::OrderId order_id, domain::OrderStatus status);

  // Routes a fill to the owning Level. false for an unknown order id.
  bool applyFill(domain::OrderId order_id, domain::Quantity quantity,
                 double price);

  std::optional<LevelId> findLevelForOrder(domain::OrderId order_id) const;

  bool hasAnyPendingOrders() const;

  // Drops terminal orders from every active Level. Returns how many went.
  std::size_t cleanupCompletedOrders();

  // --- Queries -------------------------------------------------------------

  // Snapshot of an active Level.
  std::optional<Level> level(LevelId level_id) const;
  std::vector<Level> levelsForSide(domain::Side side) const;
  std::vector<Level> activeLevels() const;
  std::vector<Level> completedLevels() const;

  std::size_t activeLevelCount() const;
  std::size_t maxConcurrentLevels() const { return max_concurrent_levels_; }
  bool atCapacity() const;

  // Signed sum of active Levels' current positions.
  domain::Quantity totalCurrentPosition() const;

  double calculateTotalUnrealizedPnL(double price) const;

  LevelManagerStats stats() const;

  const std::vector<double>& entryLevels() const { return entry_levels_; }
  const std::vector<double>& exitLevels() const { return exit_levels_; }
  double instrumentFactor() const { return instrument_factor_; }

  std::string toString() const;

  // -------------------------------------------------------------------------
  // forceCloseAllLevels(time)
  // -------------------------------------------------------------------------
  // @brief  Emergency flatten of the Level book.
  //
  // @details
  // Moves every active Level into completed_ as-is (no exits executed, no
  // orders sent) and forgets their orders. Sending the offsetting order is
  // the caller's job. Publishes LevelsFlattenedEvent when anything closed.
  //
  // @return The Levels that were closed, in id order.
  // -------------------------------------------------------------------------
  std::vector<Level> forceCloseAllLevels(Timestamp time);

 private:
  // Caller holds mutex_ (shared or unique).
  bool hasActiveLevelFor(double threshold, domain::Side side) const;
  LevelManagerStats statsLocked() const;

  // Caller holds mutex_ exclusively.
  void forgetOrdersOf(const Level& level);

  EventBus& bus_;
  const std::vector<double> entry_levels_;
  const std::vector<double> exit_levels_;
  const std::size_t max_concurrent_levels_;
  const double instrument_factor_;

  mutable std::shared_mutex mutex_;
  LevelId next_level_id_{1};
  std::map<LevelId, Level> active_;
  std::vector<Level> completed_;
  std::unordered_map<domain::OrderId, LevelId> order_index_;
};

}  // namespace tranche
