#pragma once

#include "tranche/domain/position.hpp"
#include "tranche/domain/trade_cycle_record.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstdint>
#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Carries an immutable snapshot of a PositionManager book after a
//         fill has been applied.
//
// @details
// Published after the PositionManager's lock is released. The snapshot is a
// full copy, so the event stays valid whatever happens to the book later.
//
// Thread model:
//   Published on the thread that applied the fill (the engine loop).
//   Plain data with value semantics; safe to copy across threads.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::PositionSnapshot position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CycleCompletedEvent
// -----------------------------------------------------------------------------
//
// @brief  One completed flat-to-flat cycle of a book, for audit.
//
// @details
// Published exactly once per archived TradeMetrics. CycleAuditLog appends it
// to the JSON-lines audit file; the IPC server forwards it on the telemetry
// socket.
// -----------------------------------------------------------------------------
struct CycleCompletedEvent {
  std::string book;
  domain::TradeCycleRecord record;
  std::uint64_t sequence_id{0};
};

}  // namespace tranche
