#pragma once

#include "tranche/domain/bar.hpp"
#include "tranche/domain/order.hpp"
#include "tranche/domain/order_status.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstdint>
#include <optional>

namespace tranche {

// -----------------------------------------------------------------------------
// BarEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one bar from the host, optionally with the signal
// value the host's alpha computed for it.
// Role in architecture: The host owns bar construction and signal
// computation. A bar without a signal only marks positions to market; a bar
// with a signal also drives exit and entry evaluation.
// -----------------------------------------------------------------------------
struct BarEvent {
  domain::Bar bar;
  std::optional<double> signal;   // Deviation units; empty = mark only
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FillEvent
// -----------------------------------------------------------------------------
// Responsibility: Confirms that (part of) an order was executed by the
// broker.
// Role in architecture: Applied exactly once to the actual PositionManager and
// to the Level that owns order_id (resolved via findLevelForOrder). An
// unknown order_id is a benign late callback, not an error.
// -----------------------------------------------------------------------------
struct FillEvent {
  domain::OrderId order_id{};
  domain::Side side{domain::Side::Buy};
  domain::Quantity quantity{0};   // Always > 0 on the wire
  double price{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// OrderStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports the broker's latest status for an order.
// Role in architecture: Applied to TradeManager (live-order tracking) and to
// the owning Level's order book. Filled/Cancelled/Rejected release the order
// from pending tracking.
// -----------------------------------------------------------------------------
struct OrderStatusEvent {
  domain::OrderId order_id{};
  domain::OrderStatus status{domain::OrderStatus::New};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FlattenCommandEvent
// -----------------------------------------------------------------------------
// Responsibility: Operator request (IPC "FLATTEN") to close every active
// Level and send one offsetting order for the remaining position.
// Role in architecture: Queued like host events so the flatten runs on the
// engine loop thread, never in the middle of a bar.
// -----------------------------------------------------------------------------
struct FlattenCommandEvent {
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tranche
