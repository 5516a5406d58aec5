#pragma once

#include "tranche/domain/order_status.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique identifier for an order created by the engine. Produced by
// OrderIdGenerator (starting at 1); 0 means "no order".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Quantity
// -----------------------------------------------------------------------------
// Contracts/shares are whole units. Positions are signed (+long, -short);
// order and fill quantities are always positive with the direction carried
// by Side.
// -----------------------------------------------------------------------------
using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Trading direction. A Buy opens or adds to a long position (or reduces a
// short); a Sell does the opposite.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// +1 for Buy, -1 for Sell. Turns an unsigned quantity into a signed delta.
inline int sideSign(Side side) { return side == Side::Buy ? 1 : -1; }

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* toString(Side side) {
  return side == Side::Buy ? "Buy" : "Sell";
}

inline std::optional<Side> parseSide(const std::string& name) {
  if (name == "Buy") {
    return Side::Buy;
  }
  if (name == "Sell") {
    return Side::Sell;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// The engine's intent to trade, before an id is assigned. Produced by the
// orchestrator (entries, exits) and by PositionReconciler (corrections), and
// turned into an Order by TradeManager::createOrder().
// -----------------------------------------------------------------------------
struct OrderRequest {
  Side side{Side::Buy};
  Quantity quantity{0};
  double limit_price{0.0};
  std::string instrument;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: Full state of an order sent to the host gateway: the
// original intent plus its latest reported status and cumulative fill.
//
// @details
// The authoritative copy lives inside TradeManager and is mutated only under
// its lock. Copies handed out by activeOrders() or carried in events are
// snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                              // Engine-assigned identifier
  std::string instrument;                    // Instrument reference
  Side side{Side::Buy};                      // Buy or Sell
  Quantity quantity{0};                      // Requested size
  double limit_price{0.0};                   // Limit price
  OrderStatus status{OrderStatus::PendingNew};  // Latest reported status
  Quantity filled_quantity{0};               // Cumulative filled quantity
  Timestamp created{};                       // When createOrder() ran
};

}  // namespace domain
}  // namespace tranche
