#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstdint>

namespace tranche {

// -----------------------------------------------------------------------------
// OrderRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: Outbound order-creation request for the host's order
// gateway: {order_id, side, quantity, limit_price, instrument}.
// Thread model:
// - Published by BusTradeGateway on the engine loop thread after
//   TradeManager has released its lock.
// - The IPC server forwards it on the telemetry PUB socket.
// -----------------------------------------------------------------------------
struct OrderRequestEvent {
  domain::Order order;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Outbound cancellation request for one order.
struct CancelRequestEvent {
  domain::OrderId order_id{};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Outbound amend request: new limit price and quantity for a working order.
struct ReplaceRequestEvent {
  domain::OrderId order_id{};
  double new_price{0.0};
  domain::Quantity new_quantity{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tranche
