#pragma once

#include "tranche/eventbus/event_bus.hpp"
#include "tranche/execution/i_trade_gateway.hpp"
#include "tranche/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tranche {

// -----------------------------------------------------------------------------
// BusTradeGateway
// -----------------------------------------------------------------------------
//
// @brief  Live gateway: turns each call into an outbound request event on the
//         EventBus.
//
// @details
// sendOrder    → OrderRequestEvent
// cancelOrder  → CancelRequestEvent
// replaceOrder → ReplaceRequestEvent
//
// Each request carries a gateway-local sequence id so the host can detect
// gaps on the telemetry stream.
// -----------------------------------------------------------------------------
class BusTradeGateway final : public ITradeGateway {
 public:
  BusTradeGateway(EventBus& bus, const ITimeProvider& time_provider);

  void sendOrder(const domain::Order& order) override;
  void cancelOrder(domain::OrderId order_id) override;
  void replaceOrder(domain::OrderId order_id, double new_price,
                    domain::Quantity new_quantity) override;

 private:
  std::uint64_t nextSequence() { return sequence_.fetch_add(1) + 1; }

  EventBus& bus_;
  const ITimeProvider& time_provider_;
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace tranche
