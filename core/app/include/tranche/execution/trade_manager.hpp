#pragma once

#include "tranche/concurrent/order_id_generator.hpp"
#include "tranche/domain/order.hpp"
#include "tranche/events/event_types.hpp"
#include "tranche/execution/i_trade_gateway.hpp"
#include "tranche/time/i_time_provider.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tranche {

// -----------------------------------------------------------------------------
// TradeManager
// -----------------------------------------------------------------------------
//
// @brief  Thin adapter between the engine and the order gateway: creates,
//         cancels and amends orders and tracks whether any order is live.
//
// @details
// "Live" means at least one order has been sent and has not yet reached a
// terminal status. LevelEngine consults hasLiveOrder() before entering new
// Levels so entries never stack on an unacknowledged order.
//
// Status handling (handleOrderUpdate):
//   New, Replaced, PartiallyFilled  order stays tracked, live = true
//   Filled, Cancelled, Rejected     order removed; live = any order left
//   unknown order id                logged and ignored (late callback)
//
// currentOrderId() is the most recently created order still tracked, or 0.
//
// Thread model:
//   std::shared_mutex around the order map. Gateway calls are made after the
//   lock is released so a synchronous gateway may call straight back in.
// -----------------------------------------------------------------------------
class TradeManager {
 public:
  TradeManager(ITradeGateway& gateway, OrderIdGenerator& id_generator,
               const ITimeProvider& time_provider);

  TradeManager(const TradeManager&) = delete;
  TradeManager& operator=(const TradeManager&) = delete;

  // -------------------------------------------------------------------------
  // createOrder(side, quantity, limit_price, instrument)
  // -------------------------------------------------------------------------
  // @brief  Assigns an id, tracks the order as PendingNew and sends it.
  //
  // @return The new order id, or std::nullopt when quantity <= 0 or the
  //         instrument is empty (nothing is sent).
  // -------------------------------------------------------------------------
  std::optional<domain::OrderId> createOrder(domain::Side side,
                                             domain::Quantity quantity,
                                             double limit_price,
                                             const std::string& instrument);

  std::optional<domain::OrderId> createOrder(
      const domain::OrderRequest& request);

  // Requests cancellation of a tracked order. false for an unknown id.
  bool cancelOrder(domain::OrderId order_id);

  // Requests cancellation of every tracked order. Returns how many.
  std::size_t cancelAllOrders();

  // Amends a tracked order. false for an unknown id or new_quantity <= 0.
  bool replaceOrder(domain::OrderId order_id, double new_price,
                    domain::Quantity new_quantity);

  // Applies a broker status. false for an unknown id.
  bool handleOrderUpdate(const OrderStatusEvent& event);

  // Accumulates filled quantity on a tracked order. false for an unknown id.
  bool handleFill(const FillEvent& event);

  bool hasLiveOrder() const;
  domain::OrderId currentOrderId() const;
  std::optional<domain::Order> order(domain::OrderId order_id) const;
  std::vector<domain::Order> activeOrders() const;

  // Forgets every tracked order without contacting the gateway.
  void reset();

 private:
  ITradeGateway& gateway_;
  OrderIdGenerator& id_generator_;
  const ITimeProvider& time_provider_;

  mutable std::shared_mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
  bool live_order_{false};
  domain::OrderId current_order_id_{0};
};

}  // namespace tranche
