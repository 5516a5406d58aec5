#pragma once

#include "tranche/domain/order.hpp"

namespace tranche {

// -----------------------------------------------------------------------------
// ITradeGateway
// -----------------------------------------------------------------------------
//
// @brief  The seam between TradeManager and whatever routes orders to the
//         broker.
//
// @details
// Implementations:
//   BusTradeGateway        publishes request events; the IPC server forwards
//                          them to the host over the telemetry socket.
//   SimulatedTradeGateway  acknowledges and fills every order itself, for
//                          backtests and tests.
//
// Calls are fire-and-forget. Acknowledgements, fills and rejections come back
// asynchronously as OrderStatusEvent / FillEvent through the engine loop.
//
// Thread model:
//   Called on the engine loop thread, never while TradeManager holds its
//   lock.
// -----------------------------------------------------------------------------
class ITradeGateway {
 public:
  virtual ~ITradeGateway() = default;

  virtual void sendOrder(const domain::Order& order) = 0;

  virtual void cancelOrder(domain::OrderId order_id) = 0;

  virtual void replaceOrder(domain::OrderId order_id, double new_price,
                            domain::Quantity new_quantity) = 0;
};

}  // namespace tranche
