#pragma once

#include "tranche/events/event.hpp"
#include "tranche/execution/i_trade_gateway.hpp"
#include "tranche/time/i_time_provider.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace tranche {

// -----------------------------------------------------------------------------
// SimulatedTradeGateway
// -----------------------------------------------------------------------------
//
// @brief  Broker stand-in for backtests and tests.
//
// @details
// For every sendOrder() it reports, through the sink:
//   FillMode::Immediate        OrderStatus New, FillEvent (full quantity at
//                              the limit price), OrderStatus Filled.
//   FillMode::AcknowledgeOnly  OrderStatus New; the order stays working
//                              until cancelled.
//
// cancelOrder() of a working order reports Cancelled; replaceOrder() reports
// Replaced. Both ignore ids that are not working.
//
// The sink is normally LevelEngine's enqueue, so reports are processed after
// the handler that sent the order returns, just as a real broker's callbacks
// would be. Timestamps come from the injected time provider, which makes
// replays deterministic.
//
// Every request is also recorded for inspection by tests.
//
// Thread model:
//   Safe from any thread; internal state is guarded by a mutex that is never
//   held while calling the sink.
// -----------------------------------------------------------------------------
class SimulatedTradeGateway final : public ITradeGateway {
 public:
  enum class FillMode {
    Immediate,
    AcknowledgeOnly,
  };

  using Sink = std::function<void(Event)>;

  SimulatedTradeGateway(Sink sink, const ITimeProvider& time_provider,
                        FillMode mode = FillMode::Immediate);

  void sendOrder(const domain::Order& order) override;
  void cancelOrder(domain::OrderId order_id) override;
  void replaceOrder(domain::OrderId order_id, double new_price,
                    domain::Quantity new_quantity) override;

  void setFillMode(FillMode mode);

  std::vector<domain::Order> sentOrders() const;
  std::vector<domain::OrderId> cancelledOrders() const;
  std::size_t workingOrderCount() const;

 private:
  void report(domain::OrderId order_id, domain::OrderStatus status);

  Sink sink_;
  const ITimeProvider& time_provider_;

  mutable std::mutex mutex_;
  FillMode mode_;
  std::set<domain::OrderId> working_;
  std::vector<domain::Order> sent_;
  std::vector<domain::OrderId> cancelled_;
};

}  // namespace tranche
