#include "tranche/execution/simulated_trade_gateway.hpp"
#include "tranche/time/time_utils.hpp"

#include <utility>

namespace tranche {

SimulatedTradeGateway::SimulatedTradeGateway(Sink sink,
                                             const ITimeProvider& time_provider,
                                             FillMode mode)
    : sink_(std::move(sink)), time_provider_(time_provider), mode_(mode) {}

void SimulatedTradeGateway::setFillMode(FillMode mode) {
  std::lock_guard lock(mutex_);
  mode_ = mode;
}

void SimulatedTradeGateway::report(domain::OrderId order_id,
                                   domain::OrderStatus status) {
  OrderStatusEvent event;
  event.order_id = order_id;
  event.status = status;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  sink_(event);
}

// -----------------------------------------------------------------------------
// sendOrder: acknowledge, then (Immediate) fill in full at the limit price
// -----------------------------------------------------------------------------
void SimulatedTradeGateway::sendOrder(const domain::Order& order) {
  FillMode mode;
  {
    std::lock_guard lock(mutex_);
    sent_.push_back(order);
    mode = mode_;
    if (mode == FillMode::AcknowledgeOnly) {
      working_.insert(order.id);
    }
  }

  report(order.id, domain::OrderStatus::New);
  if (mode == FillMode::AcknowledgeOnly) {
    return;
  }

  FillEvent fill;
  fill.order_id = order.id;
  fill.side = order.side;
  fill.quantity = order.quantity;
  fill.price = order.limit_price;
  fill.timestamp = ms_to_timestamp(time_provider_.now_ms());
  sink_(fill);

  report(order.id, domain::OrderStatus::Filled);
}

void SimulatedTradeGateway::cancelOrder(domain::OrderId order_id) {
  {
    std::lock_guard lock(mutex_);
    if (working_.erase(order_id) == 0) {
      return;
    }
    cancelled_.push_back(order_id);
  }
  report(order_id, domain::OrderStatus::Cancelled);
}

void SimulatedTradeGateway::replaceOrder(domain::OrderId order_id,
                                         double /*new_price*/,
                                         domain::Quantity /*new_quantity*/) {
  {
    std::lock_guard lock(mutex_);
    if (working_.count(order_id) == 0) {
      return;
    }
  }
  report(order_id, domain::OrderStatus::Replaced);
}

std::vector<domain::Order> SimulatedTradeGateway::sentOrders() const {
  std::lock_guard lock(mutex_);
  return sent_;
}

std::vector<domain::OrderId> SimulatedTradeGateway::cancelledOrders() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

std::size_t SimulatedTradeGateway::workingOrderCount() const {
  std::lock_guard lock(mutex_);
  return working_.size();
}

}  // namespace tranche
