#include "tranche/execution/trade_manager.hpp"
#include "tranche/time/time_utils.hpp"

#include <iostream>
#include <mutex>

namespace tranche {

TradeManager::TradeManager(ITradeGateway& gateway,
                           OrderIdGenerator& id_generator,
                           const ITimeProvider& time_provider)
    : gateway_(gateway),
      id_generator_(id_generator),
      time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// createOrder
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> TradeManager::createOrder(
    domain::Side side, domain::Quantity quantity, double limit_price,
    const std::string& instrument) {
  if (quantity <= 0 || instrument.empty()) {
    std::cerr << "[TradeManager] WARNING: refusing order with quantity "
              << quantity << " instrument '" << instrument << "'\n";
    return std::nullopt;
  }

  domain::Order order;
  order.id = id_generator_.next_id();
  order.instrument = instrument;
  order.side = side;
  order.quantity = quantity;
  order.limit_price = limit_price;
  order.status = domain::OrderStatus::PendingNew;
  order.created = ms_to_timestamp(time_provider_.now_ms());

  {
    std::unique_lock lock(mutex_);
    orders_.emplace(order.id, order);
    live_order_ = true;
    current_order_id_ = order.id;
  }

  std::cout << "[TradeManager] Order " << order.id << " "
            << domain::toString(side) << " " << quantity << " @ "
            << limit_price << " " << instrument << "\n";
  gateway_.sendOrder(order);
  return order.id;
}

std::optional<domain::OrderId> TradeManager::createOrder(
    const domain::OrderRequest& request) {
  return createOrder(request.side, request.quantity, request.limit_price,
                     request.instrument);
}

bool TradeManager::cancelOrder(domain::OrderId order_id) {
  {
    std::shared_lock lock(mutex_);
    if (orders_.count(order_id) == 0) {
      return false;
    }
  }
  gateway_.cancelOrder(order_id);
  return true;
}

std::size_t TradeManager::cancelAllOrders() {
  std::vector<domain::OrderId> ids;
  {
    std::shared_lock lock(mutex_);
    ids.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
      ids.push_back(id);
    }
  }
  for (domain::OrderId id : ids) {
    gateway_.cancelOrder(id);
  }
  return ids.size();
}

bool TradeManager::replaceOrder(domain::OrderId order_id, double new_price,
                                domain::Quantity new_quantity) {
  if (new_quantity <= 0) {
    return false;
  }
  {
    std::unique_lock lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
      return false;
    }
    it->second.limit_price = new_price;
    it->second.quantity = new_quantity;
  }
  gateway_.replaceOrder(order_id, new_price, new_quantity);
  return true;
}

// -----------------------------------------------------------------------------
// handleOrderUpdate
// -----------------------------------------------------------------------------
bool TradeManager::handleOrderUpdate(const OrderStatusEvent& event) {
  std::unique_lock lock(mutex_);

  auto it = orders_.find(event.order_id);
  if (it == orders_.end()) {
    std::cerr << "[TradeManager] WARNING: status "
              << domain::toString(event.status) << " for unknown order "
              << event.order_id << ". Skipping.\n";
    return false;
  }

  it->second.status = event.status;

  if (domain::isTerminal(event.status)) {
    if (event.status == domain::OrderStatus::Rejected) {
      std::cerr << "[TradeManager] WARNING: order " << event.order_id
                << " rejected\n";
    }
    orders_.erase(it);
    live_order_ = !orders_.empty();
    current_order_id_ = orders_.empty() ? 0 : orders_.rbegin()->first;
    return true;
  }

  if (event.status == domain::OrderStatus::New ||
      event.status == domain::OrderStatus::Replaced) {
    live_order_ = true;
  }
  return true;
}

bool TradeManager::handleFill(const FillEvent& event) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(event.order_id);
  if (it == orders_.end()) {
    return false;
  }
  it->second.filled_quantity += event.quantity;
  return true;
}

bool TradeManager::hasLiveOrder() const {
  std::shared_lock lock(mutex_);
  return live_order_;
}

domain::OrderId TradeManager::currentOrderId() const {
  std::shared_lock lock(mutex_);
  return current_order_id_;
}

std::optional<domain::Order> TradeManager::order(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> TradeManager::activeOrders() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    result.push_back(order);
  }
  return result;
}

void TradeManager::reset() {
  std::unique_lock lock(mutex_);
  orders_.clear();
  live_order_ = false;
  current_order_id_ = 0;
}

}  // namespace tranche
