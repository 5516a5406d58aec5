#include "tranche/levels/level.hpp"

#include <cassert>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace tranche {

Level::Level(LevelId id, std::size_t entry_index,
             double entry_signal_threshold, std::vector<double> exit_levels)
    : id_(id),
      entry_index_(entry_index),
      entry_signal_threshold_(entry_signal_threshold),
      exit_levels_(std::move(exit_levels)) {}

// -----------------------------------------------------------------------------
// executeEntry
// -----------------------------------------------------------------------------
bool Level::executeEntry(Timestamp time, domain::Side side,
                         domain::Quantity size, double price, double signal) {
  if (entry_complete_ || size <= 0) {
    return false;
  }

  entry_time_ = time;
  side_ = side;
  position_size_ = size;
  current_position_ = size * domain::sideSign(side);
  entry_price_ = price;
  actual_entry_signal_ = signal;
  entry_complete_ = true;

  partitionExits();
  return true;
}

// -----------------------------------------------------------------------------
// partitionExits: size / n per tranche, remainder to the lowest indices
// -----------------------------------------------------------------------------
void Level::partitionExits() {
  exit_level_status_.clear();
  if (exit_levels_.empty()) {
    return;
  }

  const auto count = static_cast<domain::Quantity>(exit_levels_.size());
  const domain::Quantity total = std::llabs(current_position_);
  const domain::Quantity per_level = total / count;
  const domain::Quantity remainder = total % count;

  for (std::size_t i = 0; i < exit_levels_.size(); ++i) {
    exit_level_status_[i] =
        per_level + (static_cast<domain::Quantity>(i) < remainder ? 1 : 0);
  }
}

// -----------------------------------------------------------------------------
// triggeredExitLevels
// -----------------------------------------------------------------------------
std::vector<std::size_t> Level::triggeredExitLevels(double signal) const {
  std::vector<std::size_t> triggered;
  if (!entry_complete_ || isComplete()) {
    return triggered;
  }

  for (const auto& [index, remaining] : exit_level_status_) {
    if (remaining <= 0) {
      continue;
    }
    const double threshold = entry_signal_threshold_ * exit_levels_[index];
    const bool fire = (side_ == domain::Side::Buy) ? signal >= -threshold
                                                   : signal <= threshold;
    if (fire) {
      triggered.push_back(index);
    }
  }
  return triggered;
}

// -----------------------------------------------------------------------------
// executeExit
// -----------------------------------------------------------------------------
domain::Quantity Level::executeExit(std::size_t exit_index, double price,
                                    Timestamp time) {
  auto it = exit_level_status_.find(exit_index);
  if (it == exit_level_status_.end() || it->second <= 0) {
    return 0;
  }

  const domain::Quantity exit_size = it->second;
  it->second = 0;

  // Move toward zero: a long shrinks, a short grows.
  current_position_ -= exit_size * domain::sideSign(side_);

  last_exit_price_ = price;
  last_exit_time_ = time;
  return exit_size;
}

std::optional<double> Level::exitThreshold(std::size_t exit_index) const {
  if (exit_index >= exit_levels_.size()) {
    return std::nullopt;
  }
  return entry_signal_threshold_ * exit_levels_[exit_index];
}

// -----------------------------------------------------------------------------
// Order book
// -----------------------------------------------------------------------------
bool Level::addOrder(const domain::LevelOrder& order) {
  if (order.order_id == 0) {
    return false;
  }
  return orders_.emplace(order.order_id, order).second;
}

bool Level::updateOrderStatus(domain::OrderId order_id,
                              domain::OrderStatus status) {
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return false;
  }
  it->second.status = status;
  return true;
}

bool Level::applyFill(domain::OrderId order_id, domain::Quantity quantity,
                      double /*price*/) {
  auto it = orders_.find(order_id);
  if (it == orders_.end() || quantity <= 0) {
    return false;
  }

  domain::LevelOrder& order = it->second;
  const domain::Quantity open = order.quantity - order.filled_quantity;
  // Over-fills are a broker-side invariant violation: trapped in debug
  // builds, clamped in release.
  assert(quantity <= open && "fill exceeds the order's open quantity");
  if (quantity > open) {
    std::cerr << "[Level " << id_ << "] WARNING: over-fill on order "
              << order_id << " (fill " << quantity << ", open " << open
              << "), clamping\n";
    quantity = open;
  }

  order.filled_quantity += quantity;
  order.status = (order.filled_quantity >= order.quantity)
                     ? domain::OrderStatus::Filled
                     : domain::OrderStatus::PartiallyFilled;
  return true;
}

std::size_t Level::cleanupCompletedOrders() {
  std::size_t removed = 0;
  for (auto it = orders_.begin(); it != orders_.end();) {
    if (domain::isTerminal(it->second.status)) {
      it = orders_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

bool Level::hasPendingOrders() const {
  for (const auto& [id, order] : orders_) {
    if (domain::isPending(order.status)) {
      return true;
    }
  }
  return false;
}

bool Level::hasOrder(domain::OrderId order_id) const {
  return orders_.count(order_id) > 0;
}

std::optional<domain::LevelOrder> Level::order(domain::OrderId order_id) const {
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
domain::Quantity Level::totalRemainingExitQuantity() const {
  domain::Quantity total = 0;
  for (const auto& [index, remaining] : exit_level_status_) {
    total += remaining;
  }
  return total;
}

domain::Quantity Level::exitQuantityForLevel(std::size_t exit_index) const {
  auto it = exit_level_status_.find(exit_index);
  return it == exit_level_status_.end() ? 0 : it->second;
}

double Level::calculateUnrealizedPnL(double price,
                                     double instrument_factor) const {
  if (current_position_ == 0) {
    return 0.0;
  }
  const double delta = (side_ == domain::Side::Buy) ? price - entry_price_
                                                    : entry_price_ - price;
  return static_cast<double>(std::llabs(current_position_)) * delta *
         instrument_factor;
}

std::string Level::toString() const {
  std::ostringstream out;
  out << "Level " << id_ << ": Threshold=" << entry_signal_threshold_
      << ", Side=" << domain::toString(side_)
      << ", Position=" << current_position_ << "/" << position_size_
      << ", Entry=" << std::fixed << std::setprecision(2) << entry_price_
      << ", Complete=" << (isComplete() ? "true" : "false");
  return out.str();
}

}  // namespace tranche
