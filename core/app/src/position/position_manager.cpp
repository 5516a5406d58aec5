#include "tranche/position/position_manager.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace tranche {

double computeRealizedPnL(int position_sign, domain::Quantity closed,
                          double exit_price, double average_price,
                          double instrument_factor) {
  if (closed == 0) {
    return 0.0;
  }
  return static_cast<double>(position_sign) *
         static_cast<double>(std::llabs(closed)) *
         (exit_price - average_price) * instrument_factor;
}

PositionManager::PositionManager(EventBus& bus, std::string book,
                                 double instrument_factor)
    : bus_(bus), book_(std::move(book)), instrument_factor_(instrument_factor) {
  if (!(instrument_factor_ > 0.0)) {
    throw std::invalid_argument(
        "PositionManager: instrument_factor must be > 0");
  }
}

// -----------------------------------------------------------------------------
// updatePosition
// -----------------------------------------------------------------------------
bool PositionManager::updatePosition(Timestamp time, domain::Side side,
                                     domain::Quantity quantity, double price) {
  if (quantity <= 0) {
    std::cerr << "[PositionManager:" << book_
              << "] WARNING: ignoring fill with quantity " << quantity
              << "\n";
    return false;
  }

  const domain::Quantity q = quantity * domain::sideSign(side);
  std::vector<domain::TradeCycleRecord> archived;
  PositionUpdateEvent update;

  {
    std::unique_lock lock(mutex_);
    const domain::Quantity p = current_position_;

    if (p == 0) {
      openPosition(time, q, price);
    } else if (static_cast<double>(q) / static_cast<double>(p) < -1.0) {
      // Reversal: close all of p, then open the residual on the other side.
      const double closed_pnl = computeRealizedPnL(
          p > 0 ? 1 : -1, p, price, average_price_, instrument_factor_);
      realized_pnl_ += closed_pnl;
      if (current_trade_metric_) {
        current_trade_metric_->addRealized(closed_pnl);
      }
      closeCycle(time, price, archived);
      openPosition(time, p + q, price);
    } else if (static_cast<double>(q) / static_cast<double>(p) > 0.0) {
      addToPosition(time, q, price);
    } else {
      reducePosition(time, q, price, archived);
    }

    current_position_ = p + q;
    last_price_ = price;
    cycle_metrics_.insert(cycle_metrics_.end(), archived.begin(),
                          archived.end());

    update.position = snapshotLocked();
    update.timestamp = time;
  }

  for (const auto& record : archived) {
    std::cout << "[PositionManager:" << book_ << "] Cycle closed: "
              << domain::toString(record.side) << " " << record.max_position
              << " avg " << record.average_price << " exit "
              << record.exit_price << " pnl " << record.pnl << "\n";
    bus_.publish(CycleCompletedEvent{book_, record, 0});
  }
  bus_.publish(update);
  return true;
}

void PositionManager::openPosition(Timestamp time,
                                   domain::Quantity signed_quantity,
                                   double price) {
  average_price_ = price;
  first_entry_time_ = time;
  last_entry_time_ = time;

  const domain::Side side =
      signed_quantity > 0 ? domain::Side::Buy : domain::Side::Sell;
  current_trade_metric_.emplace(time, price, std::llabs(signed_quantity),
                                side);
}

// Caller applies the new position after this returns; here
// current_position_ is still the pre-fill value.
void PositionManager::addToPosition(Timestamp time,
                                    domain::Quantity signed_quantity,
                                    double price) {
  last_entry_time_ = time;

  const domain::Quantity new_position = current_position_ + signed_quantity;
  const double total_value =
      average_price_ * static_cast<double>(current_position_) +
      price * static_cast<double>(signed_quantity);
  average_price_ = total_value / static_cast<double>(new_position);

  if (current_trade_metric_) {
    current_trade_metric_->updateFill(std::llabs(new_position), average_price_,
                                      time);
  }
}

void PositionManager::reducePosition(
    Timestamp time, domain::Quantity signed_quantity, double price,
    std::vector<domain::TradeCycleRecord>& archived) {
  const double closed_pnl = computeRealizedPnL(
      current_position_ > 0 ? 1 : -1, signed_quantity, price, average_price_,
      instrument_factor_);
  realized_pnl_ += closed_pnl;
  if (current_trade_metric_) {
    current_trade_metric_->addRealized(closed_pnl);
  }

  if (current_position_ + signed_quantity == 0) {
    closeCycle(time, price, archived);
    return;
  }

  if (current_trade_metric_) {
    current_trade_metric_->touchFill(time);
    current_trade_metric_->updatePrice(price, time);
  }
}

void PositionManager::closeCycle(
    Timestamp time, double price,
    std::vector<domain::TradeCycleRecord>& archived) {
  if (current_trade_metric_) {
    current_trade_metric_->finalize(price, time);
    archived.push_back(current_trade_metric_->toRecord());
    current_trade_metric_.reset();
  }
  average_price_ = 0.0;
  unrealized_pnl_ = 0.0;
}

// -----------------------------------------------------------------------------
// updateTradeMetric: mark to the bar close
// -----------------------------------------------------------------------------
void PositionManager::updateTradeMetric(const domain::Bar& bar) {
  std::unique_lock lock(mutex_);

  if (current_position_ == 0 || !current_trade_metric_) {
    unrealized_pnl_ = 0.0;
    return;
  }

  const int sign = current_position_ > 0 ? 1 : -1;
  unrealized_pnl_ = static_cast<double>(std::llabs(current_position_)) *
                    (sign * (bar.close - average_price_)) *
                    instrument_factor_;
  last_price_ = bar.close;
  current_trade_metric_->updatePrice(bar.close, bar.timestamp);
}

void PositionManager::reset() {
  std::unique_lock lock(mutex_);
  current_position_ = 0;
  average_price_ = 0.0;
  realized_pnl_ = 0.0;
  unrealized_pnl_ = 0.0;
  last_price_ = 0.0;
  first_entry_time_ = Timestamp{};
  last_entry_time_ = Timestamp{};
  current_trade_metric_.reset();
  cycle_metrics_.clear();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
domain::PositionSnapshot PositionManager::snapshotLocked() const {
  domain::PositionSnapshot snap;
  snap.book = book_;
  snap.current_position = current_position_;
  if (current_position_ != 0) {
    snap.average_price = average_price_;
  }
  snap.realized_pnl = realized_pnl_;
  snap.unrealized_pnl = unrealized_pnl_;
  snap.last_price = last_price_;
  snap.first_entry_time = first_entry_time_;
  snap.last_entry_time = last_entry_time_;
  snap.completed_cycles = cycle_metrics_.size();
  return snap;
}

domain::PositionSnapshot PositionManager::snapshot() const {
  std::shared_lock lock(mutex_);
  return snapshotLocked();
}

domain::Quantity PositionManager::currentPosition() const {
  std::shared_lock lock(mutex_);
  return current_position_;
}

std::optional<double> PositionManager::averagePrice() const {
  std::shared_lock lock(mutex_);
  if (current_position_ == 0) {
    return std::nullopt;
  }
  return average_price_;
}

double PositionManager::realizedPnL() const {
  std::shared_lock lock(mutex_);
  return realized_pnl_;
}

double PositionManager::unrealizedPnL() const {
  std::shared_lock lock(mutex_);
  return unrealized_pnl_;
}

std::vector<domain::TradeCycleRecord> PositionManager::cycleMetrics() const {
  std::shared_lock lock(mutex_);
  return cycle_metrics_;
}

std::optional<TradeMetrics> PositionManager::currentTradeMetric() const {
  std::shared_lock lock(mutex_);
  return current_trade_metric_;
}

}  // namespace tranche
