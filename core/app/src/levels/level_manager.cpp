#include "tranche/levels/level_manager.hpp"

#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tranche {

namespace {

void validate(const std::vector<double>& entry_levels,
              const std::vector<double>& exit_levels,
              std::size_t max_concurrent_levels, double instrument_factor) {
  if (entry_levels.empty()) {
    throw std::invalid_argument("LevelManager: entry_levels must not be empty");
  }
  if (exit_levels.empty()) {
    throw std::invalid_argument("LevelManager: exit_levels must not be empty");
  }
  for (double threshold : entry_levels) {
    if (!(threshold > 0.0)) {
      throw std::invalid_argument(
          "LevelManager: entry thresholds must be > 0");
    }
  }
  for (double multiplier : exit_levels) {
    if (!(multiplier >= 0.0)) {
      throw std::invalid_argument(
          "LevelManager: exit multipliers must be >= 0");
    }
  }
  if (max_concurrent_levels == 0) {
    throw std::invalid_argument(
        "LevelManager: max_concurrent_levels must be > 0");
  }
  if (!(instrument_factor > 0.0)) {
    throw std::invalid_argument(
        "LevelManager: instrument_factor must be > 0");
  }
}

}  // namespace

const char* toString(CreateOutcome outcome) {
  switch (outcome) {
    case CreateOutcome::Created:
      return "Created";
    case CreateOutcome::Duplicate:
      return "Duplicate";
    case CreateOutcome::CapacityReached:
      return "CapacityReached";
    case CreateOutcome::Rejected:
      return "Rejected";
  }
  return "Unknown";
}

LevelManager::LevelManager(EventBus& bus, std::vector<double> entry_levels,
                           std::vector<double> exit_levels,
                           std::size_t max_concurrent_levels,
                           double instrument_factor)
    : bus_(bus),
      entry_levels_(std::move(entry_levels)),
      exit_levels_(std::move(exit_levels)),
      max_concurrent_levels_(max_concurrent_levels),
      instrument_factor_(instrument_factor) {
  validate(entry_levels_, exit_levels_, max_concurrent_levels_,
           instrument_factor_);
}

bool LevelManager::hasActiveLevelFor(double threshold,
                                     domain::Side side) const {
  for (const auto& [id, level] : active_) {
    if (level.side() == side && level.entrySignalThreshold() == threshold) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// triggeredEntryLevels
// -----------------------------------------------------------------------------
std::vector<std::size_t> LevelManager::triggeredEntryLevels(
    double signal, domain::Side side) const {
  std::shared_lock lock(mutex_);

  std::vector<std::size_t> triggered;
  if (active_.size() >= max_concurrent_levels_) {
    return triggered;
  }
  const std::size_t room = max_concurrent_levels_ - active_.size();

  for (std::size_t i = 0; i < entry_levels_.size(); ++i) {
    if (triggered.size() >= room) {
      break;
    }
    const double threshold = entry_levels_[i];
    const bool crossed = (side == domain::Side::Buy) ? signal < -threshold
                                                     : signal > threshold;
    if (crossed && !hasActiveLevelFor(threshold, side)) {
      triggered.push_back(i);
    }
  }
  return triggered;
}

// -----------------------------------------------------------------------------
// createLevel
// -----------------------------------------------------------------------------
CreateLevelResult LevelManager::createLevel(std::size_t entry_index,
                                            domain::Side side,
                                            domain::Quantity size,
                                            double price, double signal,
                                            Timestamp time) {
  CreateLevelResult result;
  LevelCreatedEvent created;

  {
    std::unique_lock lock(mutex_);

    if (entry_index >= entry_levels_.size() || size <= 0) {
      std::cerr << "[LevelManager] WARNING: rejected level for entry index "
                << entry_index << " size " << size << "\n";
      result.outcome = CreateOutcome::Rejected;
      return result;
    }

    const double threshold = entry_levels_[entry_index];
    for (const auto& [id, existing] : active_) {
      if (existing.side() == side &&
          existing.entrySignalThreshold() == threshold) {
        result.outcome = CreateOutcome::Duplicate;
        result.level = existing;
        return result;
      }
    }

    if (active_.size() >= max_concurrent_levels_) {
      result.outcome = CreateOutcome::CapacityReached;
      return result;
    }

    const LevelId id = next_level_id_++;
    Level level(id, entry_index, threshold, exit_levels_);
    level.executeEntry(time, side, size, price, signal);
    auto [it, inserted] = active_.emplace(id, std::move(level));

    result.outcome = CreateOutcome::Created;
    result.level = it->second;

    created.level_id = id;
    created.entry_index = entry_index;
    created.entry_threshold = threshold;
    created.side = side;
    created.position_size = size;
    created.entry_price = price;
    created.entry_signal = signal;
    created.timestamp = time;
  }

  std::cout << "[LevelManager] Level " << created.level_id << " created: "
            << domain::toString(side) << " " << size << " @ " << price
            << " (threshold " << created.entry_threshold << ", signal "
            << signal << ")\n";
  bus_.publish(created);
  return result;
}

// -----------------------------------------------------------------------------
// allTriggeredExitLevels
// -----------------------------------------------------------------------------
std::map<LevelId, std::vector<std::size_t>>
LevelManager::allTriggeredExitLevels(double signal) const {
  std::shared_lock lock(mutex_);

  std::map<LevelId, std::vector<std::size_t>> triggered;
  for (const auto& [id, level] : active_) {
    auto indices = level.triggeredExitLevels(signal);
    if (!indices.empty()) {
      triggered.emplace(id, std::move(indices));
    }
  }
  return triggered;
}

// -----------------------------------------------------------------------------
// executeExit: delegate, price the tranche, retire a flat Level atomically
// -----------------------------------------------------------------------------
domain::Quantity LevelManager::executeExit(LevelId level_id,
                                           std::size_t exit_index,
                                           double price, Timestamp time) {
  LevelExitEvent exit_event;

  {
    std::unique_lock lock(mutex_);

    auto it = active_.find(level_id);
    if (it == active_.end()) {
      std::cerr << "[LevelManager] WARNING: exit for inactive level "
                << level_id << ". Skipping.\n";
      return 0;
    }

    Level& level = it->second;
    const domain::Quantity exited = level.executeExit(exit_index, price, time);
    if (exited == 0) {
      return 0;
    }

    const double delta = (level.side() == domain::Side::Buy)
                             ? price - level.entryPrice()
                             : level.entryPrice() - price;

    exit_event.level_id = level_id;
    exit_event.exit_index = exit_index;
    exit_event.exit_side = domain::opposite(level.side());
    exit_event.exited_quantity = exited;
    exit_event.remaining_position = level.currentPosition();
    exit_event.exit_price = price;
    exit_event.pnl = static_cast<double>(exited) * delta * instrument_factor_;
    exit_event.timestamp = time;

    if (level.isComplete()) {
      exit_event.level_completed = true;
      forgetOrdersOf(level);
      completed_.push_back(std::move(level));
      active_.erase(it);
    }
  }

  std::cout << "[LevelManager] Level " << level_id << " exit " << exit_index
            << ": " << exit_event.exited_quantity << " @ " << price
            << " pnl=" << exit_event.pnl
            << (exit_event.level_completed ? " (completed)" : "") << "\n";
  bus_.publish(exit_event);
  return exit_event.exited_quantity;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
bool LevelManager::addOrderToLevel(LevelId level_id,
                                   const domain::LevelOrder& order) {
  std::unique_lock lock(mutex_);

  auto it = active_.find(level_id);
  if (it == active_.end()) {
    std::cerr << "[LevelManager] WARNING: order " << order.order_id
              << " for inactive level " << level_id << ". Skipping.\n";
    return false;
  }

  auto owner = order_index_.find(order.order_id);
  if (owner != order_index_.end()) {
    std::cerr << "[LevelManager] WARNING: order " << order.order_id
              << " already belongs to level " << owner->second << "\n";
    return false;
  }

  if (!it->second.addOrder(order)) {
    return false;
  }
  order_index_.emplace(order.order_id, level_id);
  return true;
}

bool LevelManager::updateOrderStatus(domain::OrderId order_id,
                                     domain::OrderStatus status) {
  std::unique_lock lock(mutex_);

  auto owner = order_index_.find(order_id);
  if (owner == order_index_.end()) {
    return false;
  }
  auto it = active_.find(owner->second);
  if (it == active_.end()) {
    return false;
  }
  return it->second.updateOrderStatus(order_id, status);
}

bool LevelManager::applyFill(domain::OrderId order_id,
                             domain::Quantity quantity, double price) {
  std::unique_lock lock(mutex_);

  auto owner = order_index_.find(order_id);
  if (owner == order_index_.end()) {
    return false;
  }
  auto it = active_.find(owner->second);
  if (it == active_.end()) {
    return false;
  }
  return it->second.applyFill(order_id, quantity, price);
}

std::optional<LevelId> LevelManager::findLevelForOrder(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);

  auto owner = order_index_.find(order_id);
  if (owner == order_index_.end()) {
    return std::nullopt;
  }
  return owner->second;
}

bool LevelManager::hasAnyPendingOrders() const {
  std::shared_lock lock(mutex_);
  for (const auto& [id, level] : active_) {
    if (level.hasPendingOrders()) {
      return true;
    }
  }
  return false;
}

std::size_t LevelManager::cleanupCompletedOrders() {
  std::unique_lock lock(mutex_);

  std::size_t removed = 0;
  for (auto& [id, level] : active_) {
    removed += level.cleanupCompletedOrders();
  }

  // Drop index entries whose order left its Level.
  for (auto it = order_index_.begin(); it != order_index_.end();) {
    auto level_it = active_.find(it->second);
    if (level_it == active_.end() || !level_it->second.hasOrder(it->first)) {
      it = order_index_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

void LevelManager::forgetOrdersOf(const Level& level) {
  for (const auto& [order_id, order] : level.orders()) {
    order_index_.erase(order_id);
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<Level> LevelManager::level(LevelId level_id) const {
  std::shared_lock lock(mutex_);
  auto it = active_.find(level_id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Level> LevelManager::levelsForSide(domain::Side side) const {
  std::shared_lock lock(mutex_);
  std::vector<Level> result;
  for (const auto& [id, level] : active_) {
    if (level.side() == side) {
      result.push_back(level);
    }
  }
  return result;
}

std::vector<Level> LevelManager::activeLevels() const {
  std::shared_lock lock(mutex_);
  std::vector<Level> result;
  result.reserve(active_.size());
  for (const auto& [id, level] : active_) {
    result.push_back(level);
  }
  return result;
}

std::vector<Level> LevelManager::completedLevels() const {
  std::shared_lock lock(mutex_);
  return completed_;
}

std::size_t LevelManager::activeLevelCount() const {
  std::shared_lock lock(mutex_);
  return active_.size();
}

bool LevelManager::atCapacity() const {
  std::shared_lock lock(mutex_);
  return active_.size() >= max_concurrent_levels_;
}

domain::Quantity LevelManager::totalCurrentPosition() const {
  std::shared_lock lock(mutex_);
  domain::Quantity total = 0;
  for (const auto& [id, level] : active_) {
    total += level.currentPosition();
  }
  return total;
}

double LevelManager::calculateTotalUnrealizedPnL(double price) const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, level] : active_) {
    total += level.calculateUnrealizedPnL(price, instrument_factor_);
  }
  return total;
}

LevelManagerStats LevelManager::statsLocked() const {
  LevelManagerStats stats;
  stats.active_levels = active_.size();
  stats.completed_levels = completed_.size();
  for (const auto& [id, level] : active_) {
    stats.total_position += level.currentPosition();
    if (level.side() == domain::Side::Buy) {
      ++stats.long_levels;
    } else {
      ++stats.short_levels;
    }
    for (const auto& [order_id, order] : level.orders()) {
      if (domain::isPending(order.status)) {
        ++stats.pending_orders;
      }
    }
  }
  return stats;
}

LevelManagerStats LevelManager::stats() const {
  std::shared_lock lock(mutex_);
  return statsLocked();
}

std::string LevelManager::toString() const {
  const LevelManagerStats s = stats();
  std::ostringstream out;
  out << "LevelManager: " << s.active_levels << " active (" << s.long_levels
      << "L/" << s.short_levels << "S), " << s.completed_levels
      << " completed, Position: " << s.total_position;
  return out.str();
}

// -----------------------------------------------------------------------------
// forceCloseAllLevels
// -----------------------------------------------------------------------------
std::vector<Level> LevelManager::forceCloseAllLevels(Timestamp time) {
  std::vector<Level> closed;
  LevelsFlattenedEvent flattened;

  {
    std::unique_lock lock(mutex_);

    closed.reserve(active_.size());
    for (auto& [id, level] : active_) {
      flattened.level_ids.push_back(id);
      flattened.abandoned_position += level.currentPosition();
      closed.push_back(level);
      completed_.push_back(std::move(level));
    }
    active_.clear();
    order_index_.clear();
    flattened.timestamp = time;
  }

  if (closed.empty()) {
    return closed;
  }

  std::cout << "[LevelManager] Force-closed " << closed.size()
            << " level(s), abandoned position "
            << flattened.abandoned_position << "\n";
  bus_.publish(flattened);
  return closed;
}

}  // namespace tranche
