#include "tranche/engine/level_engine.hpp"

#include "tranche/codec/json_codec.hpp"
#include "tranche/config/config_loader.hpp"
#include "tranche/execution/bus_trade_gateway.hpp"
#include "tranche/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tranche {

namespace {

domain::EngineConfig validated(domain::EngineConfig config) {
  validateConfig(config);
  return config;
}

// Clears the dispatching flag when the outermost dispatch() unwinds.
struct DispatchGuard {
  bool& flag;
  ~DispatchGuard() { flag = false; }
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LevelEngine::LevelEngine(domain::EngineConfig config)
    : config_(validated(std::move(config))),
      level_manager_(loop_.eventBus(), config_.entry_levels,
                     config_.exit_levels, config_.max_concurrent_levels,
                     config_.instrument_factor),
      theo_book_(loop_.eventBus(), "theo", config_.instrument_factor),
      actual_book_(loop_.eventBus(), "actual", config_.instrument_factor),
      gateway_(config_.simulation
                   ? std::unique_ptr<ITradeGateway>(
                         std::make_unique<SimulatedTradeGateway>(
                             [this](Event event) { enqueue(std::move(event)); },
                             sim_clock_))
                   : std::unique_ptr<ITradeGateway>(
                         std::make_unique<BusTradeGateway>(loop_.eventBus(),
                                                           live_clock_))),
      simulated_gateway_(dynamic_cast<SimulatedTradeGateway*>(gateway_.get())),
      trade_manager_(*gateway_, order_id_gen_, clock()) {
  if (!config_.audit_path.empty()) {
    audit_log_ =
        std::make_unique<CycleAuditLog>(loop_.eventBus(), config_.audit_path);
  }

  EventBus& bus = loop_.eventBus();
  bar_sub_ = bus.subscribe<BarEvent>(
      [this](const BarEvent& e) { onBar(e); });
  fill_sub_ = bus.subscribe<FillEvent>(
      [this](const FillEvent& e) { onFill(e); });
  status_sub_ = bus.subscribe<OrderStatusEvent>(
      [this](const OrderStatusEvent& e) { onOrderStatus(e); });
  flatten_sub_ = bus.subscribe<FlattenCommandEvent>(
      [this](const FlattenCommandEvent& e) { flattenAll(e.timestamp); });

  std::cout << "[LevelEngine] Configured " << config_.instrument << ": "
            << config_.entry_levels.size() << " entry level(s), "
            << config_.exit_levels.size() << " exit level(s), max "
            << config_.max_concurrent_levels << " concurrent, "
            << (config_.simulation ? "simulated" : "live") << " execution\n";
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop, then detach handlers from the bus
// -----------------------------------------------------------------------------
LevelEngine::~LevelEngine() {
  stop();
  EventBus& bus = loop_.eventBus();
  bus.unsubscribe(bar_sub_);
  bus.unsubscribe(fill_sub_);
  bus.unsubscribe(status_sub_);
  bus.unsubscribe(flatten_sub_);
}

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void LevelEngine::start() {
  if (loop_.isRunning()) {
    return;
  }
  loop_.start();
  std::cout << "[LevelEngine] started.\n";
}

void LevelEngine::stop() {
  if (!loop_.isRunning()) {
    return;
  }
  loop_.stop();
  std::cout << "[LevelEngine] stopped. Bars processed: "
            << bars_processed_.load() << "\n";
}

// -----------------------------------------------------------------------------
// submit() / dispatch() / enqueue()
// -----------------------------------------------------------------------------
void LevelEngine::submit(Event event) { loop_.push(std::move(event)); }

void LevelEngine::dispatch(Event event) {
  if (loop_.isRunning()) {
    submit(std::move(event));
    return;
  }

  inbox_.push_back(std::move(event));
  if (dispatching_) {
    return;
  }

  dispatching_ = true;
  DispatchGuard guard{dispatching_};
  while (!inbox_.empty()) {
    Event next = std::move(inbox_.front());
    inbox_.pop_front();
    loop_.eventBus().publish(next);
  }
}

void LevelEngine::enqueue(Event event) {
  if (loop_.isRunning()) {
    loop_.push(std::move(event));
  } else {
    inbox_.push_back(std::move(event));
  }
}

const ITimeProvider& LevelEngine::clock() const {
  if (config_.simulation) {
    return sim_clock_;
  }
  return live_clock_;
}

// -----------------------------------------------------------------------------
// onBar(): mark, exits, entries, reconcile
// -----------------------------------------------------------------------------
void LevelEngine::onBar(const BarEvent& event) {
  const domain::Bar& bar = event.bar;
  if (!config_.instrument.empty() && !bar.instrument.empty() &&
      bar.instrument != config_.instrument) {
    std::cerr << "[LevelEngine] WARNING: Ignoring bar for "
              << bar.instrument << " (trading " << config_.instrument
              << ")\n";
    return;
  }

  if (config_.simulation &&
      !sim_clock_.advance_time(timestamp_to_ms(bar.timestamp))) {
    std::cerr << "[LevelEngine] WARNING: Bar timestamp "
              << timestamp_to_ms(bar.timestamp)
              << " is older than the simulation clock\n";
  }

  last_bar_ = bar;
  bars_processed_.fetch_add(1);

  theo_book_.updateTradeMetric(bar);
  actual_book_.updateTradeMetric(bar);

  if (!event.signal) {
    return;
  }
  const double signal = *event.signal;

  processExits(bar, signal);
  processEntries(bar, signal);

  if (config_.reconcile_positions) {
    reconcile(bar);
  }
}

// -----------------------------------------------------------------------------
// processExits()
// -----------------------------------------------------------------------------
void LevelEngine::processExits(const domain::Bar& bar, double signal) {
  for (const auto& [level_id, indices] :
       level_manager_.allTriggeredExitLevels(signal)) {
    for (std::size_t index : indices) {
      auto level = level_manager_.level(level_id);
      if (!level) {
        break;  // Completed by an earlier tranche
      }
      const domain::Quantity quantity = level->exitQuantityForLevel(index);
      if (quantity <= 0) {
        continue;
      }

      const domain::Side exit_side = domain::opposite(level->side());
      auto order_id = trade_manager_.createOrder(exit_side, quantity,
                                                 bar.close,
                                                 config_.instrument);
      if (order_id) {
        domain::LevelOrder level_order;
        level_order.order_id = *order_id;
        level_order.type = domain::LevelOrderType::Exit;
        level_order.quantity = quantity;
        level_order.price = bar.close;
        level_order.exit_index = index;
        level_order.created = bar.timestamp;
        level_manager_.addOrderToLevel(level_id, level_order);
      } else {
        std::cerr << "[LevelEngine] WARNING: Exit order rejected for level "
                  << level_id << " tranche " << index << "\n";
      }

      const domain::Quantity exited =
          level_manager_.executeExit(level_id, index, bar.close,
                                     bar.timestamp);
      if (exited > 0) {
        theo_book_.updatePosition(bar.timestamp, exit_side, exited,
                                  bar.close);
      }
    }
  }
}

// -----------------------------------------------------------------------------
// processEntries()
// -----------------------------------------------------------------------------
void LevelEngine::processEntries(const domain::Bar& bar, double signal) {
  if (halted_.load() || signal == 0.0) {
    return;
  }
  if (trade_manager_.hasLiveOrder() || level_manager_.atCapacity()) {
    return;
  }

  const domain::Side side =
      signal < 0.0 ? domain::Side::Buy : domain::Side::Sell;

  for (std::size_t index : level_manager_.triggeredEntryLevels(signal, side)) {
    auto result = level_manager_.createLevel(index, side,
                                             config_.position_size,
                                             bar.close, signal,
                                             bar.timestamp);
    if (result.outcome == CreateOutcome::CapacityReached) {
      break;
    }
    if (!result.created()) {
      continue;
    }

    auto order_id = trade_manager_.createOrder(side, config_.position_size,
                                               bar.close, config_.instrument);
    if (order_id) {
      domain::LevelOrder level_order;
      level_order.order_id = *order_id;
      level_order.type = domain::LevelOrderType::Entry;
      level_order.quantity = config_.position_size;
      level_order.price = bar.close;
      level_order.created = bar.timestamp;
      level_manager_.addOrderToLevel(result.level->id(), level_order);
    } else {
      std::cerr << "[LevelEngine] WARNING: Entry order rejected for level "
                << result.level->id() << "\n";
    }

    theo_book_.updatePosition(bar.timestamp, side, config_.position_size,
                              bar.close);

    // One entry per bar: the order just sent is live.
    break;
  }
}

// -----------------------------------------------------------------------------
// reconcile()
// -----------------------------------------------------------------------------
void LevelEngine::reconcile(const domain::Bar& bar) {
  if (trade_manager_.hasLiveOrder()) {
    return;
  }
  auto correction = reconciler_.proposeCorrection(
      theo_book_, actual_book_, config_.instrument, bar.close);
  if (!correction) {
    return;
  }
  if (!trade_manager_.createOrder(*correction)) {
    std::cerr << "[LevelEngine] WARNING: Correction order rejected\n";
  }
}

// -----------------------------------------------------------------------------
// onFill(): actual book, owning Level, order registry
// -----------------------------------------------------------------------------
void LevelEngine::onFill(const FillEvent& event) {
  fills_processed_.fetch_add(1);

  actual_book_.updatePosition(event.timestamp, event.side, event.quantity,
                              event.price);

  // Fills for correction orders and for orders of completed Levels have no
  // active owner; that is expected.
  level_manager_.applyFill(event.order_id, event.quantity, event.price);

  trade_manager_.handleFill(event);
}

// -----------------------------------------------------------------------------
// onOrderStatus()
// -----------------------------------------------------------------------------
void LevelEngine::onOrderStatus(const OrderStatusEvent& event) {
  trade_manager_.handleOrderUpdate(event);
  level_manager_.updateOrderStatus(event.order_id, event.status);

  if (domain::isTerminal(event.status)) {
    level_manager_.cleanupCompletedOrders();
  }
}

// -----------------------------------------------------------------------------
// flattenAll()
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> LevelEngine::flattenAll(Timestamp time) {
  const std::size_t cancelled = trade_manager_.cancelAllOrders();
  const auto closed = level_manager_.forceCloseAllLevels(time);

  std::cout << "[LevelEngine] Flatten: cancelled " << cancelled
            << " order(s), closed " << closed.size() << " level(s)\n";

  const domain::Quantity position = theo_book_.currentPosition();
  if (position == 0) {
    return std::nullopt;
  }
  if (!last_bar_) {
    std::cerr << "[LevelEngine] WARNING: Cannot flatten position "
              << position << " without a price\n";
    return std::nullopt;
  }

  const domain::Side side =
      position > 0 ? domain::Side::Sell : domain::Side::Buy;
  const domain::Quantity quantity = position > 0 ? position : -position;

  auto order_id = trade_manager_.createOrder(side, quantity, last_bar_->close,
                                             config_.instrument);
  if (!order_id) {
    std::cerr << "[LevelEngine] WARNING: Flatten order rejected\n";
    return std::nullopt;
  }
  theo_book_.updatePosition(time, side, quantity, last_bar_->close);
  return order_id;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string LevelEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["instrument"] = config_.instrument;
    response["halted"] = isHalted();
    response["running"] = isRunning();
    response["bars_processed"] = barsProcessed();
    response["fills_processed"] = fillsProcessed();
    response["backlog"] = loop_.backlog();
    response["live_order"] = trade_manager_.hasLiveOrder();
    response["levels"] = toJson(level_manager_.stats());
    response["theo"] = toJson(theo_book_.snapshot());
    response["actual"] = toJson(actual_book_.snapshot());
    response["discrepancy"] =
        reconciler_.discrepancy(theo_book_, actual_book_);
  } else if (cmd == "LEVELS") {
    nlohmann::json levels = nlohmann::json::array();
    for (const auto& level : level_manager_.activeLevels()) {
      levels.push_back(toJson(level));
    }
    response["status"] = "ok";
    response["levels"] = std::move(levels);
  } else if (cmd == "HALT") {
    halt();
    response["status"] = "ok";
    response["response"] = "Entries halted";
  } else if (cmd == "RESUME") {
    resume();
    response["status"] = "ok";
    response["response"] = "Entries resumed";
  } else if (cmd == "FLATTEN") {
    FlattenCommandEvent flatten;
    flatten.timestamp = ms_to_timestamp(clock().now_ms());
    dispatch(flatten);
    response["status"] = "ok";
    response["response"] = "Flatten queued";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace tranche
