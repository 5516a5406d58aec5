#pragma once

#include "tranche/audit/cycle_audit_log.hpp"
#include "tranche/concurrent/event_loop_thread.hpp"
#include "tranche/concurrent/order_id_generator.hpp"
#include "tranche/domain/bar.hpp"
#include "tranche/domain/engine_config.hpp"
#include "tranche/events/event.hpp"
#include "tranche/execution/i_trade_gateway.hpp"
#include "tranche/execution/simulated_trade_gateway.hpp"
#include "tranche/execution/trade_manager.hpp"
#include "tranche/levels/level_manager.hpp"
#include "tranche/position/position_manager.hpp"
#include "tranche/risk/position_reconciler.hpp"
#include "tranche/time/live_time_provider.hpp"
#include "tranche/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// LevelEngine
// -----------------------------------------------------------------------------
//
// @brief  Drives the multi-level strategy: turns bars into Level entries and
//         exits, keeps the theoretical and actual books, and routes orders
//         through the TradeManager.
//
// @details
// One engine trades one instrument. Per bar with a signal:
//
//   1. Mark both books to the bar close (updateTradeMetric).
//   2. Exits: every (Level, exit index) whose threshold the signal crossed is
//      closed theoretically and an offsetting order is sent for the tranche.
//   3. Entries: only while no order is live and capacity remains. Buy levels
//      open on signal < -threshold, Sell levels on signal > threshold. At most
//      one entry order is sent per bar, since the first one makes an order
//      live.
//   4. Reconciliation (optional): when no order is live and the actual book
//      differs from the theoretical book, one correcting order is sent.
//
// The theoretical book is updated when an order is created; the actual book
// only when a FillEvent arrives. Exits run before entries so capacity freed
// by a completed Level is available to the same bar.
//
// Event sources:
//   submit()  : from any thread; queued on the engine loop.
//   dispatch(): synchronous, for backtests and tests that never call
//                start(). Events produced while handling (e.g. simulated
//                fills) are drained before dispatch() returns.
//
// Thread model:
//   After start(), every handler runs on the single engine loop thread.
//   executeCommand() may be called from the IPC thread; it only reads
//   components through their own locks, toggles the atomic halt flag, or
//   queues a FlattenCommandEvent.
//
// Ownership:
//   LevelEngine
//    ├── config_           (EngineConfig, immutable)
//    ├── sim_clock_        (SimulationTimeProvider, bar-driven time)
//    ├── live_clock_       (LiveTimeProvider, wall-clock time)
//    ├── order_id_gen_     (OrderIdGenerator)
//    ├── loop_             (EventLoopThread, owns the engine EventBus)
//    ├── level_manager_    (LevelManager)
//    ├── theo_book_        (PositionManager "theo")
//    ├── actual_book_      (PositionManager "actual")
//    ├── reconciler_       (PositionReconciler)
//    ├── gateway_          (unique_ptr<ITradeGateway>)
//    ├── trade_manager_    (TradeManager, refers to gateway_)
//    └── audit_log_        (unique_ptr<CycleAuditLog>, optional)
//
// Members are declared in dependency order so reverse destruction tears
// subscribers down before the bus they subscribed to.
// -----------------------------------------------------------------------------
class LevelEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Validates the config and wires every component.
  //
  // @throws std::invalid_argument if validateConfig() rejects the config.
  //
  // @details
  // No thread is spawned. With config.simulation the gateway is a
  // SimulatedTradeGateway feeding its reports back into the engine;
  // otherwise a BusTradeGateway publishes order requests on eventBus() for
  // a network bridge to forward.
  // -------------------------------------------------------------------------
  explicit LevelEngine(domain::EngineConfig config);

  // Destructor calls stop() for RAII safety.
  ~LevelEngine();

  LevelEngine(const LevelEngine&) = delete;
  LevelEngine& operator=(const LevelEngine&) = delete;
  LevelEngine(LevelEngine&&) = delete;
  LevelEngine& operator=(LevelEngine&&) = delete;

  // Starts the engine loop thread. Idempotent.
  void start();

  // Stops and joins the engine loop thread. Idempotent.
  void stop();

  bool isRunning() const { return loop_.isRunning(); }

  // Queues an event on the engine loop. Safe from any thread.
  void submit(Event event);

  // -------------------------------------------------------------------------
  // dispatch(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes an event on the calling thread, then drains every
  //         event the handlers produced.
  //
  // @details
  // Only valid while the loop is not running; if it is, the event is
  // forwarded to submit() instead so handlers never run on two threads.
  // Re-entrant calls (a handler dispatching) append to the inbox and
  // return; the outermost call drains it. Reports the simulated gateway
  // makes outside dispatch() (e.g. a cancel from the caller) wait in the
  // inbox and are drained, in order, by the next dispatch().
  // -------------------------------------------------------------------------
  void dispatch(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles an IPC command and returns a JSON response string.
  //
  // @details
  // Supported commands:
  //   "PING"     → {"status":"ok","response":"PONG"}
  //   "STATUS"   → books, level stats, live order, halt flag, counters
  //   "LEVELS"   → {"status":"ok","levels":[...active Levels...]}
  //   "HALT"     → stops new entries (exits keep running)
  //   "RESUME"   → re-enables entries
  //   "FLATTEN"  → queues a FlattenCommandEvent
  //   other      → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // -------------------------------------------------------------------------
  // flattenAll(time)
  // -------------------------------------------------------------------------
  //
  // @brief  Cancels working orders, force-closes every active Level and
  //         sends one offsetting order for the abandoned position.
  //
  // @return The id of the offsetting order, or nullopt when nothing was open.
  //
  // @details
  // Runs on the engine loop (FlattenCommandEvent) or directly while the
  // loop is stopped. The offsetting order is priced at the last bar close
  // and applied to the theoretical book immediately.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderId> flattenAll(Timestamp time);

  // Kill switch for new entries. Exits and fills are still processed.
  void halt() { halted_.store(true); }
  void resume() { halted_.store(false); }
  bool isHalted() const { return halted_.load(); }

  const domain::EngineConfig& config() const { return config_; }
  EventBus& eventBus() { return loop_.eventBus(); }
  LevelManager& levelManager() { return level_manager_; }
  const LevelManager& levelManager() const { return level_manager_; }
  PositionManager& theoBook() { return theo_book_; }
  const PositionManager& theoBook() const { return theo_book_; }
  PositionManager& actualBook() { return actual_book_; }
  const PositionManager& actualBook() const { return actual_book_; }
  TradeManager& tradeManager() { return trade_manager_; }
  const TradeManager& tradeManager() const { return trade_manager_; }

  // Null unless config.simulation is set.
  SimulatedTradeGateway* simulatedGateway() { return simulated_gateway_; }

  // Null unless config.audit_path is set.
  const CycleAuditLog* auditLog() const { return audit_log_.get(); }

  std::uint64_t barsProcessed() const { return bars_processed_.load(); }
  std::uint64_t fillsProcessed() const { return fills_processed_.load(); }

 private:
  void onBar(const BarEvent& event);
  void onFill(const FillEvent& event);
  void onOrderStatus(const OrderStatusEvent& event);

  void processExits(const domain::Bar& bar, double signal);
  void processEntries(const domain::Bar& bar, double signal);
  void reconcile(const domain::Bar& bar);

  // Gateway sink: loop queue while running, dispatch inbox otherwise.
  void enqueue(Event event);

  const ITimeProvider& clock() const;

  const domain::EngineConfig config_;

  SimulationTimeProvider sim_clock_;
  LiveTimeProvider live_clock_;
  OrderIdGenerator order_id_gen_;

  EventLoopThread loop_;

  LevelManager level_manager_;
  PositionManager theo_book_;
  PositionManager actual_book_;
  PositionReconciler reconciler_;

  std::unique_ptr<ITradeGateway> gateway_;
  SimulatedTradeGateway* simulated_gateway_{nullptr};
  TradeManager trade_manager_;

  std::unique_ptr<CycleAuditLog> audit_log_;

  EventBus::SubscriptionId bar_sub_{0};
  EventBus::SubscriptionId fill_sub_{0};
  EventBus::SubscriptionId status_sub_{0};
  EventBus::SubscriptionId flatten_sub_{0};

  // Dispatch inbox, only touched on the dispatching thread.
  std::deque<Event> inbox_;
  bool dispatching_{false};

  std::optional<domain::Bar> last_bar_;

  std::atomic<bool> halted_{false};
  std::atomic<std::uint64_t> bars_processed_{0};
  std::atomic<std::uint64_t> fills_processed_{0};
};

}  // namespace tranche
