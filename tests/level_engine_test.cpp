// =============================================================================
// level_engine_test.cpp
// =============================================================================
// Integration tests for tranche::LevelEngine in simulation mode.
//
// Validates:
//   - A full two-level round trip: entries, staggered exits, both books flat
//     with identical realized PnL
//   - Theoretical book moves on order creation, actual book on fills
//   - One entry per bar while an order is live
//   - Capacity and halt gate entries; exits keep running
//   - FLATTEN closes every Level and offsets the theoretical position
//   - Reconciliation sends one correcting order once no order is live
//   - IPC commands: PING, STATUS, LEVELS, unknown
//   - Threaded path: submit() on a running engine reaches both books
//   - Completed cycles reach the audit file
//
// Design:
//   Most tests drive the engine with dispatch() and never start the loop, so
//   every assertion runs after the simulated gateway's reports have been
//   applied. Endpoints are irrelevant here; no sockets are opened.
// =============================================================================

#include "tranche/engine/level_engine.hpp"
#include "tranche/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using tranche::domain::Side;

namespace {

tranche::domain::EngineConfig makeConfig() {
  tranche::domain::EngineConfig config;
  config.instrument = "ES";
  config.entry_levels = {1.0, 2.0, 3.0};
  config.exit_levels = {0.5, 0.0};
  config.position_size = 2;
  config.max_concurrent_levels = 3;
  config.instrument_factor = 1.0;
  config.simulation = true;
  config.host_endpoint.clear();
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  return config;
}

tranche::BarEvent bar(int minute, double close, std::optional<double> signal,
                      const std::string& instrument = "ES") {
  tranche::BarEvent event;
  event.bar.instrument = instrument;
  event.bar.timestamp = tranche::ms_to_timestamp(
      1'700'000'000'000 + static_cast<std::int64_t>(minute) * 60'000);
  event.bar.open = event.bar.high = event.bar.low = event.bar.close = close;
  event.signal = signal;
  return event;
}

}  // namespace

class LevelEngineTest : public ::testing::Test {
 protected:
  LevelEngineTest() : engine(makeConfig()) {}

  tranche::LevelEngine engine;
};

TEST(LevelEngineConstructionTest, RejectsInvalidConfig) {
  auto config = makeConfig();
  config.entry_levels.clear();
  EXPECT_THROW(tranche::LevelEngine{config}, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 1. Full round trip.
//
//   bar 1  close 100  signal -1.5  → Level 1 (threshold 1) Buy 2 @ 100
//   bar 2  close 101  signal -2.5  → Level 2 (threshold 2) Buy 2 @ 101
//   bar 3  close 102  signal -0.4  → exit 0 of both Levels, Sell 1 + Sell 1
//   bar 4  close 103  signal  0.1  → exit 1 of both Levels, both complete
//
//   average 100.5; realized 2 × 1.5 + 2 × 2.5 = 8 on each book.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, TwoLevelRoundTrip) {
  engine.dispatch(bar(1, 100.0, -1.5));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.actualBook().currentPosition(), 2);
  EXPECT_FALSE(engine.tradeManager().hasLiveOrder());

  engine.dispatch(bar(2, 101.0, -2.5));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 2u);
  EXPECT_EQ(engine.theoBook().currentPosition(), 4);
  ASSERT_TRUE(engine.theoBook().averagePrice().has_value());
  EXPECT_DOUBLE_EQ(*engine.theoBook().averagePrice(), 100.5);

  engine.dispatch(bar(3, 102.0, -0.4));
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.actualBook().currentPosition(), 2);
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 2u);
  EXPECT_DOUBLE_EQ(engine.theoBook().realizedPnL(), 3.0);

  engine.dispatch(bar(4, 103.0, 0.1));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 0u);
  EXPECT_EQ(engine.levelManager().stats().completed_levels, 2u);
  EXPECT_TRUE(engine.theoBook().isFlat());
  EXPECT_TRUE(engine.actualBook().isFlat());
  EXPECT_DOUBLE_EQ(engine.theoBook().realizedPnL(), 8.0);
  EXPECT_DOUBLE_EQ(engine.actualBook().realizedPnL(), 8.0);
  EXPECT_EQ(engine.theoBook().cycleMetrics().size(), 1u);
  EXPECT_EQ(engine.actualBook().cycleMetrics().size(), 1u);

  // 2 entries + 4 exits.
  ASSERT_NE(engine.simulatedGateway(), nullptr);
  EXPECT_EQ(engine.simulatedGateway()->sentOrders().size(), 6u);
  EXPECT_EQ(engine.fillsProcessed(), 6u);
  EXPECT_EQ(engine.barsProcessed(), 4u);
}

// -----------------------------------------------------------------------------
// 2. The theoretical book leads the actual book while an order is working.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, TheoMovesOnOrderActualOnFill) {
  engine.simulatedGateway()->setFillMode(
      tranche::SimulatedTradeGateway::FillMode::AcknowledgeOnly);

  engine.dispatch(bar(1, 100.0, -3.5));
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.actualBook().currentPosition(), 0);
  EXPECT_TRUE(engine.tradeManager().hasLiveOrder());

  // Signal crosses all three thresholds but only one entry is sent.
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);
  EXPECT_EQ(engine.simulatedGateway()->sentOrders().size(), 1u);

  // Still live: no further entry on the next bar.
  engine.dispatch(bar(2, 99.0, -3.5));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);

  tranche::FillEvent fill;
  fill.order_id = engine.tradeManager().currentOrderId();
  fill.side = Side::Buy;
  fill.quantity = 2;
  fill.price = 100.0;
  engine.dispatch(fill);

  tranche::OrderStatusEvent filled;
  filled.order_id = fill.order_id;
  filled.status = tranche::domain::OrderStatus::Filled;
  engine.dispatch(filled);

  EXPECT_EQ(engine.actualBook().currentPosition(), 2);
  EXPECT_FALSE(engine.tradeManager().hasLiveOrder());
}

// -----------------------------------------------------------------------------
// 3. Capacity reached: no new Level, no order.
// -----------------------------------------------------------------------------
TEST(LevelEngineCapacityTest, CapacityBlocksFurtherEntries) {
  auto config = makeConfig();
  config.max_concurrent_levels = 1;
  tranche::LevelEngine engine(config);

  engine.dispatch(bar(1, 100.0, -1.5));
  engine.dispatch(bar(2, 99.0, -2.5));
  engine.dispatch(bar(3, 98.0, -3.5));

  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.simulatedGateway()->sentOrders().size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. HALT stops entries but exits keep running.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, HaltBlocksEntriesOnly) {
  engine.dispatch(bar(1, 100.0, -1.5));
  ASSERT_EQ(engine.theoBook().currentPosition(), 2);

  auto halted = nlohmann::json::parse(engine.executeCommand("HALT"));
  EXPECT_EQ(halted["status"], "ok");
  EXPECT_TRUE(engine.isHalted());

  engine.dispatch(bar(2, 99.0, -2.5));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);

  engine.dispatch(bar(3, 101.0, 0.2));
  EXPECT_TRUE(engine.theoBook().isFlat());
  EXPECT_TRUE(engine.actualBook().isFlat());
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 0u);

  engine.executeCommand("RESUME");
  EXPECT_FALSE(engine.isHalted());
  engine.dispatch(bar(4, 100.0, -1.5));
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. FLATTEN: every Level force-closed, position offset at the last close.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, FlattenCommandClosesEverything) {
  engine.dispatch(bar(1, 100.0, -1.5));
  engine.dispatch(bar(2, 98.0, -2.5));
  ASSERT_EQ(engine.theoBook().currentPosition(), 4);

  auto response = nlohmann::json::parse(engine.executeCommand("FLATTEN"));
  EXPECT_EQ(response["status"], "ok");

  EXPECT_EQ(engine.levelManager().activeLevelCount(), 0u);
  EXPECT_TRUE(engine.theoBook().isFlat());
  EXPECT_TRUE(engine.actualBook().isFlat());

  auto sent = engine.simulatedGateway()->sentOrders();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent.back().side, Side::Sell);
  EXPECT_EQ(sent.back().quantity, 4);
  EXPECT_DOUBLE_EQ(sent.back().limit_price, 98.0);
}

TEST_F(LevelEngineTest, FlattenWhileFlatSendsNothing) {
  EXPECT_FALSE(engine.flattenAll(tranche::ms_to_timestamp(0)).has_value());
  EXPECT_TRUE(engine.simulatedGateway()->sentOrders().empty());
}

// -----------------------------------------------------------------------------
// 6. Reconciliation: a cancelled entry leaves actual behind theo; the next
//    bar with no live order sends Buy 2.
// -----------------------------------------------------------------------------
TEST(LevelEngineReconcileTest, CorrectsAfterCancelledEntry) {
  auto config = makeConfig();
  config.reconcile_positions = true;
  tranche::LevelEngine engine(config);
  engine.simulatedGateway()->setFillMode(
      tranche::SimulatedTradeGateway::FillMode::AcknowledgeOnly);

  engine.dispatch(bar(1, 100.0, -1.5));
  const auto entry_id = engine.tradeManager().currentOrderId();
  ASSERT_NE(entry_id, 0u);

  // Still live: no correction yet.
  EXPECT_EQ(engine.simulatedGateway()->sentOrders().size(), 1u);

  ASSERT_TRUE(engine.tradeManager().cancelOrder(entry_id));
  engine.dispatch(bar(2, 100.5, -1.2));

  auto sent = engine.simulatedGateway()->sentOrders();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent.back().side, Side::Buy);
  EXPECT_EQ(sent.back().quantity, 2);
  EXPECT_DOUBLE_EQ(sent.back().limit_price, 100.5);
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.actualBook().currentPosition(), 0);
}

// -----------------------------------------------------------------------------
// 7. Bars for another instrument and mark-only bars.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, IgnoresOtherInstrument) {
  engine.dispatch(bar(1, 100.0, -1.5, "NQ"));
  EXPECT_EQ(engine.barsProcessed(), 0u);
  EXPECT_EQ(engine.levelManager().activeLevelCount(), 0u);
}

TEST_F(LevelEngineTest, MarkOnlyBarUpdatesUnrealized) {
  engine.dispatch(bar(1, 100.0, -1.5));
  engine.dispatch(bar(2, 97.0, std::nullopt));

  EXPECT_EQ(engine.levelManager().activeLevelCount(), 1u);
  EXPECT_DOUBLE_EQ(engine.theoBook().unrealizedPnL(), -6.0);
  EXPECT_DOUBLE_EQ(engine.actualBook().unrealizedPnL(), -6.0);
}

// -----------------------------------------------------------------------------
// 8. IPC commands.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, PingStatusLevelsAndUnknown) {
  auto ping = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(ping["response"], "PONG");

  engine.dispatch(bar(1, 100.0, -1.5));

  auto status = nlohmann::json::parse(engine.executeCommand("STATUS"));
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["instrument"], "ES");
  EXPECT_EQ(status["bars_processed"], 1);
  EXPECT_EQ(status["levels"]["active_levels"], 1);
  EXPECT_EQ(status["theo"]["current_position"], 2);
  EXPECT_EQ(status["actual"]["current_position"], 2);
  EXPECT_EQ(status["discrepancy"], 0);

  auto levels = nlohmann::json::parse(engine.executeCommand("LEVELS"));
  ASSERT_EQ(levels["levels"].size(), 1u);
  EXPECT_EQ(levels["levels"][0]["side"], "Buy");
  EXPECT_EQ(levels["levels"][0]["position_size"], 2);

  auto unknown = nlohmann::json::parse(engine.executeCommand("SELFDESTRUCT"));
  EXPECT_EQ(unknown["status"], "error");
}

// -----------------------------------------------------------------------------
// 9. Threaded path: submit() on a running engine.
// -----------------------------------------------------------------------------
TEST_F(LevelEngineTest, SubmitOnRunningEngine) {
  std::mutex m;
  std::condition_variable cv;
  bool actual_updated = false;

  engine.eventBus().subscribe<tranche::PositionUpdateEvent>(
      [&](const tranche::PositionUpdateEvent& e) {
        if (e.position.book != "actual") {
          return;
        }
        std::lock_guard lock(m);
        actual_updated = true;
        cv.notify_one();
      });

  engine.start();
  EXPECT_TRUE(engine.isRunning());
  engine.submit(bar(1, 100.0, -1.5));

  {
    std::unique_lock lock(m);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2),
                            [&] { return actual_updated; }))
        << "Timed out waiting for the simulated fill";
  }
  engine.stop();

  EXPECT_FALSE(engine.isRunning());
  EXPECT_EQ(engine.theoBook().currentPosition(), 2);
  EXPECT_EQ(engine.actualBook().currentPosition(), 2);
}

// -----------------------------------------------------------------------------
// 10. Completed cycles from both books land in the audit file.
// -----------------------------------------------------------------------------
TEST(LevelEngineAuditTest, CyclesReachAuditFile) {
  const auto dir =
      std::filesystem::temp_directory_path() / "tranche_engine_audit";
  std::filesystem::remove_all(dir);

  auto config = makeConfig();
  config.audit_path = (dir / "cycles.jsonl").string();
  {
    tranche::LevelEngine engine(config);
    ASSERT_NE(engine.auditLog(), nullptr);

    engine.dispatch(bar(1, 100.0, -1.5));
    engine.dispatch(bar(2, 101.0, -0.4));
    engine.dispatch(bar(3, 102.0, 0.1));

    auto records = engine.auditLog()->readAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].side, Side::Buy);
    EXPECT_EQ(records[0].max_position, 2);
  }
  std::filesystem::remove_all(dir);
}
