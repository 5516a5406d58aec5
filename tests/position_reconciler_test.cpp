// =============================================================================
// position_reconciler_test.cpp
// =============================================================================
// Unit tests for tranche::PositionReconciler.
//
// Validates:
//   - discrepancy() is theo minus actual
//   - No correction when the books agree
//   - Correction side and size close the gap in either direction
// =============================================================================

#include "tranche/eventbus/event_bus.hpp"
#include "tranche/position/position_manager.hpp"
#include "tranche/risk/position_reconciler.hpp"
#include "tranche/time/time_utils.hpp"

#include <gtest/gtest.h>

using tranche::domain::Side;

class PositionReconcilerTest : public ::testing::Test {
 protected:
  PositionReconcilerTest()
      : theo(bus, "theo", 1.0), actual(bus, "actual", 1.0) {}

  const tranche::Timestamp t0 = tranche::ms_to_timestamp(1'700'000'000'000);

  tranche::EventBus bus;
  tranche::PositionManager theo;
  tranche::PositionManager actual;
  tranche::PositionReconciler reconciler;
};

TEST_F(PositionReconcilerTest, AgreeingBooksNeedNoCorrection) {
  theo.updatePosition(t0, Side::Sell, 2, 100.0);
  actual.updatePosition(t0, Side::Sell, 2, 100.5);

  EXPECT_EQ(reconciler.discrepancy(theo, actual), 0);
  EXPECT_FALSE(
      reconciler.proposeCorrection(theo, actual, "ES", 100.0).has_value());
}

// -----------------------------------------------------------------------------
// 1. theo +5, actual +3 → Buy 2 at the supplied price.
// -----------------------------------------------------------------------------
TEST_F(PositionReconcilerTest, ActualShortOfTheoBuysTheGap) {
  theo.updatePosition(t0, Side::Buy, 5, 100.0);
  actual.updatePosition(t0, Side::Buy, 3, 100.0);

  EXPECT_EQ(reconciler.discrepancy(theo, actual), 2);

  auto correction = reconciler.proposeCorrection(theo, actual, "ES", 101.5);
  ASSERT_TRUE(correction.has_value());
  EXPECT_EQ(correction->side, Side::Buy);
  EXPECT_EQ(correction->quantity, 2);
  EXPECT_DOUBLE_EQ(correction->limit_price, 101.5);
  EXPECT_EQ(correction->instrument, "ES");
}

// -----------------------------------------------------------------------------
// 2. theo flat, actual +4 → Sell 4.
// -----------------------------------------------------------------------------
TEST_F(PositionReconcilerTest, ActualAboveTheoSellsTheGap) {
  actual.updatePosition(t0, Side::Buy, 4, 100.0);

  EXPECT_EQ(reconciler.discrepancy(theo, actual), -4);

  auto correction = reconciler.proposeCorrection(theo, actual, "ES", 99.0);
  ASSERT_TRUE(correction.has_value());
  EXPECT_EQ(correction->side, Side::Sell);
  EXPECT_EQ(correction->quantity, 4);
}

TEST_F(PositionReconcilerTest, WorksThroughTheInterface) {
  theo.updatePosition(t0, Side::Sell, 3, 100.0);
  const tranche::IReconciler& base = reconciler;

  auto correction = base.proposeCorrection(theo, actual, "NQ", 100.0);
  ASSERT_TRUE(correction.has_value());
  EXPECT_EQ(correction->side, Side::Sell);
  EXPECT_EQ(correction->quantity, 3);
}
