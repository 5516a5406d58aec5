// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tranche::EventBus.
//
// Validates:
//   - Generic subscription sees every event type
//   - Typed subscription filters on the variant alternative
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - A subscriber may publish from inside its callback
//   - Payloads survive the variant dispatch intact
//
// All tests are single-threaded. Cross-thread delivery is covered in
// concurrency_test.cpp and level_engine_test.cpp.
// =============================================================================

#include "tranche/eventbus/event_bus.hpp"
#include "tranche/events/event.hpp"
#include "tranche/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  static tranche::BarEvent makeBar(double close, double signal) {
    tranche::BarEvent e;
    e.bar.instrument = "ES";
    e.bar.timestamp = tranche::ms_to_timestamp(1'700'000'000'000);
    e.bar.close = close;
    e.signal = signal;
    return e;
  }

  static tranche::FillEvent makeFill(tranche::domain::OrderId id) {
    tranche::FillEvent e;
    e.order_id = id;
    e.side = tranche::domain::Side::Sell;
    e.quantity = 2;
    e.price = 101.25;
    return e;
  }

  tranche::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. Generic subscribers see every alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const tranche::Event&) { ++call_count; });

  bus.publish(makeBar(100.0, -1.0));
  bus.publish(makeFill(1));
  bus.publish(tranche::LevelsFlattenedEvent{});
  bus.publish(tranche::FlattenCommandEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. Typed subscribers fire only for their alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  int bars = 0;
  int fills = 0;
  bus.subscribe<tranche::BarEvent>(
      [&bars](const tranche::BarEvent&) { ++bars; });
  bus.subscribe<tranche::FillEvent>(
      [&fills](const tranche::FillEvent&) { ++fills; });

  bus.publish(makeBar(100.0, -1.0));
  bus.publish(makeBar(101.0, 0.5));
  bus.publish(makeFill(3));
  bus.publish(tranche::OrderStatusEvent{});

  EXPECT_EQ(bars, 2);
  EXPECT_EQ(fills, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Subscribers run in subscription order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscribersRunInOrder) {
  std::vector<int> order;
  bus.subscribe<tranche::FillEvent>(
      [&order](const tranche::FillEvent&) { order.push_back(1); });
  bus.subscribe<tranche::FillEvent>(
      [&order](const tranche::FillEvent&) { order.push_back(2); });
  bus.subscribe([&order](const tranche::Event&) { order.push_back(3); });

  bus.publish(makeFill(1));

  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 4. Unsubscribe.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<tranche::BarEvent>(
      [&call_count](const tranche::BarEvent&) { ++call_count; });

  bus.publish(makeBar(100.0, -1.0));
  bus.unsubscribe(id);
  bus.publish(makeBar(100.0, -1.0));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeFill(1)));
}

// -----------------------------------------------------------------------------
// 5. Re-entrant publish: a fill handler publishes a position update.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int updates = 0;
  bus.subscribe<tranche::PositionUpdateEvent>(
      [&updates](const tranche::PositionUpdateEvent&) { ++updates; });

  bus.subscribe<tranche::FillEvent>([this](const tranche::FillEvent& fill) {
    tranche::PositionUpdateEvent update;
    update.position.book = "actual";
    update.position.current_position = -fill.quantity;
    bus.publish(update);
  });

  bus.publish(makeFill(5));

  EXPECT_EQ(updates, 1);
}

// -----------------------------------------------------------------------------
// 6. Payload integrity, including the optional signal.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  tranche::BarEvent received;
  bus.subscribe<tranche::BarEvent>(
      [&received](const tranche::BarEvent& e) { received = e; });

  bus.publish(makeBar(4501.25, -2.75));

  EXPECT_EQ(received.bar.instrument, "ES");
  EXPECT_DOUBLE_EQ(received.bar.close, 4501.25);
  ASSERT_TRUE(received.signal.has_value());
  EXPECT_DOUBLE_EQ(*received.signal, -2.75);
}
