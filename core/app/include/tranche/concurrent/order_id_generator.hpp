#pragma once

#include "tranche/domain/order.hpp"

#include <atomic>

namespace tranche {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Monotonic source of engine order ids, starting at 1.
//
// @details
// 0 is reserved: TradeManager::currentOrderId() returns 0 when no order is
// live, and an order id of 0 on the wire is always rejected. Ids are unique
// for the lifetime of the generator, which is the lifetime of the
// LevelEngine, so an id is never reused by a later Level.
//
// Owned by LevelEngine as a value member and injected into TradeManager by
// reference; there is no global instance.
//
// Thread model:
//   next_id() is safe from any thread (relaxed fetch_add; uniqueness is the
//   only property required).
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // The id the next call will return. Read-only; for telemetry.
  domain::OrderId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace tranche
