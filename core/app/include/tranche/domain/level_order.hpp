#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/domain/order_status.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstddef>
#include <optional>

namespace tranche {
namespace domain {

// Whether an order opens a Level or works one of its exit tranches.
enum class LevelOrderType {
  Entry,
  Exit,
};

inline const char* toString(LevelOrderType type) {
  return type == LevelOrderType::Entry ? "Entry" : "Exit";
}

// -----------------------------------------------------------------------------
// LevelOrder: an order as seen from the Level that owns it
// -----------------------------------------------------------------------------
//
// @details
// exit_index is empty for entry orders and for exits not tied to a single
// tranche. filled_quantity never exceeds quantity (Level::applyFill clamps).
// -----------------------------------------------------------------------------
struct LevelOrder {
  OrderId order_id{};
  LevelOrderType type{LevelOrderType::Entry};
  Quantity quantity{0};
  double price{0.0};
  std::optional<std::size_t> exit_index;
  OrderStatus status{OrderStatus::PendingNew};
  Quantity filled_quantity{0};
  Timestamp created{};
};

}  // namespace domain
}  // namespace tranche
