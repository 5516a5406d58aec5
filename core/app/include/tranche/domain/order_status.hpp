#pragma once

#include <optional>
#include <string>

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: broker-reported order lifecycle state
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every status the host's order gateway can report for an
//         order created by the engine.
//
// @details
// The engine does not drive these transitions; it only records them. Status
// callbacks arrive from the host (possibly late or duplicated), and both the
// TradeManager and the owning Level store the latest value.
//
//   PendingNew ──> New ──> PartiallyFilled ──> Filled
//        │          │            │
//        │          ├──> Replaced ──> (back to New / PartiallyFilled)
//        ▼          ▼            ▼
//     Rejected   Cancelled    Cancelled
//
// Terminal states: Filled, Cancelled, Rejected. An order in a terminal state
// is released from pending tracking.
//
// Pending states: PendingNew, New, PartiallyFilled. A Level with any order in
// a pending state reports hasPendingOrders() == true.
//
// Thread model:
//   Plain enum, no mutable state.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  PendingNew,       // Created locally, not yet acknowledged by the broker
  New,              // Acknowledged and working
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Fully filled (terminal)
  Cancelled,        // Cancelled by request (terminal)
  Rejected,         // Rejected by the broker (terminal)
  Replaced,         // Price/quantity amended; order keeps working
};

// Returns true for Filled, Cancelled and Rejected.
inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected;
}

// Returns true for PendingNew, New and PartiallyFilled.
inline bool isPending(OrderStatus status) {
  return status == OrderStatus::PendingNew ||
         status == OrderStatus::New ||
         status == OrderStatus::PartiallyFilled;
}

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::PendingNew:
      return "PendingNew";
    case OrderStatus::New:
      return "New";
    case OrderStatus::PartiallyFilled:
      return "PartiallyFilled";
    case OrderStatus::Filled:
      return "Filled";
    case OrderStatus::Cancelled:
      return "Cancelled";
    case OrderStatus::Rejected:
      return "Rejected";
    case OrderStatus::Replaced:
      return "Replaced";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// parseOrderStatus
// -----------------------------------------------------------------------------
// @brief  Inverse of toString(OrderStatus). Used by the host wire codec.
//
// @return The matching status, or std::nullopt for an unknown name. The
//         caller decides whether an unknown name is an error.
// -----------------------------------------------------------------------------
inline std::optional<OrderStatus> parseOrderStatus(const std::string& name) {
  for (auto status : {OrderStatus::PendingNew, OrderStatus::New,
                      OrderStatus::PartiallyFilled, OrderStatus::Filled,
                      OrderStatus::Cancelled, OrderStatus::Rejected,
                      OrderStatus::Replaced}) {
    if (name == toString(status)) {
      return status;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace tranche
