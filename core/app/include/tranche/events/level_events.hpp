#pragma once

#include "tranche/domain/order.hpp"
#include "tranche/time/timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tranche {

// Level identifiers come from LevelManager's monotonic counter. 0 is never
// assigned.
using LevelId = std::uint64_t;

// -----------------------------------------------------------------------------
// LevelCreatedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by LevelManager::createLevel() after a new Level has
//         been entered and added to the active set.
//
// @details
// Carries the entry parameters by value so subscribers (audit, telemetry)
// never reach into LevelManager's state.
// -----------------------------------------------------------------------------
struct LevelCreatedEvent {
  LevelId level_id{};
  std::size_t entry_index{0};
  double entry_threshold{0.0};
  domain::Side side{domain::Side::Buy};
  domain::Quantity position_size{0};
  double entry_price{0.0};
  double entry_signal{0.0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// LevelExitEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by LevelManager::executeExit() for every exit that moved
//         quantity (exited_quantity > 0).
//
// @details
// pnl is the exit's contribution measured from the Level's entry price and
// scaled by the instrument factor. level_completed is true when this exit
// drove the Level flat and it moved to the completed set.
// -----------------------------------------------------------------------------
struct LevelExitEvent {
  LevelId level_id{};
  std::size_t exit_index{0};
  domain::Side exit_side{domain::Side::Sell};
  domain::Quantity exited_quantity{0};
  domain::Quantity remaining_position{0};
  double exit_price{0.0};
  double pnl{0.0};
  bool level_completed{false};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// LevelsFlattenedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by LevelManager::forceCloseAllLevels() with the ids of
//         every Level moved to the completed set without exit orders.
// -----------------------------------------------------------------------------
struct LevelsFlattenedEvent {
  std::vector<LevelId> level_ids;
  domain::Quantity abandoned_position{0};
  Timestamp timestamp{};
};

}  // namespace tranche
