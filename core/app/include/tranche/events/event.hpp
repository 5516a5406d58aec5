#pragma once

#include "level_events.hpp"
#include "event_types.hpp"
#include "order_event.hpp"
#include "position_update_event.hpp"
#include <variant>

namespace tranche {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything that moves through
// an EventBus or an EventLoopThread queue.
//
// Inbound (host → engine):   BarEvent, FillEvent, OrderStatusEvent,
//                            FlattenCommandEvent (operator)
// Outbound (engine → host):  OrderRequestEvent, CancelRequestEvent,
//                            ReplaceRequestEvent
// Notifications (observers): LevelCreatedEvent, LevelExitEvent,
//                            LevelsFlattenedEvent, PositionUpdateEvent,
//                            CycleCompletedEvent
//
// std::variant keeps value semantics: no heap allocation per event, and a
// typed subscribe<T>() dispatches with std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BarEvent,
    FillEvent,
    OrderStatusEvent,
    FlattenCommandEvent,
    OrderRequestEvent,
    CancelRequestEvent,
    ReplaceRequestEvent,
    LevelCreatedEvent,
    LevelExitEvent,
    LevelsFlattenedEvent,
    PositionUpdateEvent,
    CycleCompletedEvent>;

}  // namespace tranche
