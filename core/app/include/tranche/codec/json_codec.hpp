#pragma once

#include "tranche/domain/position.hpp"
#include "tranche/domain/trade_cycle_record.hpp"
#include "tranche/events/event.hpp"
#include "tranche/levels/level.hpp"
#include "tranche/levels/level_manager.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  The single place where engine types meet nlohmann::json: host
//         wire messages in, telemetry and audit records out.
//
// @details
// Conventions shared by every direction:
//   - field names are the struct member names (snake_case);
//   - timestamps are integers, epoch milliseconds;
//   - sides are "Buy" / "Sell", statuses use the OrderStatus names;
//   - every telemetry message carries a "type" discriminator.
//
// Host → engine (decodeHostMessage):
//   {"type":"bar", "instrument":"ES", "timestamp":..., "open":...,
//    "high":..., "low":..., "close":..., "volume":..., "signal":-2.1}
//       "signal" may be absent or null (mark-to-market only).
//   {"type":"fill", "order_id":7, "side":"Sell", "quantity":2,
//    "price":101.25, "timestamp":...}
//   {"type":"order_status", "order_id":7, "status":"Filled",
//    "timestamp":...}
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::TradeCycleRecord& record);
nlohmann::json toJson(const domain::PositionSnapshot& snapshot);
nlohmann::json toJson(const LevelManagerStats& stats);
nlohmann::json toJson(const Level& level);
nlohmann::json toJson(const domain::Order& order);

// Inverse of toJson(TradeCycleRecord). Throws nlohmann::json::exception on
// missing or mistyped fields and std::invalid_argument on an unknown side.
domain::TradeCycleRecord cycleRecordFromJson(const nlohmann::json& j);

// -------------------------------------------------------------------------
// decodeHostMessage(payload)
// -------------------------------------------------------------------------
// @return BarEvent, FillEvent or OrderStatusEvent; std::nullopt (with a
//         warning on std::cerr) for malformed JSON, an unknown "type", an
//         unknown side/status, order_id 0 or a fill quantity <= 0.
// -------------------------------------------------------------------------
std::optional<Event> decodeHostMessage(const std::string& payload);

// -------------------------------------------------------------------------
// toTelemetry(event) / formatTelemetry(event)
// -------------------------------------------------------------------------
// @return One JSON object (with its "type") for outbound and notification
//         events; std::nullopt for inbound host events and commands, which
//         are never echoed. formatTelemetry() is the dumped single line.
// -------------------------------------------------------------------------
std::optional<nlohmann::json> toTelemetry(const Event& event);
std::optional<std::string> formatTelemetry(const Event& event);

}  // namespace tranche
