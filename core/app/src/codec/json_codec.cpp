#include "tranche/codec/json_codec.hpp"
#include "tranche/time/time_utils.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace tranche {

namespace {

std::optional<Event> decodeBar(const nlohmann::json& j) {
  BarEvent event;
  domain::Bar& bar = event.bar;
  bar.instrument = j.value("instrument", std::string{});
  bar.timestamp = ms_to_timestamp(j.at("timestamp").get<std::int64_t>());
  bar.close = j.at("close").get<double>();
  bar.open = j.value("open", bar.close);
  bar.high = j.value("high", bar.close);
  bar.low = j.value("low", bar.close);
  bar.volume = j.value("volume", 0.0);

  auto signal = j.find("signal");
  if (signal != j.end() && !signal->is_null()) {
    event.signal = signal->get<double>();
  }
  return event;
}

std::optional<Event> decodeFill(const nlohmann::json& j) {
  FillEvent event;
  event.order_id = j.at("order_id").get<domain::OrderId>();
  event.quantity = j.at("quantity").get<domain::Quantity>();
  event.price = j.at("price").get<double>();
  event.timestamp = ms_to_timestamp(j.at("timestamp").get<std::int64_t>());

  auto side = domain::parseSide(j.at("side").get<std::string>());
  if (!side) {
    std::cerr << "[JsonCodec] WARNING: unknown side in fill: " << j.dump()
              << "\n";
    return std::nullopt;
  }
  event.side = *side;

  if (event.order_id == 0 || event.quantity <= 0) {
    std::cerr << "[JsonCodec] WARNING: invalid fill: " << j.dump() << "\n";
    return std::nullopt;
  }
  return event;
}

std::optional<Event> decodeOrderStatus(const nlohmann::json& j) {
  OrderStatusEvent event;
  event.order_id = j.at("order_id").get<domain::OrderId>();
  event.timestamp = ms_to_timestamp(j.value("timestamp", std::int64_t{0}));

  auto status = domain::parseOrderStatus(j.at("status").get<std::string>());
  if (!status) {
    std::cerr << "[JsonCodec] WARNING: unknown order status: " << j.dump()
              << "\n";
    return std::nullopt;
  }
  event.status = *status;

  if (event.order_id == 0) {
    std::cerr << "[JsonCodec] WARNING: order status without order id\n";
    return std::nullopt;
  }
  return event;
}

}  // namespace

// -----------------------------------------------------------------------------
// Records
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::TradeCycleRecord& record) {
  nlohmann::json j;
  j["first_fill"] = timestamp_to_ms(record.first_fill);
  j["last_fill"] = timestamp_to_ms(record.last_fill);
  j["side"] = domain::toString(record.side);
  j["average_price"] = record.average_price;
  j["exit_price"] = record.exit_price;
  j["average_price_delta"] = record.average_price_delta;
  j["cycle_time_minutes"] = record.cycle_time_minutes;
  j["max_adverse_excursion"] = record.max_adverse_excursion;
  j["max_favorable_excursion"] = record.max_favorable_excursion;
  j["max_position"] = record.max_position;
  j["time_since_last_fill_minutes"] = record.time_since_last_fill_minutes;
  j["pnl"] = record.pnl;
  return j;
}

domain::TradeCycleRecord cycleRecordFromJson(const nlohmann::json& j) {
  domain::TradeCycleRecord record;
  record.first_fill = ms_to_timestamp(j.at("first_fill").get<std::int64_t>());
  record.last_fill = ms_to_timestamp(j.at("last_fill").get<std::int64_t>());

  auto side = domain::parseSide(j.at("side").get<std::string>());
  if (!side) {
    throw std::invalid_argument("cycle record: unknown side");
  }
  record.side = *side;

  record.average_price = j.at("average_price").get<double>();
  record.exit_price = j.at("exit_price").get<double>();
  record.average_price_delta = j.at("average_price_delta").get<double>();
  record.cycle_time_minutes = j.at("cycle_time_minutes").get<double>();
  record.max_adverse_excursion = j.at("max_adverse_excursion").get<double>();
  record.max_favorable_excursion =
      j.at("max_favorable_excursion").get<double>();
  record.max_position = j.at("max_position").get<domain::Quantity>();
  record.time_since_last_fill_minutes =
      j.at("time_since_last_fill_minutes").get<double>();
  record.pnl = j.at("pnl").get<double>();
  return record;
}

nlohmann::json toJson(const domain::PositionSnapshot& snapshot) {
  nlohmann::json j;
  j["book"] = snapshot.book;
  j["current_position"] = snapshot.current_position;
  if (snapshot.average_price) {
    j["average_price"] = *snapshot.average_price;
  } else {
    j["average_price"] = nullptr;
  }
  j["realized_pnl"] = snapshot.realized_pnl;
  j["unrealized_pnl"] = snapshot.unrealized_pnl;
  j["last_price"] = snapshot.last_price;
  j["completed_cycles"] = snapshot.completed_cycles;
  return j;
}

nlohmann::json toJson(const LevelManagerStats& stats) {
  nlohmann::json j;
  j["active_levels"] = stats.active_levels;
  j["completed_levels"] = stats.completed_levels;
  j["total_position"] = stats.total_position;
  j["long_levels"] = stats.long_levels;
  j["short_levels"] = stats.short_levels;
  j["pending_orders"] = stats.pending_orders;
  return j;
}

nlohmann::json toJson(const Level& level) {
  nlohmann::json j;
  j["id"] = level.id();
  j["entry_index"] = level.entryIndex();
  j["entry_signal_threshold"] = level.entrySignalThreshold();
  j["actual_entry_signal"] = level.actualEntrySignal();
  j["entry_price"] = level.entryPrice();
  j["entry_time"] = timestamp_to_ms(level.entryTime());
  j["side"] = domain::toString(level.side());
  j["position_size"] = level.positionSize();
  j["current_position"] = level.currentPosition();

  nlohmann::json exits = nlohmann::json::array();
  for (const auto& [index, remaining] : level.exitLevelStatus()) {
    exits.push_back({{"exit_index", index},
                     {"multiplier", level.exitLevels()[index]},
                     {"remaining", remaining}});
  }
  j["exit_levels"] = exits;
  j["open_orders"] = level.orders().size();
  return j;
}

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["order_id"] = order.id;
  j["instrument"] = order.instrument;
  j["side"] = domain::toString(order.side);
  j["quantity"] = order.quantity;
  j["limit_price"] = order.limit_price;
  j["status"] = domain::toString(order.status);
  j["filled_quantity"] = order.filled_quantity;
  return j;
}

// -----------------------------------------------------------------------------
// decodeHostMessage
// -----------------------------------------------------------------------------
std::optional<Event> decodeHostMessage(const std::string& payload) {
  try {
    auto j = nlohmann::json::parse(payload);
    const std::string type = j.at("type").get<std::string>();

    if (type == "bar") {
      return decodeBar(j);
    }
    if (type == "fill") {
      return decodeFill(j);
    }
    if (type == "order_status") {
      return decodeOrderStatus(j);
    }

    std::cerr << "[JsonCodec] WARNING: unknown message type '" << type
              << "'. Skipping.\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[JsonCodec] JSON parse error: " << e.what()
              << " | payload: " << payload << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// toTelemetry / formatTelemetry
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> toTelemetry(const Event& event) {
  nlohmann::json j;

  if (const auto* e = std::get_if<OrderRequestEvent>(&event)) {
    j = toJson(e->order);
    j["type"] = "order_request";
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<CancelRequestEvent>(&event)) {
    j["type"] = "cancel_request";
    j["order_id"] = e->order_id;
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<ReplaceRequestEvent>(&event)) {
    j["type"] = "replace_request";
    j["order_id"] = e->order_id;
    j["new_price"] = e->new_price;
    j["new_quantity"] = e->new_quantity;
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j = toJson(e->position);
    j["type"] = "position_update";
  } else if (const auto* e = std::get_if<CycleCompletedEvent>(&event)) {
    j = toJson(e->record);
    j["type"] = "cycle_completed";
    j["book"] = e->book;
  } else if (const auto* e = std::get_if<LevelCreatedEvent>(&event)) {
    j["type"] = "level_created";
    j["level_id"] = e->level_id;
    j["entry_index"] = e->entry_index;
    j["entry_threshold"] = e->entry_threshold;
    j["side"] = domain::toString(e->side);
    j["position_size"] = e->position_size;
    j["entry_price"] = e->entry_price;
    j["entry_signal"] = e->entry_signal;
  } else if (const auto* e = std::get_if<LevelExitEvent>(&event)) {
    j["type"] = "level_exit";
    j["level_id"] = e->level_id;
    j["exit_index"] = e->exit_index;
    j["side"] = domain::toString(e->exit_side);
    j["exited_quantity"] = e->exited_quantity;
    j["remaining_position"] = e->remaining_position;
    j["exit_price"] = e->exit_price;
    j["pnl"] = e->pnl;
    j["level_completed"] = e->level_completed;
  } else if (const auto* e = std::get_if<LevelsFlattenedEvent>(&event)) {
    j["type"] = "levels_flattened";
    j["level_ids"] = e->level_ids;
    j["abandoned_position"] = e->abandoned_position;
  } else {
    return std::nullopt;
  }

  return j;
}

std::optional<std::string> formatTelemetry(const Event& event) {
  auto j = toTelemetry(event);
  if (!j) {
    return std::nullopt;
  }
  return j->dump();
}

}  // namespace tranche
