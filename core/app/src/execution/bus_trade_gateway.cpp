#include "tranche/execution/bus_trade_gateway.hpp"
#include "tranche/time/time_utils.hpp"

namespace tranche {

BusTradeGateway::BusTradeGateway(EventBus& bus,
                                 const ITimeProvider& time_provider)
    : bus_(bus), time_provider_(time_provider) {}

void BusTradeGateway::sendOrder(const domain::Order& order) {
  OrderRequestEvent request;
  request.order = order;
  request.timestamp = ms_to_timestamp(time_provider_.now_ms());
  request.sequence_id = nextSequence();
  bus_.publish(request);
}

void BusTradeGateway::cancelOrder(domain::OrderId order_id) {
  CancelRequestEvent request;
  request.order_id = order_id;
  request.timestamp = ms_to_timestamp(time_provider_.now_ms());
  request.sequence_id = nextSequence();
  bus_.publish(request);
}

void BusTradeGateway::replaceOrder(domain::OrderId order_id, double new_price,
                                   domain::Quantity new_quantity) {
  ReplaceRequestEvent request;
  request.order_id = order_id;
  request.new_price = new_price;
  request.new_quantity = new_quantity;
  request.timestamp = ms_to_timestamp(time_provider_.now_ms());
  request.sequence_id = nextSequence();
  bus_.publish(request);
}

}  // namespace tranche
