#include "tranche/position/trade_metrics.hpp"
#include "tranche/time/time_utils.hpp"

namespace tranche {

TradeMetrics::TradeMetrics(Timestamp first_fill, double entry_price,
                           domain::Quantity position, domain::Side side)
    : first_fill_(first_fill),
      last_fill_(first_fill),
      side_(side),
      entry_price_(entry_price),
      average_price_(entry_price),
      max_position_(position) {}

// -----------------------------------------------------------------------------
// updateFill: addition to the open position
// -----------------------------------------------------------------------------
void TradeMetrics::updateFill(domain::Quantity position, double average_price,
                              Timestamp time) {
  if (position > max_position_) {
    max_position_ = position;
  }
  last_fill_ = time;
  time_since_last_fill_ = 0.0;
  average_price_ = average_price;
}

// -----------------------------------------------------------------------------
// updatePrice: excursions from the entry price, never the average
// -----------------------------------------------------------------------------
void TradeMetrics::updatePrice(double price, Timestamp now) {
  double delta = (side_ == domain::Side::Buy) ? price - entry_price_
                                              : entry_price_ - price;

  if (delta > max_favorable_excursion_) {
    max_favorable_excursion_ = delta;
  } else if (delta < max_adverse_excursion_) {
    max_adverse_excursion_ = delta;
  }

  exit_price_ = price;
  cycle_time_ = minutesBetween(first_fill_, now);
  time_since_last_fill_ = minutesBetween(last_fill_, now);
}

// -----------------------------------------------------------------------------
// finalize: fix exit price and compute the cycle's delta
// -----------------------------------------------------------------------------
void TradeMetrics::finalize(double exit_price, Timestamp last_fill) {
  exit_price_ = exit_price;
  last_fill_ = last_fill;
  cycle_time_ = minutesBetween(first_fill_, last_fill);

  average_price_delta_ = (side_ == domain::Side::Buy)
                             ? exit_price_ - entry_price_
                             : entry_price_ - exit_price_;
}

domain::TradeCycleRecord TradeMetrics::toRecord() const {
  domain::TradeCycleRecord record;
  record.first_fill = first_fill_;
  record.last_fill = last_fill_;
  record.side = side_;
  record.average_price = average_price_;
  record.exit_price = exit_price_;
  record.average_price_delta = average_price_delta_;
  record.cycle_time_minutes = cycle_time_;
  record.max_adverse_excursion = max_adverse_excursion_;
  record.max_favorable_excursion = max_favorable_excursion_;
  record.max_position = max_position_;
  record.time_since_last_fill_minutes = time_since_last_fill_;
  record.pnl = pnl_;
  return record;
}

}  // namespace tranche
