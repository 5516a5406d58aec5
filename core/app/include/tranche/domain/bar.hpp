#pragma once

#include "tranche/time/timestamp.hpp"

#include <string>

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// Bar: one OHLCV bar delivered by the host
// -----------------------------------------------------------------------------
//
// @details
// Bar construction happens outside the engine. The core only reads close and
// timestamp: close marks positions to market and feeds excursion tracking;
// timestamp stamps levels and cycle analytics.
// -----------------------------------------------------------------------------
struct Bar {
  std::string instrument;
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

}  // namespace domain
}  // namespace tranche
