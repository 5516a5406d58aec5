#pragma once

#include <cstdint>

namespace tranche {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for components that stamp orders and simulated
//         reports.
//
// @details
// TradeManager stamps Order::created and SimulatedTradeGateway stamps its
// status and fill reports through this interface. In simulation the engine
// advances a SimulationTimeProvider from each bar's timestamp, so a replayed
// session produces identical timestamps on every run. In live mode a
// LiveTimeProvider reads the system clock.
//
// Thread model:
//   now_ms() is const and must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tranche
