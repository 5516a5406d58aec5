#pragma once

#include "tranche/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tranche {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Deterministic clock driven by the bars being replayed.
//
// @details
// LevelEngine calls advance_time() with each bar's timestamp before handling
// the bar. The clock never moves backwards: an older timestamp (a late or
// duplicated bar) is ignored and advance_time() returns false.
//
// Thread model:
//   Writes happen on the engine loop thread; reads may happen on any thread
//   (the atomic makes both safe).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  std::int64_t now_ms() const override;

  // Returns false (and leaves the clock untouched) when new_time_ms is
  // earlier than the current time.
  bool advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tranche
