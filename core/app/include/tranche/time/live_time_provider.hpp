#pragma once

#include "tranche/time/i_time_provider.hpp"

namespace tranche {

// Reads std::chrono::system_clock. Used when EngineConfig::simulation is
// false.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tranche
