#include "tranche/time/simulation_time_provider.hpp"

namespace tranche {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// Compare-exchange loop so concurrent readers never observe a regression.
bool SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  std::int64_t current = current_time_ms_.load();
  while (new_time_ms >= current) {
    if (current_time_ms_.compare_exchange_weak(current, new_time_ms)) {
      return true;
    }
  }
  return false;
}

}  // namespace tranche
