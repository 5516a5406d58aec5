#pragma once

#include <chrono>

namespace tranche {

// Wall-clock point used for bars, fills, level entries and cycle analytics.
// In simulation it carries the bar's timestamp, not the machine clock.
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace tranche
