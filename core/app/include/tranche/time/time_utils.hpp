#pragma once

#include "tranche/time/timestamp.hpp"

#include <chrono>
#include <cstdint>

namespace tranche {

// -----------------------------------------------------------------------------
// Epoch-millisecond conversions
// -----------------------------------------------------------------------------
// The host wire format, ITimeProvider and the audit log all speak epoch
// milliseconds; the domain types carry Timestamp. These two helpers are the
// only place the conversion happens.
// -----------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// minutesBetween(from, to)
// -----------------------------------------------------------------------------
// Fractional minutes from `from` to `to`. Negative when `to` precedes
// `from`; callers that feed out-of-order bars get a negative duration rather
// than a silently clamped one.
// -----------------------------------------------------------------------------
inline double minutesBetween(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

}  // namespace tranche
