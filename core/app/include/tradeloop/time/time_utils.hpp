#pragma once

#include "tradeloop/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridge between ITimeProvider's int64 milliseconds and the
//         Timestamp carried by events.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// utc_day_index
// -------------------------------------------------------------------------
// @brief  Days since the Unix epoch for an epoch-millisecond value.
//
// @details
// The agent resets its daily trade counter when this value changes between
// two Perception stages. Floor division keeps pre-epoch values (only seen
// in tests) on the correct side of midnight.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_index(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms < 0 && ms % kMillisPerDay != 0) {
    --day;
  }
  return day;
}

}  // namespace tradeloop
