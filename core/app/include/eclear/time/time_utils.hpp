#pragma once

#include "eclear/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace eclear {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks int64 milliseconds; events carry a Timestamp
// (system_clock::time_point); the JSON codec writes milliseconds again.
// These two helpers are the only conversion points.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace eclear
