#pragma once

#include <cstdint>

namespace eclear {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for event timestamps.
//
// @details
// Components that stamp events receive `const ITimeProvider&` and call
// now_ms(); they never read std::chrono::system_clock themselves. The
// executable injects LiveTimeProvider, tests inject SimulationTimeProvider
// and pin the clock to a known value so published events can be compared
// field by field.
//
// Deadlines for record store calls are not taken from here: they are
// measured on std::chrono::steady_clock, which is immune to wall-clock
// adjustments.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace eclear
