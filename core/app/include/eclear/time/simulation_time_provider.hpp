#pragma once

#include "eclear/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace eclear {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set explicitly with
//         advance_time() instead of read from the system clock.
//
// @details
// Used by tests so that event timestamps are reproducible. Starts at 0 ms
// until the first advance_time().
//
// Internal storage is a std::atomic<int64_t>; now_ms() and advance_time()
// may be called concurrently from any thread without further locking.
// Monotonicity is the caller's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t initial_time_ms)
      : current_time_ms_(initial_time_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Every later now_ms() from any thread returns new_time_ms.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace eclear
