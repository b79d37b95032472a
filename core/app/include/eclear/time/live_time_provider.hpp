#pragma once

#include "eclear/time/i_time_provider.hpp"

namespace eclear {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Safe from any thread.
// Owned by main(); the engine borrows it.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace eclear
