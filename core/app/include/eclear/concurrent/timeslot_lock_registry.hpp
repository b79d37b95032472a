#pragma once

#include "eclear/domain/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace eclear {

// -----------------------------------------------------------------------------
// TimeslotLockRegistry
// -----------------------------------------------------------------------------
// Responsibility: Hands out one exclusive lock per timeslot id so that at
// most one clearing run executes for a given timeslot at any time. Runs for
// different timeslots proceed in parallel.
//
// Usage:
//   auto guard = registry.acquire(timeslot_id, deadline);
//   if (!guard) { ... timed out ... }
//   ... load, compute, commit ...
//   // guard destroyed -> lock released
//
// Entries are created on first use and removed when the last Guard for that
// id is destroyed, so the map only holds timeslots with a run in flight (or
// waiting).
//
// Thread model: acquire() may be called from any thread. The registry must
// outlive every Guard it issued.
// -----------------------------------------------------------------------------
class TimeslotLockRegistry {
 public:
  // RAII handle holding the timeslot lock. Move-constructible so it can be
  // returned from acquire(); not assignable.
  class Guard {
   public:
    Guard(Guard&&) = default;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

   private:
    friend class TimeslotLockRegistry;
    Guard(TimeslotLockRegistry& registry, domain::TimeslotId timeslot_id,
          std::shared_ptr<std::timed_mutex> mutex,
          std::unique_lock<std::timed_mutex> lock);

    TimeslotLockRegistry* registry_;
    domain::TimeslotId timeslot_id_;
    std::shared_ptr<std::timed_mutex> mutex_;
    std::unique_lock<std::timed_mutex> lock_;
  };

  using Deadline = std::chrono::steady_clock::time_point;

  TimeslotLockRegistry() = default;
  TimeslotLockRegistry(const TimeslotLockRegistry&) = delete;
  TimeslotLockRegistry& operator=(const TimeslotLockRegistry&) = delete;

  // Blocks until the lock for timeslot_id is free, then returns it held.
  Guard acquire(const domain::TimeslotId& timeslot_id);

  // Waits for the lock no later than deadline. std::nullopt if it is still
  // held by someone else at that point.
  std::optional<Guard> acquire(const domain::TimeslotId& timeslot_id,
                               Deadline deadline);

  // Number of timeslots currently locked or waited on.
  std::size_t activeCount() const;

 private:
  std::shared_ptr<std::timed_mutex> entryFor(
      const domain::TimeslotId& timeslot_id);
  void release(const domain::TimeslotId& timeslot_id);

  mutable std::mutex mutex_;
  std::map<domain::TimeslotId, std::shared_ptr<std::timed_mutex>> locks_;
};

}  // namespace eclear
