#include "eclear/concurrent/timeslot_lock_registry.hpp"

namespace eclear {

TimeslotLockRegistry::Guard::Guard(TimeslotLockRegistry& registry,
                                   domain::TimeslotId timeslot_id,
                                   std::shared_ptr<std::timed_mutex> mutex,
                                   std::unique_lock<std::timed_mutex> lock)
    : registry_(&registry),
      timeslot_id_(std::move(timeslot_id)),
      mutex_(std::move(mutex)),
      lock_(std::move(lock)) {}

TimeslotLockRegistry::Guard::~Guard() {
  // A moved-from guard has no mutex and owns nothing.
  if (!mutex_) {
    return;
  }
  lock_.unlock();
  mutex_.reset();
  registry_->release(timeslot_id_);
}

std::shared_ptr<std::timed_mutex> TimeslotLockRegistry::entryFor(
    const domain::TimeslotId& timeslot_id) {
  std::lock_guard lock(mutex_);
  auto& slot = locks_[timeslot_id];
  if (!slot) {
    slot = std::make_shared<std::timed_mutex>();
  }
  return slot;
}

// The registry mutex is not held while waiting: waiting for one timeslot
// must not block acquire() for another.
TimeslotLockRegistry::Guard TimeslotLockRegistry::acquire(
    const domain::TimeslotId& timeslot_id) {
  auto timeslot_mutex = entryFor(timeslot_id);
  std::unique_lock<std::timed_mutex> lock(*timeslot_mutex);
  return Guard(*this, timeslot_id, std::move(timeslot_mutex), std::move(lock));
}

std::optional<TimeslotLockRegistry::Guard> TimeslotLockRegistry::acquire(
    const domain::TimeslotId& timeslot_id, Deadline deadline) {
  auto timeslot_mutex = entryFor(timeslot_id);
  std::unique_lock<std::timed_mutex> lock(*timeslot_mutex, deadline);
  if (!lock.owns_lock()) {
    timeslot_mutex.reset();
    release(timeslot_id);
    return std::nullopt;
  }
  return Guard(*this, timeslot_id, std::move(timeslot_mutex), std::move(lock));
}

std::size_t TimeslotLockRegistry::activeCount() const {
  std::lock_guard lock(mutex_);
  return locks_.size();
}

void TimeslotLockRegistry::release(const domain::TimeslotId& timeslot_id) {
  std::lock_guard lock(mutex_);
  auto it = locks_.find(timeslot_id);
  // use_count() == 1: only the map still refers to it, nobody holds or
  // waits on this timeslot.
  if (it != locks_.end() && it->second.use_count() == 1) {
    locks_.erase(it);
  }
}

}  // namespace eclear
