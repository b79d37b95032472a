#include "eclear/eventbus/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace eclear {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, std::move(callback)});
  return id;
}

EventBus::SubscriptionId EventBus::subscribeTimeslot(
    domain::TimeslotId timeslot_id, GenericCallback callback) {
  return subscribe(
      [ts = std::move(timeslot_id), cb = std::move(callback)](const Event& e) {
        if (eventTimeslot(e) == ts) {
          cb(e);
        }
      });
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

void EventBus::publish(const Event& event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }
  for (const auto& subscriber : snapshot) {
    subscriber.callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace eclear
