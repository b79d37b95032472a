#pragma once

#include "eclear/domain/types.hpp"
#include "eclear/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace eclear {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Synchronous fan-out of clearing events to registered callbacks.
//
// Three ways to listen:
//   subscribe(cb)                     every event
//   subscribe<ClearingFailedEvent>(cb) one event type
//   subscribeTimeslot("ts", cb)       every event of one timeslot
//
// publish() runs callbacks on the publishing thread, in subscription order.
// In the engine that is always the publication loop thread.
//
// Thread model: all methods may be called concurrently. The subscriber list
// is snapshotted before dispatch, so a callback may publish, subscribe or
// unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Receives only events whose timeslot_id equals `timeslot_id`.
  SubscriptionId subscribeTimeslot(domain::TimeslotId timeslot_id,
                                   GenericCallback callback);

  // Unknown ids are ignored. A publish() already dispatching on another
  // thread may still deliver one last event to the removed callback.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    GenericCallback callback;
  };

  mutable std::mutex mutex_;
  SubscriptionId next_id_{1};
  std::vector<Subscriber> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace eclear
