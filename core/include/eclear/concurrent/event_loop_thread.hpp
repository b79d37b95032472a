#pragma once

#include "eclear/concurrent/thread_safe_queue.hpp"
#include "eclear/eventbus/event_bus.hpp"
#include "eclear/events/event.hpp"

#include <atomic>
#include <thread>

namespace eclear {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// The engine's publication loop. Clearing runs push their events from
// whichever thread executed them; one worker thread pops them and publishes
// on the owned EventBus, so every subscriber sees events one at a time and
// in push order, and never on a clearing thread.
//
// Lifecycle:
//   push() before start()  -> queued, delivered once the loop runs
//   stop()                 -> worker exits, remaining queue published,
//                             thread joined
//   start() after stop()   -> allowed
//
// Thread model: push() from any thread. start() / stop() from the owner.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { pending_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> pending_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread worker_;
};

}  // namespace eclear
