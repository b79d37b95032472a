#include "eclear/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace eclear {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr std::chrono::milliseconds kPopTimeout{10};

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (worker_.joinable()) {
    return;
  }
  running_.store(true);
  worker_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!worker_.joinable()) {
    return;
  }
  running_.store(false);
  worker_.join();
}

void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = pending_.pop_for(kPopTimeout)) {
      bus_.publish(*event);
    }
  }

  // Events of a run that committed just before shutdown.
  for (const auto& event : pending_.drain()) {
    bus_.publish(event);
  }
}

}  // namespace eclear
