#pragma once

#include "eclear/concurrent/thread_safe_queue.hpp"
#include "eclear/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace eclear {

// -----------------------------------------------------------------------------
// IpcServer
// -----------------------------------------------------------------------------
//
// @brief  ZeroMQ front door of the clearing engine. One worker thread serves
//         a REP socket for commands and a PUB socket for clearing telemetry.
//
// @details
// Commands: every request string goes to the CommandHandler
// (ClearingEngine::executeCommand) and its JSON reply is sent back. A REP
// socket must answer every request, so a handler that throws is answered
// with {"status":"error"} instead of killing the worker. The receive uses
// ZMQ_RCVTIMEO so the loop can alternate with telemetry.
//
// Telemetry: two-frame messages
//
//   frame 1  topic   "eclear.<event type>.<timeslot id>"
//   frame 2  body    serialization::eventToJson(event)
//
// so a SUB client can filter by prefix: "eclear." for everything,
// "eclear.clearing_completed." for results only, or one timeslot.
//
// A CLEAR command runs the clearing on this thread; further commands wait
// until it finishes. Its telemetry is sent on the next loop iteration.
//
// Thread model: start() / stop() from the owner; pushTelemetry() from any
// thread (the engine calls it from the publication loop).
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both endpoints and spawns the worker. Idempotent.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Joins the worker (flushing queued telemetry), then closes the sockets.
  void stop();

  void pushTelemetry(Event event);

 private:
  static constexpr int kReceiveTimeoutMs = 50;

  void run();
  void flushTelemetry();
  void serveOneCommand();
  std::string dispatch(const std::string& request);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> rep_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> outbound_;
  std::thread worker_;
  std::atomic<bool> running_{false};
};

}  // namespace eclear
