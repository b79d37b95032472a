#pragma once

#include "eclear/clearing/clearing_orchestrator.hpp"
#include "eclear/concurrent/event_loop_thread.hpp"
#include "eclear/concurrent/timeslot_lock_registry.hpp"
#include "eclear/config/engine_config.hpp"
#include "eclear/network/ipc_server.hpp"
#include "eclear/store/i_record_store.hpp"
#include "eclear/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace eclear {

// -----------------------------------------------------------------------------
// ClearingEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the clearing service: owns the orchestrator,
//         the timeslot locks, the publication loop and the IPC gateway.
//
// @details
// main() and tests use the engine through a start/stop lifecycle without
// wiring internals by hand.
//
// Thread layout:
//
//   caller threads        -> executeClearing() / executeCommand()
//   publication_loop_     -> EventBus subscribers (telemetry, tests)
//   IpcServer thread      -> REP command dispatch + PUB telemetry
//   main thread           -> start(), wait for shutdown, stop()
//
// Cross-thread bridges (wired in start()):
//   1. clearing run  ->  publication_loop_:  all clearing events (push)
//   2. publication_loop_  ->  IpcServer:     all clearing events (telemetry)
//
// Ownership:
//   ClearingEngine
//    ├── store_               (IRecordStore&, non-owning)
//    ├── time_provider_       (const ITimeProvider&, non-owning)
//    ├── config_              (EngineConfig, value member)
//    ├── locks_               (TimeslotLockRegistry, value member)
//    ├── publication_loop_    (EventLoopThread, value member)
//    ├── orchestrator_        (unique_ptr<ClearingOrchestrator>)
//    └── ipc_server_          (unique_ptr<IpcServer>, only if both
//                              endpoints are configured)
//
// The orchestrator is created in the constructor so executeClearing() works
// before start(); its events then wait in the queue until the publication
// loop starts.
// -----------------------------------------------------------------------------
class ClearingEngine {
 public:
  ClearingEngine(store::IRecordStore& store, const ITimeProvider& time_provider,
                 EngineConfig config = {});

  ~ClearingEngine();

  ClearingEngine(const ClearingEngine&) = delete;
  ClearingEngine& operator=(const ClearingEngine&) = delete;
  ClearingEngine(ClearingEngine&&) = delete;
  ClearingEngine& operator=(ClearingEngine&&) = delete;

  // Starts the publication loop and, if configured, the IpcServer.
  // Idempotent.
  void start();

  // Stops the publication loop (delivering any queued events), then the
  // IpcServer. Idempotent.
  void stop();

  // Runs a clearing with the configured record store timeout.
  domain::Result<domain::ClearingOutcome> executeClearing(
      const domain::TimeslotId& timeslot_id);

  domain::Result<domain::ClearingOutcome> previewClearing(
      const domain::TimeslotId& timeslot_id);

  domain::Result<clearing::TimeslotReport> inspectTimeslot(
      const domain::TimeslotId& timeslot_id);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Text command dispatcher used by the IpcServer REP socket.
  //
  //   PING                -> {"status":"ok","response":"PONG"}
  //   CLEAR <timeslot>    -> {"status":"ok","timeslot_id",...,"outcome":{}}
  //   PREVIEW <timeslot>  -> same shape, nothing committed
  //   STATUS <timeslot>   -> {"status":"ok","report":{...}}
  //   anything else       -> {"status":"error","response":"..."}
  //
  // A failed CLEAR / PREVIEW / STATUS answers
  // {"status":"error","timeslot_id":...,"error":{"kind","message",...}}.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Subscribers run on the publication loop thread.
  EventBus& eventBus();

  const EngineConfig& config() const { return config_; }

 private:
  store::IRecordStore& store_;
  const ITimeProvider& time_provider_;
  EngineConfig config_;

  TimeslotLockRegistry locks_;
  EventLoopThread publication_loop_;

  std::unique_ptr<clearing::ClearingOrchestrator> orchestrator_;
  std::unique_ptr<IpcServer> ipc_server_;

  EventBus::SubscriptionId telemetry_subscription_{0};
  bool running_{false};
};

}  // namespace eclear
