// -----------------------------------------------------------------------------
// eclear_engine: single executable entry point.
//
// Service mode:   eclear_engine [config.json]
//   1) Load EngineConfig (defaults when no path is given).
//   2) Seed an InMemoryRecordStore from config.market_snapshot_path.
//   3) Create the ClearingEngine and start it. Clearing runs are requested
//      over the ZeroMQ REP socket ("CLEAR <timeslot>"); outcomes are
//      published as JSON on the PUB socket.
//   4) Wait on the main thread until SIGINT / SIGTERM.
//   5) Shut down cleanly.
//
// Dry run:        eclear_engine --preview <snapshot.json>
//   Runs computeClearing() for every timeslot of the snapshot and prints the
//   outcomes as JSON. No store, no sockets, nothing committed.
//
// Thread layout (service mode):
//   main thread          -> waits for shutdown
//   publication thread   -> EventBus subscribers (logging, telemetry)
//   ipc thread           -> command dispatch (runs the clearing)
// -----------------------------------------------------------------------------

#include "eclear/clearing/clearing_computation.hpp"
#include "eclear/config/engine_config.hpp"
#include "eclear/engine/clearing_engine.hpp"
#include "eclear/serialization/json_codec.hpp"
#include "eclear/store/in_memory_record_store.hpp"
#include "eclear/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

// Set from the signal handler; polled by the main thread. The only global.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

namespace {

int runPreview(const std::string& snapshot_path) {
  const nlohmann::json snapshot =
      eclear::serialization::readJsonFile(snapshot_path);

  nlohmann::json report = nlohmann::json::array();
  if (snapshot.contains("timeslots") && snapshot.at("timeslots").is_array()) {
    for (const auto& slot : snapshot.at("timeslots")) {
      const auto market =
          eclear::serialization::marketFromSnapshotTimeslot(slot);
      auto result =
          eclear::clearing::computeClearing(market.bids, market.supplies);

      nlohmann::json entry;
      entry["timeslot_id"] = slot.value("id", "");
      if (auto* err = std::get_if<eclear::domain::ClearingError>(&result)) {
        entry["status"] = "error";
        entry["error"] = eclear::serialization::toJson(*err);
      } else {
        entry["status"] = "ok";
        entry["outcome"] = eclear::serialization::toJson(
            std::get<eclear::domain::ClearingOutcome>(result));
      }
      report.push_back(std::move(entry));
    }
  }

  std::cout << report.dump(2) << "\n";
  return 0;
}

int runService(const eclear::EngineConfig& config) {
  eclear::store::InMemoryRecordStore store;
  if (!config.market_snapshot_path.empty()) {
    eclear::serialization::loadMarketSnapshot(
        eclear::serialization::readJsonFile(config.market_snapshot_path),
        store);
    std::cout << "[main] Loaded " << store.timeslotCount()
              << " timeslot(s) from " << config.market_snapshot_path << "\n";
  }

  eclear::LiveTimeProvider clock;
  eclear::ClearingEngine engine(store, clock, config);

  // Subscribe before start() so no event is missed. Runs on the
  // publication thread.
  engine.eventBus().subscribe<eclear::ClearingCompletedEvent>(
      [](const eclear::ClearingCompletedEvent& e) {
        std::cout << "[Publication] ClearingCompleted timeslot="
                  << e.timeslot_id << " price=" << e.clearing_price
                  << " quantity=" << e.cleared_quantity << "\n";
      });
  engine.eventBus().subscribe<eclear::ClearingFailedEvent>(
      [](const eclear::ClearingFailedEvent& e) {
        std::cout << "[Publication] ClearingFailed timeslot=" << e.timeslot_id
                  << " kind=" << eclear::domain::clearingErrorKindToString(e.kind)
                  << "\n";
      });

  engine.start();

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] Send \"CLEAR <timeslot>\" to " << config.ipc_cmd_endpoint
            << ". Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    if (argc >= 2 && std::strcmp(argv[1], "--preview") == 0) {
      if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " --preview <snapshot.json>\n";
        return 2;
      }
      return runPreview(argv[2]);
    }

    eclear::EngineConfig config;
    if (argc >= 2) {
      config = eclear::loadEngineConfig(argv[1]);
    }
    return runService(config);
  } catch (const eclear::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
  } catch (const eclear::serialization::CodecError& e) {
    std::cerr << "[main] Snapshot error: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
  }
  return 1;
}
