#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace eclear {

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Runtime settings for ClearingEngine and the eclear_engine executable.
// Plain value type; copied into the components that need it.
//
//   ipc_cmd_endpoint / ipc_pub_endpoint
//       ZeroMQ REP and PUB bind addresses. Either one empty disables the
//       IpcServer (tests, --preview).
//   record_store_timeout_ms
//       Deadline budget for one clearing run (lock wait, loads, commit).
//   market_snapshot_path
//       JSON snapshot used to seed the in-memory record store. Empty means
//       start with an empty store.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::chrono::milliseconds record_store_timeout{5000};
  std::string market_snapshot_path;
};

// Thrown for an unreadable file, malformed JSON, or a key with the wrong type.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Starts from the defaults and overrides every key present. Unknown keys are
// ignored. A negative or zero timeout is rejected.
// @throws ConfigError
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// @throws ConfigError
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace eclear
