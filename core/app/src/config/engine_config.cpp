#include "eclear/config/engine_config.hpp"

#include <fstream>
#include <iostream>

namespace eclear {

namespace {

void readString(const nlohmann::json& j, const char* key, std::string& out) {
  if (!j.contains(key)) {
    return;
  }
  if (!j.at(key).is_string()) {
    throw ConfigError(std::string("config key '") + key +
                      "' must be a string");
  }
  out = j.at(key).get<std::string>();
}

}  // namespace

EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  EngineConfig config;
  readString(j, "ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  readString(j, "ipc_pub_endpoint", config.ipc_pub_endpoint);
  readString(j, "market_snapshot_path", config.market_snapshot_path);

  if (j.contains("record_store_timeout_ms")) {
    const auto& v = j.at("record_store_timeout_ms");
    if (!v.is_number_integer()) {
      throw ConfigError(
          "config key 'record_store_timeout_ms' must be an integer");
    }
    const auto ms = v.get<std::int64_t>();
    if (ms <= 0) {
      throw ConfigError("config key 'record_store_timeout_ms' must be > 0");
    }
    config.record_store_timeout = std::chrono::milliseconds(ms);
  }
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }

  EngineConfig config = engineConfigFromJson(j);
  std::cout << "[EngineConfig] loaded " << path << "\n";
  return config;
}

}  // namespace eclear
