#include "eclear/engine/clearing_engine.hpp"

#include "eclear/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace eclear {

namespace {

// Splits "VERB argument" at the first space. Surrounding whitespace on the
// argument is dropped.
std::pair<std::string, std::string> splitCommand(const std::string& cmd) {
  const auto space = cmd.find(' ');
  if (space == std::string::npos) {
    return {cmd, ""};
  }
  std::string arg = cmd.substr(space + 1);
  const auto first = arg.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {cmd.substr(0, space), ""};
  }
  const auto last = arg.find_last_not_of(" \t\r\n");
  return {cmd.substr(0, space), arg.substr(first, last - first + 1)};
}

nlohmann::json errorReply(const domain::TimeslotId& timeslot_id,
                          const domain::ClearingError& error) {
  nlohmann::json response;
  response["status"] = "error";
  response["timeslot_id"] = timeslot_id;
  response["error"] = serialization::toJson(error);
  return response;
}

nlohmann::json outcomeReply(
    const domain::TimeslotId& timeslot_id,
    const domain::Result<domain::ClearingOutcome>& result) {
  if (auto* err = std::get_if<domain::ClearingError>(&result)) {
    return errorReply(timeslot_id, *err);
  }
  nlohmann::json response;
  response["status"] = "ok";
  response["timeslot_id"] = timeslot_id;
  response["outcome"] =
      serialization::toJson(std::get<domain::ClearingOutcome>(result));
  return response;
}

}  // namespace

ClearingEngine::ClearingEngine(store::IRecordStore& store,
                               const ITimeProvider& time_provider,
                               EngineConfig config)
    : store_(store),
      time_provider_(time_provider),
      config_(std::move(config)) {
  orchestrator_ = std::make_unique<clearing::ClearingOrchestrator>(
      store_, locks_, time_provider_,
      [this](Event event) { publication_loop_.push(std::move(event)); });
}

ClearingEngine::~ClearingEngine() { stop(); }

void ClearingEngine::start() {
  if (running_) {
    return;
  }

  publication_loop_.start();

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_subscription_ = publication_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[ClearingEngine] started. Threads: publication"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

void ClearingEngine::stop() {
  if (!running_) {
    return;
  }

  // Loop first: queued events reach the IpcServer's telemetry queue, and no
  // subscriber callback can run once ipc_server_ is gone.
  publication_loop_.stop();

  if (ipc_server_) {
    publication_loop_.eventBus().unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }

  running_ = false;

  std::cout << "[ClearingEngine] stopped. All threads joined.\n";
}

domain::Result<domain::ClearingOutcome> ClearingEngine::executeClearing(
    const domain::TimeslotId& timeslot_id) {
  return orchestrator_->executeClearing(timeslot_id,
                                        config_.record_store_timeout);
}

domain::Result<domain::ClearingOutcome> ClearingEngine::previewClearing(
    const domain::TimeslotId& timeslot_id) {
  return orchestrator_->previewClearing(timeslot_id,
                                        config_.record_store_timeout);
}

domain::Result<clearing::TimeslotReport> ClearingEngine::inspectTimeslot(
    const domain::TimeslotId& timeslot_id) {
  return orchestrator_->inspectTimeslot(timeslot_id,
                                        config_.record_store_timeout);
}

// -----------------------------------------------------------------------------
// executeCommand
// -----------------------------------------------------------------------------
std::string ClearingEngine::executeCommand(const std::string& cmd) {
  const auto [verb, arg] = splitCommand(cmd);
  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "CLEAR" || verb == "PREVIEW" || verb == "STATUS") {
    if (arg.empty()) {
      response["status"] = "error";
      response["response"] = "Missing timeslot id for " + verb;
    } else if (verb == "CLEAR") {
      response = outcomeReply(arg, executeClearing(arg));
    } else if (verb == "PREVIEW") {
      response = outcomeReply(arg, previewClearing(arg));
    } else {
      auto report = inspectTimeslot(arg);
      if (auto* err = std::get_if<domain::ClearingError>(&report)) {
        response = errorReply(arg, *err);
      } else {
        response["status"] = "ok";
        response["report"] =
            serialization::toJson(std::get<clearing::TimeslotReport>(report));
      }
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

EventBus& ClearingEngine::eventBus() { return publication_loop_.eventBus(); }

}  // namespace eclear
