#include "eclear/network/ipc_server.hpp"

#include "eclear/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace eclear {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  rep_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  rep_socket_->set(zmq::sockopt::rcvtimeo, kReceiveTimeoutMs);
  rep_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  rep_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  worker_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. REP=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (!worker_.joinable()) {
    return;
  }
  worker_.join();

  rep_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] closed.\n";
}

void IpcServer::pushTelemetry(Event event) { outbound_.push(std::move(event)); }

void IpcServer::run() {
  while (running_.load()) {
    flushTelemetry();
    serveOneCommand();
  }
  flushTelemetry();
}

void IpcServer::flushTelemetry() {
  for (const auto& event : outbound_.drain()) {
    const std::string topic = serialization::telemetryTopic(event);
    const std::string body = serialization::eventToJson(event).dump();

    auto first = pub_socket_->send(zmq::buffer(topic),
                                   zmq::send_flags::sndmore |
                                       zmq::send_flags::dontwait);
    if (!first) {
      std::cerr << "[IpcServer] telemetry dropped: " << topic << "\n";
      continue;
    }
    // Once the first frame is queued the second one is accepted too.
    pub_socket_->send(zmq::buffer(body), zmq::send_flags::none);
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = rep_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;
  }

  const std::string reply = dispatch(request.to_string());
  rep_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

std::string IpcServer::dispatch(const std::string& request) {
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << request << "' failed: " << e.what()
              << "\n";
    nlohmann::json response;
    response["status"] = "error";
    response["response"] = std::string("Internal error: ") + e.what();
    return response.dump();
  }
}

}  // namespace eclear
