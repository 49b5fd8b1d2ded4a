#include "micro/network/ipc_server.hpp"

#include "micro/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor: sockets are created in start()
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind and spawn
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REQ/REP exchange if a command is waiting
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());

  // REP must answer every request, even if the handler fails.
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["response"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): per-kind JSON envelope
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;

  if (const auto* e = std::get_if<PositionOpenedEvent>(&event)) {
    j = toJson(e->position);
    j["type"] = "position_opened";
  } else if (const auto* e = std::get_if<PositionClosedEvent>(&event)) {
    j = toJson(e->trade);
    j["type"] = "position_closed";
    j["balanceAfter"] = e->balance;
  } else if (const auto* e = std::get_if<RiskStateChangedEvent>(&event)) {
    j["type"] = "risk_state";
    j["previous"] = domain::riskStateToString(e->previous);
    j["current"] = domain::riskStateToString(e->current);
    j["reason"] = e->reason;
    j["balance"] = e->balance;
    j["peakBalance"] = e->peak_balance;
    j["timestampMs"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<SnapshotEvent>(&event)) {
    j = toJson(e->snapshot);
    j["type"] = "snapshot";
  } else {
    return std::nullopt;
  }

  return j.dump();
}

}  // namespace micro
