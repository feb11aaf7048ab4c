#include "sigrisk/network/ipc_server.hpp"

#include "sigrisk/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace sigrisk {

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
  cmd_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

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

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::push_telemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    process_telemetry();
    process_commands();
  }
  process_telemetry();
}

void IpcServer::process_telemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    if (auto text = format_telemetry(*event)) {
      zmq::message_t msg(text->data(), text->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// process_commands(): one request per call. A handler that throws gets an
// error reply; a REP socket must answer every request it received.
// -----------------------------------------------------------------------------
void IpcServer::process_commands() {
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
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"message", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::optional<std::string> IpcServer::format_telemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<SignalEvent>(&event)) {
    j["type"] = "signal";
    j["sequence_id"] = e->sequence_id;
    j["signal"] = e->signal;
  } else if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j["type"] = "position_update";
    j["sequence_id"] = e->sequence_id;
    j["event"] = e->event;
  } else if (const auto* e = std::get_if<CriticalAlertEvent>(&event)) {
    j["type"] = "critical_alert";
    j["component"] = e->component;
    j["symbol"] = e->symbol;
    j["position_id"] = e->position_id;
    j["message"] = e->message;
    j["timestamp_ms"] = e->timestamp_ms;
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace sigrisk
