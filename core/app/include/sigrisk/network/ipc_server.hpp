#pragma once

#include "sigrisk/concurrent/thread_safe_queue.hpp"
#include "sigrisk/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sigrisk {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  One thread serving two sockets: a REP socket for operator
//         commands and a PUB socket broadcasting pipeline telemetry.
//
// @details
//   REP (default tcp://127.0.0.1:5556):
//     Each request string is handed to the command handler (bound to
//     SignalRiskEngine::execute_command()) and its JSON reply sent back.
//     Commands: PING, STATUS, ADD_SYMBOL <s>, REMOVE_SYMBOL <s>, HALT,
//     RESUME. The socket polls with ZMQ_RCVTIMEO so the thread alternates
//     between commands and telemetry.
//
//   PUB (default tcp://127.0.0.1:5557):
//     JSON for SignalEvent ("signal"), PositionUpdateEvent
//     ("position_update") and CriticalAlertEvent ("critical_alert"). Events
//     are queued by push_telemetry() from the scheduler workers and the
//     risk thread; serialization and socket I/O happen here only.
//     PriceTickEvents are not republished.
//
// Thread model:
//   start()/stop() from the owning thread; push_telemetry() from any
//   thread. The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by SignalRiskEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and starts the thread.
  void start();

  // Publishes what is still queued, then joins the thread and closes the
  // sockets. Idempotent.
  void stop();

  void push_telemetry(Event event);

  // JSON text published for an event; nullopt for events not republished.
  static std::optional<std::string> format_telemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void process_telemetry();
  void process_commands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sigrisk
