#pragma once

#include "micro/concurrent/thread_safe_queue.hpp"
#include "micro/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace micro {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ operator interface: commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  One thread serving a REP command socket and a PUB telemetry
//         socket.
//
// @details
//   REP (default tcp://127.0.0.1:5556)
//     Receives a command string (PING, STATUS, HALT, RESUME, SHUTDOWN),
//     passes it to the command handler (Scheduler::executeCommand) and
//     sends back the handler's JSON reply. ZMQ_RCVTIMEO keeps the thread
//     cycling between commands and telemetry.
//
//   PUB (default tcp://127.0.0.1:5557)
//     Broadcasts one JSON message per telemetry event: position_opened,
//     position_closed, risk_state, snapshot. Gate decisions are not
//     broadcast; they are logged only.
//
// Producers call pushTelemetry() from the scan, monitor and snapshot
// workers. The queue decouples them from JSON formatting and socket I/O.
//
// Thread model:
//   start()/stop() from the owning thread. The command handler runs on the
//   IPC thread and must be thread-safe.
//
// Ownership:
//   Owned by the Scheduler via std::unique_ptr. Owns the context, both
//   sockets, the queue and the thread.
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

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the IPC thread. Idempotent. Throws
  // zmq::error_t if an endpoint cannot be bound (e.g. port in use).
  // -------------------------------------------------------------------------
  void start();

  // Signals the thread, joins it (remaining telemetry is flushed first) and
  // closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // JSON text for a telemetry event, or std::nullopt for event kinds that
  // are not broadcast.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void processTelemetry();

  void processCommands();

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

}  // namespace micro
