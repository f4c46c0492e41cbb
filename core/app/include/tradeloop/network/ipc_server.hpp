#pragma once

#include "tradeloop/concurrent/thread_safe_queue.hpp"
#include "tradeloop/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ telemetry and operator commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that publishes agent events as JSON
//         (PUB socket) and answers operator commands (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (telemetry_endpoint):
//      Every Event pushed through pushTelemetry() is serialized with
//      toJson() (events/event_json.hpp) and sent as one message. Events
//      arrive via a ThreadSafeQueue from the agent loop thread, so JSON
//      serialization and socket I/O never run inside a decision cycle.
//
//   2. REP socket (command_endpoint):
//      Each request string is handed to command_handler_ (bound to
//      AgentRuntime::executeCommand()) and its return value is sent back.
//      ZMQ_RCVTIMEO keeps the loop alternating between commands and
//      telemetry.
//
// Thread model:
//   start() binds both sockets and spawns the worker; stop() joins it.
//   pushTelemetry() is safe from any thread. command_handler_ runs on the
//   IPC thread.
//
// Ownership:
//   Owned by AgentRuntime via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string command_endpoint,
            std::string telemetry_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. zmq::error_t if a bind fails.
  void start();

  // Publishes whatever telemetry is still queued, then joins the worker.
  void stop();

  void pushTelemetry(Event event);

 private:
  // How long one command poll blocks before telemetry is drained again.
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeloop
