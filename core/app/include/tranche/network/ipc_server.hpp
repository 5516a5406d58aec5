#pragma once

#include "tranche/concurrent/thread_safe_queue.hpp"
#include "tranche/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tranche {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for telemetry and operator commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts engine telemetry on a PUB
//         socket and answers operator commands on a REP socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (port 5557 by default):
//      Broadcasts a two-frame message per outbound event: the telemetry
//      "type" as topic, then the JSON object built by
//      toTelemetry() (codec/json_codec.hpp): order/cancel/replace
//      requests, position updates, completed cycles and Level lifecycle
//      events. In live mode the host subscribes here to pick up order
//      requests and forward them to its broker; subscribing to the
//      "order_request" topic alone is enough for that.
//
//   2. REP socket (port 5556 by default):
//      Each received string is passed to the command handler (bound to
//      LevelEngine::executeCommand()) and the JSON reply is sent back. A
//      handler exception becomes a {"status":"error"} reply so the REP
//      socket never stalls waiting for a send.
//
// Events arrive from the engine loop thread through a ThreadSafeQueue, so
// JSON formatting and socket I/O never run on the engine loop.
//
// Thread model:
//   start()/stop() on the owning thread. The worker thread polls the REP
//   socket for at most kPollTimeoutMs, then drains telemetry.
//   pushTelemetry() is safe from any thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no threads are spawned here.
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds the REP and PUB sockets and spawns the worker thread.
  //
  // @throws zmq::error_t if either endpoint cannot be bound.
  //
  // Idempotent: calling start() when already running is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  // Queues an event for publication. Events without a telemetry format are
  // dropped when drained.
  void pushTelemetry(Event event);

  std::uint64_t publishedCount() const { return published_.load(); }
  std::uint64_t commandsHandled() const { return commands_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void answerCommand();
  std::string runHandler(const std::string& cmd);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> commands_{0};
};

}  // namespace tranche
