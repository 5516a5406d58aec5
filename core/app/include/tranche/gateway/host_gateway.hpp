#pragma once

#include "tranche/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// HostGateway: ZeroMQ bridge for messages from the host platform
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON messages from the host
//         (bars with their signal, fills, order status reports), decodes
//         them and pushes the resulting events into the engine.
//
// @details
// The host owns bar construction, signal computation and the broker
// connection. It publishes one JSON object per message:
//
//   {"type":"bar", "instrument":"ES", "timestamp":1700000000000,
//    "open":..., "high":..., "low":..., "close":..., "volume":...,
//    "signal":-2.1}
//   {"type":"fill", "order_id":7, "side":"Buy", "quantity":1,
//    "price":100.25, "timestamp":...}
//   {"type":"order_status", "order_id":7, "status":"Filled",
//    "timestamp":...}
//
// Decoding lives in decodeHostMessage() (codec/json_codec.hpp); malformed
// or unknown messages are logged there and dropped here.
//
// The gateway does not touch the simulation clock. LevelEngine advances it
// from each bar on its own loop thread, so clock and bar processing cannot
// drift apart.
//
// Thread model:
//   run() blocks the calling thread; HostGatewayThread calls it from a
//   dedicated std::thread. stop() may be called from any thread and is
//   noticed within kRecvTimeoutMs (ZMQ_RCVTIMEO).
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
//   Holds a copy of the event sink callback.
// -----------------------------------------------------------------------------
class HostGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates the SUB socket, subscribes to everything and connects.
  //
  // @param  event_sink  Callback invoked for each decoded event. Typically
  //                     bound to LevelEngine::submit().
  // @param  endpoint    ZMQ endpoint of the host publisher.
  //
  // Side-effects:  Opens a ZMQ SUB socket and connects to the endpoint.
  // -------------------------------------------------------------------------
  explicit HostGateway(EventSink event_sink,
                       const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~HostGateway() = default;

  HostGateway(const HostGateway&) = delete;
  HostGateway& operator=(const HostGateway&) = delete;
  HostGateway(HostGateway&&) = delete;
  HostGateway& operator=(HostGateway&&) = delete;

  // Blocking recv loop. Call from a dedicated thread.
  void run();

  // Requests the recv loop to exit. Safe from any thread.
  void stop();

  std::uint64_t messagesReceived() const { return received_.load(); }
  std::uint64_t messagesDropped() const { return dropped_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace tranche
