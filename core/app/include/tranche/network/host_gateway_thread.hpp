#pragma once

#include "tranche/events/event.hpp"
#include "tranche/gateway/host_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tranche {

// -----------------------------------------------------------------------------
// HostGatewayThread: dedicated I/O thread for host message ingestion
// -----------------------------------------------------------------------------
//
// @brief  Runs HostGateway::run() on its own std::thread so the engine loop
//         never blocks on the network.
//
// @details
// HostGateway has its own blocking recv loop rather than consuming a
// ThreadSafeQueue, so it needs a raw std::thread instead of an
// EventLoopThread.
//
// The gateway is created in start(), not in the constructor, so the SUB
// socket connects only once every engine subscriber is in place.
//
// Thread model:
//   Constructed, started, stopped and destroyed on the owning thread
//   (EngineHost). The internal thread runs HostGateway::run() exclusively.
// -----------------------------------------------------------------------------
class HostGatewayThread {
 public:
  using EventSink = std::function<void(Event)>;

  HostGatewayThread(EventSink event_sink,
                    std::string endpoint = "tcp://127.0.0.1:5555");

  // RAII: calls stop().
  ~HostGatewayThread();

  HostGatewayThread(const HostGatewayThread&) = delete;
  HostGatewayThread& operator=(const HostGatewayThread&) = delete;
  HostGatewayThread(HostGatewayThread&&) = delete;
  HostGatewayThread& operator=(HostGatewayThread&&) = delete;

  // Creates the gateway and spawns the recv thread. Idempotent.
  void start();

  // Signals the gateway and joins the thread. Idempotent.
  void stop();

  bool isRunning() const { return thread_.joinable(); }
  const std::string& endpoint() const { return endpoint_; }

 private:
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<HostGateway> gateway_;
  std::thread thread_;
};

}  // namespace tranche
