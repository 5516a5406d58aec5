#pragma once

#include "tranche/engine/level_engine.hpp"
#include "tranche/eventbus/event_bus.hpp"
#include "tranche/network/host_gateway_thread.hpp"
#include "tranche/network/ipc_server.hpp"

#include <memory>

namespace tranche {

// -----------------------------------------------------------------------------
// EngineHost
// -----------------------------------------------------------------------------
//
// @brief  Binds a LevelEngine to its network I/O: the host gateway thread
//         (bars, fills, status in) and the IPC server (telemetry out,
//         operator commands in).
//
// @details
// Kept apart from LevelEngine so the engine and its tests build without
// ZeroMQ. Endpoints come from the engine's config; an empty endpoint
// disables the component.
//
// Startup order:
//   1. LevelEngine loop.
//   2. IpcServer, then the telemetry bridge on the engine EventBus.
//   3. HostGatewayThread LAST, so every subscriber is live before the first
//      host message enters the pipeline.
//
// Shutdown runs in reverse: no new host messages, telemetry bridge
// detached, IPC joined (executeCommand() reads the engine), engine loop
// joined.
//
// Thread model:
//   start()/stop() from the owning thread (main). The engine must outlive
//   this object.
// -----------------------------------------------------------------------------
class EngineHost {
 public:
  explicit EngineHost(LevelEngine& engine);

  // RAII: calls stop().
  ~EngineHost();

  EngineHost(const EngineHost&) = delete;
  EngineHost& operator=(const EngineHost&) = delete;

  // Idempotent. Throws zmq::error_t if an IPC endpoint cannot be bound.
  void start();

  // Idempotent.
  void stop();

  bool isRunning() const { return running_; }

 private:
  LevelEngine& engine_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<HostGatewayThread> host_thread_;
  EventBus::SubscriptionId telemetry_sub_{0};
  bool telemetry_bridged_{false};

  bool running_{false};
};

}  // namespace tranche
