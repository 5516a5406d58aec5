#include "tranche/engine/engine_host.hpp"

#include <iostream>
#include <utility>
#include <variant>

namespace tranche {

namespace {

// Inbound events are consumed by the engine, not broadcast.
bool isInbound(const Event& event) {
  return std::holds_alternative<BarEvent>(event) ||
         std::holds_alternative<FillEvent>(event) ||
         std::holds_alternative<OrderStatusEvent>(event) ||
         std::holds_alternative<FlattenCommandEvent>(event);
}

}  // namespace

EngineHost::EngineHost(LevelEngine& engine) : engine_(engine) {}

EngineHost::~EngineHost() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EngineHost::start() {
  if (running_) {
    return;
  }
  const auto& config = engine_.config();

  // ---  1) Engine loop -------------------------------------------------------
  engine_.start();

  // ---  2) IpcServer and telemetry bridge -----------------------------------
  if (!config.ipc_cmd_endpoint.empty() && !config.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) {
          return engine_.executeCommand(cmd);
        },
        config.ipc_cmd_endpoint, config.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_sub_ = engine_.eventBus().subscribe([this](const Event& e) {
      if (!isInbound(e)) {
        ipc_server_->pushTelemetry(e);
      }
    });
    telemetry_bridged_ = true;
  } else if (!config.simulation) {
    std::cerr << "[EngineHost] WARNING: Live execution without an IPC "
                 "publisher; order requests will not leave the engine.\n";
  }

  // ---  3) HostGatewayThread LAST --------------------------------------------
  if (!config.host_endpoint.empty()) {
    host_thread_ = std::make_unique<HostGatewayThread>(
        [this](Event event) { engine_.submit(std::move(event)); },
        config.host_endpoint);
    host_thread_->start();
  }

  running_ = true;

  std::cout << "[EngineHost] started. Threads: engine"
            << (ipc_server_ ? ", ipc" : "")
            << (host_thread_ ? ", host_gateway" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EngineHost::stop() {
  if (!running_) {
    return;
  }

  host_thread_.reset();

  if (telemetry_bridged_) {
    engine_.eventBus().unsubscribe(telemetry_sub_);
    telemetry_bridged_ = false;
  }
  ipc_server_.reset();

  engine_.stop();

  running_ = false;

  std::cout << "[EngineHost] stopped. All threads joined.\n";
}

}  // namespace tranche
