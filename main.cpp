// -----------------------------------------------------------------------------
// tranche_engine: single executable entry point.
//
//   1) Load the EngineConfig (JSON file from argv[1], defaults otherwise).
//   2) Build the LevelEngine and subscribe console logging for Level and
//      position events.
//   3) Start the EngineHost: engine loop, IPC server, host gateway thread.
//   4) Idle on the main thread until SIGINT/SIGTERM.
//   5) Shut down cleanly (EngineHost::stop() joins every thread).
//
// Thread layout:
//   main thread          → waits for shutdown
//   engine loop thread   → LevelEngine handlers
//   host gateway thread  → HostGateway ZMQ recv loop
//   ipc thread           → IpcServer telemetry + commands
// -----------------------------------------------------------------------------

#include "tranche/config/config_loader.hpp"
#include "tranche/domain/engine_config.hpp"
#include "tranche/engine/engine_host.hpp"
#include "tranche/engine/level_engine.hpp"
#include "tranche/events/level_events.hpp"
#include "tranche/events/position_update_event.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

// Set by the signal handler, polled by main(). The only global.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char* argv[]) {
  tranche::domain::EngineConfig config;
  try {
    if (argc > 1) {
      config = tranche::loadConfigFile(argv[1]);
    } else {
      std::cout << "[main] No config file given; using defaults.\n";
      tranche::validateConfig(config);
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] Malformed configuration: " << e.what() << "\n";
    return 1;
  }

  tranche::LevelEngine engine(config);

  engine.eventBus().subscribe<tranche::LevelExitEvent>(
      [](const tranche::LevelExitEvent& e) {
        std::cout << "[LevelExit] level=" << e.level_id
                  << " tranche=" << e.exit_index
                  << " qty=" << e.exited_quantity
                  << " remaining=" << e.remaining_position
                  << " price=" << e.exit_price << " pnl=" << e.pnl
                  << (e.level_completed ? " (completed)" : "") << "\n";
      });

  engine.eventBus().subscribe<tranche::PositionUpdateEvent>(
      [](const tranche::PositionUpdateEvent& e) {
        std::cout << "[PositionUpdate] book=" << e.position.book
                  << " position=" << e.position.current_position
                  << " realized_pnl=" << e.position.realized_pnl
                  << " unrealized_pnl=" << e.position.unrealized_pnl << "\n";
      });

  engine.eventBus().subscribe<tranche::CycleCompletedEvent>(
      [](const tranche::CycleCompletedEvent& e) {
        std::cout << "[CycleCompleted] book=" << e.book
                  << " max_position=" << e.record.max_position
                  << " pnl=" << e.record.pnl
                  << " minutes=" << e.record.cycle_time_minutes << "\n";
      });

  tranche::EngineHost host(engine);
  try {
    host.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Failed to open sockets: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] Waiting for host messages on " << config.host_endpoint
            << ". Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  host.stop();

  return 0;
}
