#pragma once

#include "tranche/domain/order.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tranche {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig: immutable parameters for one engine instance
// -----------------------------------------------------------------------------
//
// @brief  Everything the level engine needs to know before the first event:
//         the threshold ladders, sizing, the contract multiplier, and the
//         host/IPC endpoints.
//
// @details
// Loaded once at startup by loadConfigFile() (config/config_loader.hpp) and
// passed by value (or const reference) into components. Nothing mutates it
// after construction.
//
// Threshold semantics:
//   entry_levels: signal magnitudes (deviation units) that open a Level.
//                  A Buy level opens when signal < -threshold, a Sell level
//                  when signal > threshold.
//   exit_levels : multipliers applied to a Level's entry threshold. Each
//                  multiplier is one exit tranche; a Level's size is split
//                  across them as evenly as possible.
//
// instrument_factor is the contract multiplier applied uniformly to every
// PnL figure (realized, unrealized, per-cycle, per-exit). Mixing factors
// between components is a configuration error, so a single value lives here.
//
// Empty endpoints disable the corresponding network component, which is how
// unit tests run the engine without sockets.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string instrument{"ES"};

  std::vector<double> entry_levels{1.0, 2.0, 3.0};
  std::vector<double> exit_levels{0.5, 0.0};

  std::size_t max_concurrent_levels{3};
  Quantity position_size{1};
  double instrument_factor{1.0};

  // When true, LevelEngine sends the correction proposed by
  // PositionReconciler whenever the theoretical and actual books disagree
  // and no order is live.
  bool reconcile_positions{false};

  // When true, the engine advances its simulation clock from bar timestamps
  // and uses SimulatedTradeGateway instead of publishing order requests.
  bool simulation{true};

  std::string host_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  // Append-only JSON-lines file for completed trade cycles. Empty disables
  // the file audit (cycles are still published on the EventBus).
  std::string audit_path;
};

}  // namespace domain
}  // namespace tranche
