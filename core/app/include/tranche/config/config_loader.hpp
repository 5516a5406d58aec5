#pragma once

#include "tranche/domain/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tranche {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  JSON file → validated EngineConfig.
//
// @details
// Keys are the EngineConfig member names. Every key is optional; a missing
// key keeps its default. Unknown keys are reported on std::cerr and ignored
// so a typo is visible without stopping the engine.
//
//   {
//     "instrument": "ES",
//     "entry_levels": [1.0, 2.0, 3.0],
//     "exit_levels": [0.5, 0.0],
//     "max_concurrent_levels": 3,
//     "position_size": 2,
//     "instrument_factor": 50.0,
//     "reconcile_positions": true,
//     "simulation": false,
//     "host_endpoint": "tcp://127.0.0.1:5555",
//     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//     "audit_path": "audit/cycles.jsonl"
//   }
//
// Errors are fatal at startup: main() reports them and exits with status 1.
// -----------------------------------------------------------------------------

// Builds and validates a config. Throws nlohmann::json::exception for a
// mistyped value and std::invalid_argument for an invalid one.
domain::EngineConfig configFromJson(const nlohmann::json& j);

// Reads, parses and validates a file. Throws std::invalid_argument when the
// file cannot be opened, plus everything configFromJson() throws.
domain::EngineConfig loadConfigFile(const std::string& path);

// -------------------------------------------------------------------------
// validateConfig(config)
// -------------------------------------------------------------------------
// @throws std::invalid_argument when: instrument is empty; entry_levels or
//         exit_levels is empty; an entry threshold is <= 0; an exit
//         multiplier is < 0; max_concurrent_levels, position_size or
//         instrument_factor is not positive.
// -------------------------------------------------------------------------
void validateConfig(const domain::EngineConfig& config);

}  // namespace tranche
