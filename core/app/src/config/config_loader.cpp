#include "tranche/config/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace tranche {

namespace {

const std::set<std::string>& knownKeys() {
  static const std::set<std::string> keys = {
      "instrument",          "entry_levels",      "exit_levels",
      "max_concurrent_levels", "position_size",   "instrument_factor",
      "reconcile_positions", "simulation",        "host_endpoint",
      "ipc_cmd_endpoint",    "ipc_pub_endpoint",  "audit_path"};
  return keys;
}

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& target) {
  auto it = j.find(key);
  if (it != j.end()) {
    target = it->get<T>();
  }
}

}  // namespace

domain::EngineConfig configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("config: top level must be a JSON object");
  }

  for (const auto& item : j.items()) {
    if (knownKeys().count(item.key()) == 0) {
      std::cerr << "[Config] WARNING: unknown key '" << item.key()
                << "' ignored\n";
    }
  }

  domain::EngineConfig config;
  readIfPresent(j, "instrument", config.instrument);
  readIfPresent(j, "entry_levels", config.entry_levels);
  readIfPresent(j, "exit_levels", config.exit_levels);
  readIfPresent(j, "position_size", config.position_size);
  readIfPresent(j, "instrument_factor", config.instrument_factor);
  readIfPresent(j, "reconcile_positions", config.reconcile_positions);
  readIfPresent(j, "simulation", config.simulation);
  readIfPresent(j, "host_endpoint", config.host_endpoint);
  readIfPresent(j, "ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  readIfPresent(j, "ipc_pub_endpoint", config.ipc_pub_endpoint);
  readIfPresent(j, "audit_path", config.audit_path);

  // Read signed so a negative capacity is reported rather than wrapped.
  auto capacity = j.find("max_concurrent_levels");
  if (capacity != j.end()) {
    const auto value = capacity->get<std::int64_t>();
    if (value <= 0) {
      throw std::invalid_argument("config: max_concurrent_levels must be > 0");
    }
    config.max_concurrent_levels = static_cast<std::size_t>(value);
  }

  validateConfig(config);
  return config;
}

domain::EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream input(path);
  if (!input.good()) {
    throw std::invalid_argument("config: cannot open '" + path + "'");
  }

  nlohmann::json j = nlohmann::json::parse(input);
  domain::EngineConfig config = configFromJson(j);

  std::cout << "[Config] Loaded " << path << ": " << config.instrument
            << ", " << config.entry_levels.size() << " entry / "
            << config.exit_levels.size() << " exit levels, capacity "
            << config.max_concurrent_levels << "\n";
  return config;
}

void validateConfig(const domain::EngineConfig& config) {
  if (config.instrument.empty()) {
    throw std::invalid_argument("config: instrument must not be empty");
  }
  if (config.entry_levels.empty()) {
    throw std::invalid_argument("config: entry_levels must not be empty");
  }
  if (config.exit_levels.empty()) {
    throw std::invalid_argument("config: exit_levels must not be empty");
  }
  for (double threshold : config.entry_levels) {
    if (!(threshold > 0.0)) {
      throw std::invalid_argument("config: entry_levels must all be > 0");
    }
  }
  for (double multiplier : config.exit_levels) {
    if (!(multiplier >= 0.0)) {
      throw std::invalid_argument("config: exit_levels must all be >= 0");
    }
  }
  if (config.max_concurrent_levels == 0) {
    throw std::invalid_argument("config: max_concurrent_levels must be > 0");
  }
  if (config.position_size <= 0) {
    throw std::invalid_argument("config: position_size must be > 0");
  }
  if (!(config.instrument_factor > 0.0)) {
    throw std::invalid_argument("config: instrument_factor must be > 0");
  }
}

}  // namespace tranche
