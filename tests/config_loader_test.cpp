// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for tranche/config/config_loader.hpp.
//
// Validates:
//   - Every key maps onto its EngineConfig member
//   - Missing keys keep their defaults; unknown keys are ignored
//   - Invalid values throw std::invalid_argument, mistyped ones a json error
//   - loadConfigFile reads from disk and reports a missing file
// =============================================================================

#include "tranche/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

TEST(ConfigLoaderTest, ReadsEveryKey) {
  auto j = nlohmann::json::parse(R"({
    "instrument": "NQ",
    "entry_levels": [1.5, 2.5],
    "exit_levels": [0.75, 0.25, 0.0],
    "max_concurrent_levels": 2,
    "position_size": 4,
    "instrument_factor": 20.0,
    "reconcile_positions": true,
    "simulation": false,
    "host_endpoint": "tcp://127.0.0.1:6000",
    "ipc_cmd_endpoint": "",
    "ipc_pub_endpoint": "",
    "audit_path": "out/cycles.jsonl"
  })");

  auto config = tranche::configFromJson(j);
  EXPECT_EQ(config.instrument, "NQ");
  EXPECT_EQ(config.entry_levels, (std::vector<double>{1.5, 2.5}));
  EXPECT_EQ(config.exit_levels.size(), 3u);
  EXPECT_EQ(config.max_concurrent_levels, 2u);
  EXPECT_EQ(config.position_size, 4);
  EXPECT_DOUBLE_EQ(config.instrument_factor, 20.0);
  EXPECT_TRUE(config.reconcile_positions);
  EXPECT_FALSE(config.simulation);
  EXPECT_EQ(config.host_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_TRUE(config.ipc_cmd_endpoint.empty());
  EXPECT_EQ(config.audit_path, "out/cycles.jsonl");
}

TEST(ConfigLoaderTest, MissingKeysKeepDefaults) {
  auto config = tranche::configFromJson(
      nlohmann::json::parse(R"({"position_size": 3, "typo_key": 1})"));
  const tranche::domain::EngineConfig defaults;

  EXPECT_EQ(config.position_size, 3);
  EXPECT_EQ(config.instrument, defaults.instrument);
  EXPECT_EQ(config.entry_levels, defaults.entry_levels);
  EXPECT_EQ(config.max_concurrent_levels, defaults.max_concurrent_levels);
  EXPECT_EQ(config.simulation, defaults.simulation);
}

// -----------------------------------------------------------------------------
// Invalid values are fatal.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, RejectsInvalidValues) {
  const char* invalid[] = {
      R"([1, 2])",
      R"({"instrument": ""})",
      R"({"entry_levels": []})",
      R"({"entry_levels": [1.0, 0.0]})",
      R"({"exit_levels": []})",
      R"({"exit_levels": [0.5, -0.1]})",
      R"({"max_concurrent_levels": 0})",
      R"({"max_concurrent_levels": -2})",
      R"({"position_size": 0})",
      R"({"instrument_factor": 0.0})",
  };
  for (const char* text : invalid) {
    EXPECT_THROW(tranche::configFromJson(nlohmann::json::parse(text)),
                 std::invalid_argument)
        << text;
  }
}

TEST(ConfigLoaderTest, MistypedValueThrowsJsonError) {
  EXPECT_THROW(tranche::configFromJson(
                   nlohmann::json::parse(R"({"position_size": "two"})")),
               nlohmann::json::exception);
}

TEST(ConfigLoaderTest, DefaultConfigIsValid) {
  EXPECT_NO_THROW(tranche::validateConfig(tranche::domain::EngineConfig{}));
}

// -----------------------------------------------------------------------------
// Files.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadsFromFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "tranche_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"instrument": "CL", "position_size": 2})";
  }

  auto config = tranche::loadConfigFile(path.string());
  EXPECT_EQ(config.instrument, "CL");
  EXPECT_EQ(config.position_size, 2);

  std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, MissingFileThrows) {
  EXPECT_THROW(tranche::loadConfigFile("/nonexistent/tranche/config.json"),
               std::invalid_argument);
}
