// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Tests for rsvp::ConfigLoader.
//
// Validates:
//   - an empty object yields the built-in defaults
//   - every recognised key overrides its default
//   - type mismatches and out-of-range values raise ConfigError
//   - loadFromFile reports missing and unparseable files
// =============================================================================

#include "rsvp/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using json = nlohmann::json;

class ConfigLoaderTest : public ::testing::Test {
 protected:
  std::string path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = ::testing::TempDir() + "rsvp_config_" + info->name() + ".json";
    std::remove(path.c_str());
  }

  void TearDown() override { std::remove(path.c_str()); }

  void writeFile(const std::string& content) const {
    std::ofstream out(path, std::ios::trunc);
    out << content;
  }
};

// -----------------------------------------------------------------------------
// 1. {} gives the defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyObjectGivesDefaults) {
  const auto config = rsvp::ConfigLoader::fromJson(json::object());

  EXPECT_EQ(config.limits.min_capacity, 1);
  EXPECT_EQ(config.limits.max_capacity, 10000);
  EXPECT_EQ(config.limits.duration_hint_ms, 4LL * 60 * 60 * 1000);
  EXPECT_EQ(config.limits.max_notes_length, 500u);
  EXPECT_EQ(config.ipc_cmd_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.ipc_pub_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_TRUE(config.snapshot_path.empty());
  EXPECT_EQ(config.reconcile_interval_ms, 1000);
}

// -----------------------------------------------------------------------------
// 2. Every section overrides its defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, OverridesApplied) {
  const json doc = json::parse(R"({
    "limits": {
      "min_capacity": 2,
      "max_capacity": 50,
      "duration_hint_ms": 3600000,
      "max_title_length": 40,
      "max_description_length": 400,
      "max_location_length": 80,
      "max_notes_length": 10
    },
    "ipc": { "cmd_endpoint": "ipc:///tmp/rsvp-cmd", "pub_endpoint": "" },
    "snapshot_path": "/var/lib/rsvp/ledger.json",
    "reconcile_interval_ms": 250
  })");

  const auto config = rsvp::ConfigLoader::fromJson(doc);
  EXPECT_EQ(config.limits.min_capacity, 2);
  EXPECT_EQ(config.limits.max_capacity, 50);
  EXPECT_EQ(config.limits.duration_hint_ms, 3600000);
  EXPECT_EQ(config.limits.max_title_length, 40u);
  EXPECT_EQ(config.limits.max_description_length, 400u);
  EXPECT_EQ(config.limits.max_location_length, 80u);
  EXPECT_EQ(config.limits.max_notes_length, 10u);
  EXPECT_EQ(config.ipc_cmd_endpoint, "ipc:///tmp/rsvp-cmd");
  EXPECT_TRUE(config.ipc_pub_endpoint.empty());
  EXPECT_EQ(config.snapshot_path, "/var/lib/rsvp/ledger.json");
  EXPECT_EQ(config.reconcile_interval_ms, 250);
}

// -----------------------------------------------------------------------------
// 3. Wrong shapes and types are refused.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, WrongTypesThrow) {
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(json::array()), rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(json{{"limits", 5}}),
               rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(json{{"ipc", "tcp://x"}}),
               rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(
                   json{{"limits", {{"max_capacity", "lots"}}}}),
               rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(json{{"snapshot_path", 12}}),
               rsvp::ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Out-of-range values are refused.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, OutOfRangeThrows) {
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(
                   json{{"limits", {{"min_capacity", 0}}}}),
               rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(json{
                   {"limits", {{"min_capacity", 10}, {"max_capacity", 5}}}}),
               rsvp::ConfigError);
  EXPECT_THROW(rsvp::ConfigLoader::fromJson(
                   json{{"limits", {{"duration_hint_ms", 0}}}}),
               rsvp::ConfigError);
  EXPECT_THROW(
      rsvp::ConfigLoader::fromJson(json{{"reconcile_interval_ms", -1}}),
      rsvp::ConfigError);
}

// -----------------------------------------------------------------------------
// 5. loadFromFile reads a file from disk.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadFromFile) {
  writeFile(R"({"snapshot_path": "ledger.json", "reconcile_interval_ms": 50})");

  const auto config = rsvp::ConfigLoader::loadFromFile(path);
  EXPECT_EQ(config.snapshot_path, "ledger.json");
  EXPECT_EQ(config.reconcile_interval_ms, 50);
}

// -----------------------------------------------------------------------------
// 6. Missing and unparseable files are ConfigError.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, BadFilesThrow) {
  EXPECT_THROW(rsvp::ConfigLoader::loadFromFile(path), rsvp::ConfigError);

  writeFile("{ \"limits\": ");
  EXPECT_THROW(rsvp::ConfigLoader::loadFromFile(path), rsvp::ConfigError);
}
