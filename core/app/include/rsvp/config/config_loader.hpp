#pragma once

#include "rsvp/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ConfigError: configuration file missing, malformed or out of range
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// ConfigLoader: reads EngineConfig from a JSON document
// -----------------------------------------------------------------------------
//
// @brief  Every key is optional; absent keys keep the EngineConfig default.
//
// @details
// Recognised layout (see config/engine.json):
//
//   {
//     "limits": {
//       "min_capacity": 1,
//       "max_capacity": 10000,
//       "duration_hint_ms": 14400000,
//       "max_title_length": 100,
//       "max_description_length": 2000,
//       "max_location_length": 200,
//       "max_notes_length": 500
//     },
//     "ipc": { "cmd_endpoint": "tcp://...", "pub_endpoint": "tcp://..." },
//     "snapshot_path": "rsvp_snapshot.json",
//     "reconcile_interval_ms": 1000
//   }
//
// Unknown keys are ignored. Wrong types and out-of-range values throw
// ConfigError naming the offending key.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static EngineConfig loadFromFile(const std::string& path);

  static EngineConfig fromJson(const nlohmann::json& doc);
};

}  // namespace rsvp
