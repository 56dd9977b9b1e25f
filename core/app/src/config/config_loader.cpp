#include "rsvp/config/config_loader.hpp"

#include <fstream>
#include <iostream>

namespace rsvp {

namespace {

// Reads doc[key] into `out` when present. Type mismatches become ConfigError.
template <typename T>
void readOptional(const nlohmann::json& doc, const char* section,
                  const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid value for ") + section + key +
                      ": " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFromFile
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }

  EngineConfig config = fromJson(doc);
  std::cout << "[ConfigLoader] Loaded " << path << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// fromJson
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  EngineConfig config;

  if (auto it = doc.find("limits"); it != doc.end()) {
    if (!it->is_object()) {
      throw ConfigError("\"limits\" must be an object");
    }
    auto& limits = config.limits;
    readOptional(*it, "limits.", "min_capacity", limits.min_capacity);
    readOptional(*it, "limits.", "max_capacity", limits.max_capacity);
    readOptional(*it, "limits.", "duration_hint_ms", limits.duration_hint_ms);
    readOptional(*it, "limits.", "max_title_length", limits.max_title_length);
    readOptional(*it, "limits.", "max_description_length",
                 limits.max_description_length);
    readOptional(*it, "limits.", "max_location_length",
                 limits.max_location_length);
    readOptional(*it, "limits.", "max_notes_length", limits.max_notes_length);
  }

  if (auto it = doc.find("ipc"); it != doc.end()) {
    if (!it->is_object()) {
      throw ConfigError("\"ipc\" must be an object");
    }
    readOptional(*it, "ipc.", "cmd_endpoint", config.ipc_cmd_endpoint);
    readOptional(*it, "ipc.", "pub_endpoint", config.ipc_pub_endpoint);
  }

  readOptional(doc, "", "snapshot_path", config.snapshot_path);
  readOptional(doc, "", "reconcile_interval_ms", config.reconcile_interval_ms);

  // --- Range checks ------------------------------------------------------------
  const auto& limits = config.limits;
  if (limits.min_capacity < 1) {
    throw ConfigError("limits.min_capacity must be at least 1");
  }
  if (limits.max_capacity < limits.min_capacity) {
    throw ConfigError("limits.max_capacity must be >= limits.min_capacity");
  }
  if (limits.duration_hint_ms <= 0) {
    throw ConfigError("limits.duration_hint_ms must be positive");
  }
  if (config.reconcile_interval_ms <= 0) {
    throw ConfigError("reconcile_interval_ms must be positive");
  }
  if (config.ipc_cmd_endpoint.empty() != config.ipc_pub_endpoint.empty()) {
    std::cerr << "[ConfigLoader] WARNING: only one IPC endpoint configured;"
              << " IPC server disabled.\n";
  }

  return config;
}

}  // namespace rsvp
