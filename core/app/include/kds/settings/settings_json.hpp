#pragma once

#include "kds/domain/kitchen_settings.hpp"
#include "kds/domain/order.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// settings_json: JSON (de)serialization of kitchen configuration
// -----------------------------------------------------------------------------
//
// @brief  Converts KitchenSettings to and from JSON and parses the engine's
//         startup config file.
//
// @details
// Missing keys in a settings object keep the KitchenSettings defaults, so a
// hub entry may list only the values it overrides. Type mismatches and
// malformed JSON surface as nlohmann::json::exception; callers decide
// whether that is fatal (main() exits, the command surface replies with an
// error).
//
// Config file layout:
//   {
//     "ipc": { "cmd_endpoint": "...", "pub_endpoint": "..." },
//     "hubs": [ { "hub_id": "h1", "warning_threshold_seconds": 600, ... } ],
//     "stations": [ { "id": "grill", "hub_id": "h1", "name": "Grill",
//                     "active": true } ]
//   }
// -----------------------------------------------------------------------------

struct EngineConfig {
  std::vector<domain::KitchenSettings> hubs;
  std::vector<domain::Station> stations;
  bool ipc_enabled{true};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

domain::KitchenSettings settingsFromJson(const nlohmann::json& j);
nlohmann::json settingsToJson(const domain::KitchenSettings& settings);

domain::Station stationFromJson(const nlohmann::json& j);

// Throws nlohmann::json::exception on malformed or mistyped input.
EngineConfig parseEngineConfig(const std::string& text);

// Throws std::runtime_error if the file cannot be read, otherwise as
// parseEngineConfig().
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace kds
