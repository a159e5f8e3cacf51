#include "kds/settings/settings_json.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace kds {

namespace {

// Overwrites `out` only when `key` is present. Keeps struct defaults for
// omitted keys.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

}  // namespace

domain::KitchenSettings settingsFromJson(const nlohmann::json& j) {
  domain::KitchenSettings s;
  s.hub_id = j.at("hub_id").get<std::string>();

  readOptional(j, "warning_threshold_seconds", s.warning_threshold_seconds);
  readOptional(j, "critical_threshold_seconds", s.critical_threshold_seconds);
  readOptional(j, "auto_bump_enabled", s.auto_bump_enabled);
  readOptional(j, "auto_bump_delay_seconds", s.auto_bump_delay_seconds);
  readOptional(j, "auto_bump_interval_ms", s.auto_bump_interval_ms);
  readOptional(j, "auto_accept_enabled", s.auto_accept_enabled);
  readOptional(j, "items_per_page", s.items_per_page);
  readOptional(j, "refresh_interval_seconds", s.refresh_interval_seconds);
  readOptional(j, "show_timer", s.show_timer);
  readOptional(j, "color_coding_enabled", s.color_coding_enabled);
  readOptional(j, "sound_enabled", s.sound_enabled);
  readOptional(j, "sound_on_new_order", s.sound_on_new_order);
  readOptional(j, "sound_on_rush", s.sound_on_rush);
  return s;
}

nlohmann::json settingsToJson(const domain::KitchenSettings& s) {
  nlohmann::json j;
  j["hub_id"] = s.hub_id;
  j["warning_threshold_seconds"] = s.warning_threshold_seconds;
  j["critical_threshold_seconds"] = s.critical_threshold_seconds;
  j["auto_bump_enabled"] = s.auto_bump_enabled;
  j["auto_bump_delay_seconds"] = s.auto_bump_delay_seconds;
  j["auto_bump_interval_ms"] = s.auto_bump_interval_ms;
  j["auto_accept_enabled"] = s.auto_accept_enabled;
  j["items_per_page"] = s.items_per_page;
  j["refresh_interval_seconds"] = s.refresh_interval_seconds;
  j["show_timer"] = s.show_timer;
  j["color_coding_enabled"] = s.color_coding_enabled;
  j["sound_enabled"] = s.sound_enabled;
  j["sound_on_new_order"] = s.sound_on_new_order;
  j["sound_on_rush"] = s.sound_on_rush;
  return j;
}

domain::Station stationFromJson(const nlohmann::json& j) {
  domain::Station station;
  station.id = j.at("id").get<std::string>();
  station.hub_id = j.at("hub_id").get<std::string>();
  station.name = j.value("name", station.id);
  readOptional(j, "active", station.active);
  return station;
}

EngineConfig parseEngineConfig(const std::string& text) {
  auto root = nlohmann::json::parse(text);

  EngineConfig config;

  if (auto ipc = root.find("ipc"); ipc != root.end()) {
    readOptional(*ipc, "enabled", config.ipc_enabled);
    readOptional(*ipc, "cmd_endpoint", config.cmd_endpoint);
    readOptional(*ipc, "pub_endpoint", config.pub_endpoint);
  }

  if (auto hubs = root.find("hubs"); hubs != root.end()) {
    for (const auto& hub : *hubs) {
      config.hubs.push_back(settingsFromJson(hub));
    }
  }

  if (auto stations = root.find("stations"); stations != root.end()) {
    for (const auto& station : *stations) {
      config.stations.push_back(stationFromJson(station));
    }
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace kds
