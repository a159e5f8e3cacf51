// =============================================================================
// settings_json_test.cpp
// =============================================================================
// Unit tests for the JSON config layer and kds::InMemorySettingsProvider.
// =============================================================================

#include "kds/settings/in_memory_settings_provider.hpp"
#include "kds/settings/settings_json.hpp"
#include "kds/stations/in_memory_station_directory.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

TEST(SettingsJsonTest, MissingKeysKeepDefaults) {
  auto s = kds::settingsFromJson(
      nlohmann::json{{"hub_id", "h1"}, {"warning_threshold_seconds", 120}});

  EXPECT_EQ(s.hub_id, "h1");
  EXPECT_EQ(s.warning_threshold_seconds, 120);
  EXPECT_EQ(s.critical_threshold_seconds, 1800);
  EXPECT_FALSE(s.auto_bump_enabled);
  EXPECT_EQ(s.auto_bump_delay_seconds, 5);
  EXPECT_EQ(s.items_per_page, 12);
  EXPECT_TRUE(s.sound_on_rush);
}

TEST(SettingsJsonTest, SerializeThenParseKeepsEveryField) {
  kds::domain::KitchenSettings s;
  s.hub_id = "airport";
  s.auto_accept_enabled = true;
  s.auto_bump_enabled = true;
  s.auto_bump_delay_seconds = 240;
  s.auto_bump_interval_ms = 250;
  s.sound_enabled = false;
  s.refresh_interval_seconds = 3;

  auto back = kds::settingsFromJson(kds::settingsToJson(s));
  EXPECT_EQ(back.hub_id, "airport");
  EXPECT_TRUE(back.auto_accept_enabled);
  EXPECT_TRUE(back.auto_bump_enabled);
  EXPECT_EQ(back.auto_bump_delay_seconds, 240);
  EXPECT_EQ(back.auto_bump_interval_ms, 250);
  EXPECT_FALSE(back.sound_enabled);
  EXPECT_EQ(back.refresh_interval_seconds, 3);
}

TEST(SettingsJsonTest, WrongTypeOrMissingHubThrows) {
  EXPECT_THROW(kds::settingsFromJson(nlohmann::json{{"items_per_page", 3}}),
               nlohmann::json::exception);
  EXPECT_THROW(kds::settingsFromJson(nlohmann::json{
                   {"hub_id", "h1"}, {"auto_bump_enabled", "yes"}}),
               nlohmann::json::exception);
}

TEST(SettingsJsonTest, ParsesEngineConfig) {
  const char* text = R"({
    "ipc": {"enabled": false, "cmd_endpoint": "ipc:///tmp/kds-cmd"},
    "hubs": [{"hub_id": "h1", "auto_accept_enabled": true}],
    "stations": [
      {"id": "grill", "hub_id": "h1", "name": "Grill"},
      {"id": "cold", "hub_id": "h1", "active": false}
    ]
  })";

  auto config = kds::parseEngineConfig(text);
  EXPECT_FALSE(config.ipc_enabled);
  EXPECT_EQ(config.cmd_endpoint, "ipc:///tmp/kds-cmd");
  EXPECT_EQ(config.pub_endpoint, "tcp://127.0.0.1:5557");
  ASSERT_EQ(config.hubs.size(), 1u);
  EXPECT_TRUE(config.hubs[0].auto_accept_enabled);
  ASSERT_EQ(config.stations.size(), 2u);
  EXPECT_TRUE(config.stations[0].active);
  EXPECT_EQ(config.stations[1].name, "cold");
  EXPECT_FALSE(config.stations[1].active);
}

TEST(SettingsJsonTest, MalformedConfigThrows) {
  EXPECT_THROW(kds::parseEngineConfig("{\"hubs\": [}"),
               nlohmann::json::parse_error);
}

TEST(SettingsJsonTest, LoadsConfigFromFile) {
  const std::string path = ::testing::TempDir() + "kds_settings_test.json";
  {
    std::ofstream out(path);
    out << R"({"hubs": [{"hub_id": "h9", "items_per_page": 20}]})";
  }

  auto config = kds::loadEngineConfig(path);
  ASSERT_EQ(config.hubs.size(), 1u);
  EXPECT_EQ(config.hubs[0].items_per_page, 20);
  std::remove(path.c_str());

  EXPECT_THROW(kds::loadEngineConfig(path), std::runtime_error);
}

// -----------------------------------------------------------------------------
// InMemorySettingsProvider: explicit hubs, defaults for the rest.
// -----------------------------------------------------------------------------
TEST(InMemorySettingsProviderTest, UnknownHubGetsDefaults) {
  kds::InMemorySettingsProvider provider;
  auto s = provider.settings("new-hub");
  EXPECT_EQ(s.hub_id, "new-hub");
  EXPECT_EQ(s.warning_threshold_seconds, 900);
  EXPECT_TRUE(provider.hubs().empty());
}

TEST(InMemorySettingsProviderTest, PutReplacesAndListsHubs) {
  kds::InMemorySettingsProvider provider;
  kds::domain::KitchenSettings s;
  s.hub_id = "b";
  provider.put(s);
  s.hub_id = "a";
  s.auto_bump_enabled = true;
  provider.put(s);

  EXPECT_EQ(provider.hubs(), (std::vector<kds::domain::HubId>{"a", "b"}));
  EXPECT_TRUE(provider.settings("a").auto_bump_enabled);
  EXPECT_FALSE(provider.settings("b").auto_bump_enabled);
}

TEST(InMemoryStationDirectoryTest, FindListAndDeactivate) {
  kds::InMemoryStationDirectory stations;
  stations.put({"grill", "h1", "Grill", true});
  stations.put({"fryer", "h1", "Fryer", true});
  stations.put({"grill", "h2", "Grill 2", true});

  EXPECT_EQ(stations.list("h1").size(), 2u);
  EXPECT_FALSE(stations.find("h1", "wok").has_value());
  EXPECT_EQ(stations.find("h2", "grill")->name, "Grill 2");

  EXPECT_TRUE(stations.setActive("h1", "grill", false));
  EXPECT_FALSE(stations.find("h1", "grill")->active);
  EXPECT_TRUE(stations.find("h2", "grill")->active);
  EXPECT_FALSE(stations.setActive("h1", "wok", false));
}
