#pragma once

#include "kds/settings/i_settings_provider.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace kds {

// -----------------------------------------------------------------------------
// InMemorySettingsProvider
// -----------------------------------------------------------------------------
// ISettingsProvider backed by a map. put() is the settings collaborator's
// side (config loader at startup, tests); the kitchen core only reads.
// -----------------------------------------------------------------------------
class InMemorySettingsProvider : public ISettingsProvider {
 public:
  InMemorySettingsProvider() = default;

  // Inserts or replaces the settings for settings.hub_id.
  void put(const domain::KitchenSettings& settings);

  domain::KitchenSettings settings(const domain::HubId& hub) const override;
  std::vector<domain::HubId> hubs() const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::HubId, domain::KitchenSettings> by_hub_;
};

}  // namespace kds
