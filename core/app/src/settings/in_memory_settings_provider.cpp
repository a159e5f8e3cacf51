#include "kds/settings/in_memory_settings_provider.hpp"

#include <algorithm>
#include <mutex>

namespace kds {

void InMemorySettingsProvider::put(const domain::KitchenSettings& settings) {
  std::unique_lock lock(mutex_);
  by_hub_[settings.hub_id] = settings;
}

domain::KitchenSettings InMemorySettingsProvider::settings(
    const domain::HubId& hub) const {
  std::shared_lock lock(mutex_);
  auto it = by_hub_.find(hub);
  if (it != by_hub_.end()) {
    return it->second;
  }

  domain::KitchenSettings defaults;
  defaults.hub_id = hub;
  return defaults;
}

std::vector<domain::HubId> InMemorySettingsProvider::hubs() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::HubId> result;
  result.reserve(by_hub_.size());
  for (const auto& [hub, settings] : by_hub_) {
    result.push_back(hub);
  }
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace kds
