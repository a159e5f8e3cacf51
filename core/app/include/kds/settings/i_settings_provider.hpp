#pragma once

#include "kds/domain/kitchen_settings.hpp"
#include "kds/domain/ticket.hpp"

#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// ISettingsProvider: read-only per-hub configuration
// -----------------------------------------------------------------------------
//
// @brief  How the kitchen core learns a hub's KitchenSettings.
//
// @details
// The core only reads. Components call settings(hub) at the start of each
// operation and pass the returned value down, so a settings change takes
// effect on the next routing call or scheduler tick without any component
// caching stale values.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads.
// -----------------------------------------------------------------------------
class ISettingsProvider {
 public:
  virtual ~ISettingsProvider() = default;

  // Settings for `hub`. Unknown hubs get defaults with hub_id filled in.
  virtual domain::KitchenSettings settings(const domain::HubId& hub) const = 0;

  // Hubs with explicit settings. The AutoBumpScheduler scans these.
  virtual std::vector<domain::HubId> hubs() const = 0;
};

}  // namespace kds
