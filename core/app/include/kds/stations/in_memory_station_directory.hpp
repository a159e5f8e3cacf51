#pragma once

#include "kds/stations/i_station_directory.hpp"

#include <map>
#include <shared_mutex>
#include <utility>

namespace kds {

// -----------------------------------------------------------------------------
// InMemoryStationDirectory
// -----------------------------------------------------------------------------
// Map-backed IStationDirectory filled from the startup config (or a test).
// setActive() models a station being switched off mid-service.
// -----------------------------------------------------------------------------
class InMemoryStationDirectory : public IStationDirectory {
 public:
  void put(const domain::Station& station);

  // Returns false if the station is unknown.
  bool setActive(const domain::HubId& hub, const domain::StationId& station,
                 bool active);

  std::optional<domain::Station> find(
      const domain::HubId& hub,
      const domain::StationId& station) const override;

  std::vector<domain::Station> list(const domain::HubId& hub) const override;

 private:
  using Key = std::pair<domain::HubId, domain::StationId>;

  mutable std::shared_mutex mutex_;
  std::map<Key, domain::Station> stations_;
};

}  // namespace kds
