#include "kds/stations/in_memory_station_directory.hpp"

#include <mutex>

namespace kds {

void InMemoryStationDirectory::put(const domain::Station& station) {
  std::unique_lock lock(mutex_);
  stations_[Key{station.hub_id, station.id}] = station;
}

bool InMemoryStationDirectory::setActive(const domain::HubId& hub,
                                         const domain::StationId& station,
                                         bool active) {
  std::unique_lock lock(mutex_);
  auto it = stations_.find(Key{hub, station});
  if (it == stations_.end()) {
    return false;
  }
  it->second.active = active;
  return true;
}

std::optional<domain::Station> InMemoryStationDirectory::find(
    const domain::HubId& hub, const domain::StationId& station) const {
  std::shared_lock lock(mutex_);
  auto it = stations_.find(Key{hub, station});
  if (it == stations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Station> InMemoryStationDirectory::list(
    const domain::HubId& hub) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Station> result;
  for (auto it = stations_.lower_bound(Key{hub, {}});
       it != stations_.end() && it->first.first == hub; ++it) {
    result.push_back(it->second);
  }
  return result;
}

}  // namespace kds
