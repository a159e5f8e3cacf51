#pragma once

#include "kds/domain/order.hpp"
#include "kds/domain/ticket.hpp"

#include <optional>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// IStationDirectory: station identity and availability lookup
// -----------------------------------------------------------------------------
// Station definitions belong to the orders collaborator. The StationRouter
// only asks whether a station exists in a hub and whether it is active.
// Implementations MUST be safe for concurrent reads.
// -----------------------------------------------------------------------------
class IStationDirectory {
 public:
  virtual ~IStationDirectory() = default;

  virtual std::optional<domain::Station> find(
      const domain::HubId& hub, const domain::StationId& station) const = 0;

  // Stations of `hub` ordered by id.
  virtual std::vector<domain::Station> list(const domain::HubId& hub) const = 0;
};

}  // namespace kds
