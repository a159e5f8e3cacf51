#pragma once

#include "kds/domain/ticket.hpp"

#include <string>
#include <vector>

namespace kds {
namespace domain {

// -----------------------------------------------------------------------------
// OrderLine / Order: the orders collaborator's view of an incoming order
// -----------------------------------------------------------------------------
//
// @brief  Plain data handed to StationRouter::route().
//
// @details
// The target station of each line has already been resolved by the orders
// collaborator from its menu/station mapping. The kitchen core only checks
// that the station exists and is active.
//
// The core copies the identifiers it needs into each Ticket and keeps no
// reference to the Order afterwards.
// -----------------------------------------------------------------------------
struct OrderLine {
  std::string line_id;
  std::string item_id;
  std::string item_name;
  int quantity{1};
  std::string notes;
  StationId station_id;
};

struct Order {
  std::string order_id;
  HubId hub_id;
  std::string order_number;     // Short number printed on the ticket ("042")
  std::string table;            // Table label, empty for takeaway
  int priority{0};              // Default priority of every routed ticket
  std::vector<OrderLine> lines;
};

// -----------------------------------------------------------------------------
// Station: identity and availability of a preparation station
// -----------------------------------------------------------------------------
struct Station {
  StationId id;
  HubId hub_id;
  std::string name;
  bool active{true};
};

}  // namespace domain
}  // namespace kds
