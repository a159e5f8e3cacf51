#pragma once

#include "kds/domain/ticket.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// OrderRoutedEvent
// -----------------------------------------------------------------------------
// Published by the StationRouter once per routed order. failed_lines lists
// the line ids that produced a RoutingError. play_sound is the hub's
// sound_enabled && sound_on_new_order, and is false when no ticket was
// created.
// -----------------------------------------------------------------------------
struct OrderRoutedEvent {
  std::string order_id;
  domain::HubId hub_id;
  std::string order_number;
  std::vector<domain::TicketId> ticket_ids;
  std::vector<std::string> failed_lines;
  bool play_sound{false};
  domain::TimeMs timestamp{0};
};

}  // namespace kds
