#pragma once

#include "kds/concurrent/ticket_id_generator.hpp"
#include "kds/domain/kitchen_settings.hpp"
#include "kds/domain/order.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/events/event.hpp"
#include "kds/kitchen/ticket_state_machine.hpp"
#include "kds/stations/i_station_directory.hpp"
#include "kds/time/i_time_provider.hpp"

#include <string>
#include <vector>

namespace kds {

struct RoutingFailure {
  std::string line_id;
  domain::StationId station_id;
  std::string reason;
};

struct RoutingResult {
  std::vector<domain::Ticket> tickets;
  std::vector<RoutingFailure> failures;
};

// -----------------------------------------------------------------------------
// StationRouter: turns an incoming order into per-station tickets
// -----------------------------------------------------------------------------
//
// @brief  Creates one Received ticket per order line at the line's station.
//
// @details
// Lines are independent. A line naming an unknown or inactive station is
// rejected with a RoutingError that is recorded in RoutingResult::failures;
// the remaining lines are still routed. When the hub has auto_accept_enabled
// each new ticket is immediately accepted by the system actor.
//
// A StorageFailure is not a routing problem and propagates out of route().
// Tickets committed before the failure stay in place.
//
// After routing an OrderRoutedEvent goes to the event sink so displays can
// chime for the new order.
// -----------------------------------------------------------------------------
class StationRouter {
 public:
  StationRouter(const IStationDirectory& stations,
                TicketStateMachine& state_machine, TicketIdGenerator& ids,
                const ITimeProvider& time, EventSink sink = {});

  RoutingResult route(const domain::Order& order,
                      const domain::KitchenSettings& settings);

 private:
  // Throws RoutingError when the line cannot be placed.
  void validateLine(const domain::Order& order,
                    const domain::OrderLine& line) const;

  const IStationDirectory& stations_;
  TicketStateMachine& state_machine_;
  TicketIdGenerator& ids_;
  const ITimeProvider& time_;
  EventSink sink_;
};

}  // namespace kds
