#include "kds/kitchen/errors.hpp"

#include <utility>

namespace kds {

RoutingError::RoutingError(std::string line_id, domain::StationId station_id,
                           const std::string& reason)
    : KitchenError("cannot route line '" + line_id + "' to station '" +
                   station_id + "': " + reason),
      line_id_(std::move(line_id)),
      station_id_(std::move(station_id)),
      reason_(reason) {}

IllegalTransitionError::IllegalTransitionError(domain::TicketId ticket_id,
                                               domain::TicketState state,
                                               const std::string& requested)
    : KitchenError("ticket " + std::to_string(ticket_id) + " in state '" +
                   domain::toString(state) + "' cannot " + requested),
      ticket_id_(ticket_id),
      state_(state) {}

NotFoundError::NotFoundError(domain::TicketId ticket_id)
    : KitchenError("unknown ticket " + std::to_string(ticket_id)),
      ticket_id_(ticket_id) {}

}  // namespace kds
