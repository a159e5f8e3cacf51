#include "kds/kitchen/station_router.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/kitchen/errors.hpp"

#include <iostream>
#include <utility>

namespace kds {

StationRouter::StationRouter(const IStationDirectory& stations,
                             TicketStateMachine& state_machine,
                             TicketIdGenerator& ids, const ITimeProvider& time,
                             EventSink sink)
    : stations_(stations),
      state_machine_(state_machine),
      ids_(ids),
      time_(time),
      sink_(std::move(sink)) {}

void StationRouter::validateLine(const domain::Order& order,
                                 const domain::OrderLine& line) const {
  if (line.station_id.empty()) {
    throw RoutingError(line.line_id, line.station_id, "no station assigned");
  }
  if (line.quantity <= 0) {
    throw RoutingError(line.line_id, line.station_id, "quantity must be > 0");
  }

  auto station = stations_.find(order.hub_id, line.station_id);
  if (!station) {
    throw RoutingError(line.line_id, line.station_id, "unknown station");
  }
  if (!station->active) {
    throw RoutingError(line.line_id, line.station_id, "station inactive");
  }
}

// -----------------------------------------------------------------------------
// route(): one ticket per line, failures collected per line
// -----------------------------------------------------------------------------
RoutingResult StationRouter::route(const domain::Order& order,
                                   const domain::KitchenSettings& settings) {
  RoutingResult result;

  for (const auto& line : order.lines) {
    try {
      validateLine(order, line);
    } catch (const RoutingError& e) {
      std::cerr << "[StationRouter] WARNING: order " << order.order_id
                << " line " << e.lineId() << " -> station '" << e.stationId()
                << "': " << e.reason() << "\n";
      result.failures.push_back({e.lineId(), e.stationId(), e.reason()});
      continue;
    }

    domain::Ticket ticket;
    ticket.id = ids_.next_id();
    ticket.hub_id = order.hub_id;
    ticket.order_id = order.order_id;
    ticket.line_id = line.line_id;
    ticket.station_id = line.station_id;
    ticket.item_name = line.item_name;
    ticket.quantity = line.quantity;
    ticket.notes = line.notes;
    ticket.priority = order.priority;

    ticket = state_machine_.create(std::move(ticket), domain::kSystemActor,
                                   settings.auto_accept_enabled);

    result.tickets.push_back(std::move(ticket));
  }

  std::cout << "[StationRouter] order " << order.order_id << " (#"
            << order.order_number << ") hub=" << order.hub_id << ": "
            << result.tickets.size() << " ticket(s), "
            << result.failures.size() << " failure(s)\n";

  if (sink_) {
    OrderRoutedEvent event;
    event.order_id = order.order_id;
    event.hub_id = order.hub_id;
    event.order_number = order.order_number;
    for (const auto& ticket : result.tickets) {
      event.ticket_ids.push_back(ticket.id);
    }
    for (const auto& failure : result.failures) {
      event.failed_lines.push_back(failure.line_id);
    }
    event.play_sound = !result.tickets.empty() && settings.sound_enabled &&
                       settings.sound_on_new_order;
    event.timestamp = time_.now_ms();
    sink_(std::move(event));
  }

  return result;
}

}  // namespace kds
