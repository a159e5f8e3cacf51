#pragma once

#include "kds/events/escalation_event.hpp"
#include "kds/events/order_routed_event.hpp"
#include "kds/events/ticket_update_event.hpp"

#include <functional>
#include <type_traits>
#include <variant>

namespace kds {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by the EventBus and the
// notification loop's queue. A std::variant keeps events as plain values
// that can be copied across threads; adding an event kind means adding it
// here and the compiler points at every std::visit that needs updating.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TicketUpdateEvent,
    EscalationEvent,
    OrderRoutedEvent>;

// Hub an event belongs to. Display subscribers filter on it.
inline const domain::HubId& hubOf(const Event& event) {
  return std::visit(
      [](const auto& e) -> const domain::HubId& {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TicketUpdateEvent>) {
          return e.ticket.hub_id;
        } else {
          return e.hub_id;
        }
      },
      event);
}

// Where components hand their events. Bound to NotificationLoop::push() by
// the KitchenEngine; tests bind it to a vector. Must be callable from any
// thread.
using EventSink = std::function<void(Event)>;

}  // namespace kds
