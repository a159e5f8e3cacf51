#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <cstdint>

namespace kds {

// -----------------------------------------------------------------------------
// EscalationEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the AutoBumpScheduler when an active ticket's urgency
//         rises (Normal → Warning, Warning → Critical).
//
// @details
// Only rises are reported. A ticket that changes state starts a new timer
// and is reported again if it ages past a threshold in its new state.
// play_sound is the hub's sound_enabled && sound_on_rush, and is only ever
// set for Critical.
// -----------------------------------------------------------------------------
struct EscalationEvent {
  domain::TicketId ticket_id{0};
  domain::HubId hub_id;
  domain::StationId station_id;
  domain::TicketState state{domain::TicketState::Received};
  domain::Urgency previous_urgency{domain::Urgency::Normal};
  domain::Urgency urgency{domain::Urgency::Normal};
  std::int64_t elapsed_ms{0};
  bool play_sound{false};
  domain::TimeMs timestamp{0};
};

}  // namespace kds
