#pragma once

#include "kds/domain/kitchen_settings.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <cstdint>

namespace kds {

// -----------------------------------------------------------------------------
// EscalationEngine: ticket age and urgency
// -----------------------------------------------------------------------------
// Stateless. Age is measured from the ticket's last state change, so a
// ticket that moves on starts a fresh clock. A threshold of 0 or less turns
// its level off. Terminal tickets are always Normal.
// -----------------------------------------------------------------------------
class EscalationEngine {
 public:
  // now - last_transition_at, clamped at 0 for clocks that moved backwards.
  static std::int64_t elapsed(const domain::Ticket& ticket, domain::TimeMs now);

  static domain::Urgency classify(const domain::Ticket& ticket,
                                  const domain::KitchenSettings& settings,
                                  domain::TimeMs now);
};

}  // namespace kds
