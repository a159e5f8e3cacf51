#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <cstdint>
#include <string>

namespace kds {

// -----------------------------------------------------------------------------
// TicketUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the TicketStateMachine after every successful commit
//         (creation, transition, priority change).
//
// @details
// Carries a snapshot of the ticket after the change, the state it left and
// the audit entry's action, actor and sequence, so display subscribers can
// update a single ticket tile without re-reading the repository.
//
// Published only after the repository commit succeeded; a failed commit
// publishes nothing.
// -----------------------------------------------------------------------------
struct TicketUpdateEvent {
  domain::Ticket ticket;                                       // After the change
  domain::TicketState previous_state{domain::TicketState::Received};
  domain::AuditAction action{domain::AuditAction::Received};
  std::string actor;
  std::uint64_t audit_sequence{0};
  domain::TimeMs timestamp{0};
};

}  // namespace kds
