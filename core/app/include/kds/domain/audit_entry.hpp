#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <cstdint>
#include <string>

namespace kds {
namespace domain {

// Actor name recorded for transitions the engine performs on its own
// (auto-accept at routing time, auto-bump).
inline constexpr const char* kSystemActor = "system";

// -----------------------------------------------------------------------------
// AuditEntry
// -----------------------------------------------------------------------------
//
// @brief  Immutable record of one ticket action.
//
// @details
// Written exactly once per successful transition, priority change or ticket
// creation, in the same repository commit as the ticket write. The sequence
// number is assigned by the repository at commit time; callers leave it 0.
//
// from_state / to_state are equal for PriorityChanged. notes carries a short
// human-readable detail ("priority 0 -> 5").
//
// Ownership:
//   Owned exclusively by the AuditLog's backing store. Never mutated or
//   deleted once written; readers receive copies.
// -----------------------------------------------------------------------------
struct AuditEntry {
  std::uint64_t sequence{0};
  TicketId ticket_id{0};
  HubId hub_id;
  std::string order_id;
  std::string line_id;
  StationId station_id;
  AuditAction action{AuditAction::Received};
  std::string actor;
  TimeMs timestamp{0};
  TicketState from_state{TicketState::Received};
  TicketState to_state{TicketState::Received};
  std::string notes;
};

}  // namespace domain
}  // namespace kds
