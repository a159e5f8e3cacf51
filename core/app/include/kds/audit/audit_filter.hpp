#pragma once

#include "kds/domain/audit_entry.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kds {

// -----------------------------------------------------------------------------
// AuditFilter: history query parameters
// -----------------------------------------------------------------------------
// hub_id is required: history is always read per hub. Every optional field
// that is set must match. The time range is inclusive on both ends. limit 0
// means "no limit".
// -----------------------------------------------------------------------------
struct AuditFilter {
  domain::HubId hub_id;
  std::optional<domain::TicketId> ticket_id;
  std::optional<std::string> order_id;
  std::optional<domain::StationId> station_id;
  std::optional<std::string> actor;
  std::optional<domain::AuditAction> action;
  std::optional<domain::TimeMs> from_ms;
  std::optional<domain::TimeMs> to_ms;
  std::size_t limit{0};

  bool matches(const domain::AuditEntry& entry) const;
};

// -----------------------------------------------------------------------------
// AuditPosition: resume key for batched reads
// -----------------------------------------------------------------------------
// History is ordered by (timestamp, sequence). A cursor remembers the key of
// the last entry it returned and asks for entries strictly after it.
// -----------------------------------------------------------------------------
struct AuditPosition {
  domain::TimeMs timestamp{0};
  std::uint64_t sequence{0};

  bool operator<(const AuditPosition& other) const {
    return timestamp < other.timestamp ||
           (timestamp == other.timestamp && sequence < other.sequence);
  }
};

}  // namespace kds
