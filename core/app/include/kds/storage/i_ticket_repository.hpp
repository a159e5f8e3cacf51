#pragma once

#include "kds/audit/audit_filter.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/domain/ticket.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// ITicketRepository: storage contract for tickets and their audit trail
// -----------------------------------------------------------------------------
//
// @brief  Abstracts whatever persists ticket records and audit entries.
//
// @details
// The kitchen core never talks to a storage technology directly. It needs:
//
//   1. Ticket records keyed by id, with a secondary index by
//      (hub, state, station) for the active-list and ready-queue reads.
//   2. Audit entries keyed by a monotonically increasing sequence number,
//      with secondary indexes by ticket id and by (hub, timestamp).
//   3. One atomic write that stores a ticket record AND appends its audit
//      entry: commit(). Either both become visible or neither does. This is
//      what lets the TicketStateMachine promise that the audit log never
//      records an action that did not happen, and vice versa.
//
// Failure model:
//   commit() throws StorageFailure when the unit cannot be written. Read
//   methods may throw StorageFailure when the backend is unavailable.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent calls from any thread.
//   Serializing transitions on one ticket is the state machine's job; the
//   repository only guarantees each call is atomic on its own.
// -----------------------------------------------------------------------------
class ITicketRepository {
 public:
  virtual ~ITicketRepository() = default;

  // Snapshot of one ticket, or nullopt if the id is unknown.
  virtual std::optional<domain::Ticket> find(domain::TicketId id) const = 0;

  // -------------------------------------------------------------------------
  // findByState(hub, state, station)
  // -------------------------------------------------------------------------
  // @brief  All tickets of `hub` in `state`, optionally restricted to one
  //         station. Served from the (hub, state, station) index.
  //
  // @return Snapshots in ascending ticket id order. Callers sort for display.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Ticket> findByState(
      const domain::HubId& hub, domain::TicketState state,
      const std::optional<domain::StationId>& station = std::nullopt) const = 0;

  // -------------------------------------------------------------------------
  // commit(ticket, entry)
  // -------------------------------------------------------------------------
  // @brief  Inserts or replaces `ticket` and appends `entry`, atomically.
  //
  // @param  ticket  Full record after the change. ticket.id must be non-zero.
  // @param  entry   Audit entry for the change. sequence is assigned here;
  //                 ticket_id is forced to ticket.id.
  //
  // @return The sequence number assigned to the entry.
  //
  // @throws StorageFailure  Nothing was written.
  // -------------------------------------------------------------------------
  virtual std::uint64_t commit(const domain::Ticket& ticket,
                               domain::AuditEntry entry) = 0;

  // -------------------------------------------------------------------------
  // readAudit(filter, after, max_sequence, max_count)
  // -------------------------------------------------------------------------
  // @brief  One batch of history, ordered by (timestamp, sequence).
  //
  // @param  filter        Hub and optional field filters. filter.limit is
  //                       ignored here; the cursor enforces it.
  // @param  after         Only entries strictly after this key. nullopt
  //                       starts from the beginning.
  // @param  max_sequence  Only entries with sequence <= max_sequence. Fixes
  //                       the view a cursor sees at the moment it opened.
  // @param  max_count     Batch size.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::AuditEntry> readAudit(
      const AuditFilter& filter, const std::optional<AuditPosition>& after,
      std::uint64_t max_sequence, std::size_t max_count) const = 0;

  // Sequence number of the newest audit entry (0 when empty).
  virtual std::uint64_t lastSequence() const = 0;

  // Highest ticket id stored (0 when empty). Seeds TicketIdGenerator.
  virtual domain::TicketId highestTicketId() const = 0;
};

}  // namespace kds
