#pragma once

#include "kds/audit/audit_filter.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/storage/i_ticket_repository.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// AuditCursor: lazy, batched view over the audit trail
// -----------------------------------------------------------------------------
//
// @brief  Returns matching entries one at a time in (timestamp, sequence)
//         order, fetching them from the repository in batches.
//
// @details
// The cursor pins the newest sequence number at the moment it was opened.
// Entries committed afterwards are never returned, so a history page is a
// consistent snapshot even while the kitchen keeps transitioning tickets.
//
// Each refill holds the repository's shared lock for one batch only; no lock
// is held while the caller consumes entries, so a slow history reader never
// holds up transitions.
//
// Thread model:
//   A cursor is used by one thread. Several cursors may run concurrently.
//
// Ownership:
//   Borrows the repository; must not outlive it.
// -----------------------------------------------------------------------------
class AuditCursor {
 public:
  AuditCursor(const ITicketRepository& repository, AuditFilter filter,
              std::uint64_t max_sequence, std::size_t batch_size);

  // Next entry, or nullopt once the filter's range or limit is exhausted.
  std::optional<domain::AuditEntry> next();

  // Drains the remaining entries into a vector.
  std::vector<domain::AuditEntry> collect();

 private:
  void refill();

  const ITicketRepository& repository_;
  AuditFilter filter_;
  std::uint64_t max_sequence_;
  std::size_t batch_size_;

  std::deque<domain::AuditEntry> buffer_;
  std::optional<AuditPosition> position_;
  std::size_t returned_{0};
  bool exhausted_{false};
};

// -----------------------------------------------------------------------------
// AuditLog: append-only record of every ticket action
// -----------------------------------------------------------------------------
//
// @brief  The single write gateway for audit entries and the read side of
//         the history view.
//
// @details
// append() stores the entry together with the ticket record it describes
// through ITicketRepository::commit(). Because the two travel in one commit,
// an entry exists if and only if the ticket change it records exists.
//
// query() returns an AuditCursor; history() is the eager convenience used
// by the command surface.
//
// Thread model:
//   All members are safe from any thread. Serializing appends for the same
//   ticket is the TicketStateMachine's job.
// -----------------------------------------------------------------------------
class AuditLog {
 public:
  static constexpr std::size_t kDefaultBatchSize = 64;

  explicit AuditLog(ITicketRepository& repository,
                    std::size_t batch_size = kDefaultBatchSize);

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  // -------------------------------------------------------------------------
  // append(ticket, entry)
  // -------------------------------------------------------------------------
  // @brief  Writes `ticket` and appends `entry` as one unit.
  //
  // @return Sequence number assigned to the entry.
  //
  // @throws StorageFailure  Nothing was written. Any other exception thrown
  //                         by the repository is reported as StorageFailure.
  // -------------------------------------------------------------------------
  std::uint64_t append(const domain::Ticket& ticket, domain::AuditEntry entry);

  // Opens a cursor over entries matching `filter`.
  AuditCursor query(AuditFilter filter) const;

  // Eager form of query().
  std::vector<domain::AuditEntry> history(AuditFilter filter) const;

 private:
  ITicketRepository& repository_;
  std::size_t batch_size_;
};

}  // namespace kds
