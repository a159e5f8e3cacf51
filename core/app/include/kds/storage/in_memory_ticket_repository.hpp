#pragma once

#include "kds/storage/i_ticket_repository.hpp"

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// InMemoryTicketRepository: process-local ITicketRepository
// -----------------------------------------------------------------------------
//
// @brief  Keeps tickets and audit entries in memory with the indexes the
//         interface describes.
//
// @details
// Layout:
//   tickets_        TicketId → Ticket
//   state_index_    (hub, state, station) → set<TicketId>
//   audit_          vector<AuditEntry>, entry with sequence N at index N-1
//   audit_by_hub_   hub → set<(timestamp, sequence)>
//   audit_by_ticket_ TicketId → vector<sequence>
//
// The state index is ordered hub, state, station so one range scan serves
// both "all Bumped tickets of a hub" and "InProgress tickets of station X".
//
// commit() takes the exclusive lock once and updates every structure inside
// it, which is what makes the ticket write and the audit append one unit.
// Readers take the shared lock for the duration of a single call only.
//
// Thread model:
//   All members are safe from any thread (std::shared_mutex).
//
// Ownership:
//   Typically owned by main() or a test fixture and borrowed by the
//   KitchenEngine. Must outlive the engine.
// -----------------------------------------------------------------------------
class InMemoryTicketRepository : public ITicketRepository {
 public:
  InMemoryTicketRepository() = default;

  InMemoryTicketRepository(const InMemoryTicketRepository&) = delete;
  InMemoryTicketRepository& operator=(const InMemoryTicketRepository&) = delete;

  std::optional<domain::Ticket> find(domain::TicketId id) const override;

  std::vector<domain::Ticket> findByState(
      const domain::HubId& hub, domain::TicketState state,
      const std::optional<domain::StationId>& station =
          std::nullopt) const override;

  std::uint64_t commit(const domain::Ticket& ticket,
                       domain::AuditEntry entry) override;

  std::vector<domain::AuditEntry> readAudit(
      const AuditFilter& filter, const std::optional<AuditPosition>& after,
      std::uint64_t max_sequence, std::size_t max_count) const override;

  std::uint64_t lastSequence() const override;

  domain::TicketId highestTicketId() const override;

  // Total number of audit entries across all hubs.
  std::size_t auditSize() const;

 private:
  using StateKey =
      std::tuple<domain::HubId, domain::TicketState, domain::StationId>;

  // Both helpers expect the exclusive lock to be held.
  void indexTicket(const domain::Ticket& ticket);
  void unindexTicket(const domain::Ticket& ticket);

  mutable std::shared_mutex mutex_;

  std::unordered_map<domain::TicketId, domain::Ticket> tickets_;
  std::map<StateKey, std::set<domain::TicketId>> state_index_;
  domain::TicketId highest_id_{0};

  std::vector<domain::AuditEntry> audit_;
  std::unordered_map<domain::HubId, std::set<AuditPosition>> audit_by_hub_;
  std::unordered_map<domain::TicketId, std::vector<std::uint64_t>>
      audit_by_ticket_;
};

}  // namespace kds
