#include "kds/storage/in_memory_ticket_repository.hpp"
#include "kds/kitchen/errors.hpp"

#include <algorithm>
#include <mutex>

namespace kds {

// -----------------------------------------------------------------------------
// find
// -----------------------------------------------------------------------------
std::optional<domain::Ticket> InMemoryTicketRepository::find(
    domain::TicketId id) const {
  std::shared_lock lock(mutex_);
  auto it = tickets_.find(id);
  if (it == tickets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// findByState: range scan over the (hub, state, station) index
// -----------------------------------------------------------------------------
std::vector<domain::Ticket> InMemoryTicketRepository::findByState(
    const domain::HubId& hub, domain::TicketState state,
    const std::optional<domain::StationId>& station) const {
  std::shared_lock lock(mutex_);

  std::vector<domain::TicketId> ids;
  if (station) {
    auto it = state_index_.find(StateKey{hub, state, *station});
    if (it != state_index_.end()) {
      ids.assign(it->second.begin(), it->second.end());
    }
  } else {
    // Empty station id sorts first, so this lands on the hub/state prefix.
    for (auto it = state_index_.lower_bound(StateKey{hub, state, {}});
         it != state_index_.end() && std::get<0>(it->first) == hub &&
         std::get<1>(it->first) == state;
         ++it) {
      ids.insert(ids.end(), it->second.begin(), it->second.end());
    }
    std::sort(ids.begin(), ids.end());
  }

  std::vector<domain::Ticket> result;
  result.reserve(ids.size());
  for (domain::TicketId id : ids) {
    result.push_back(tickets_.at(id));
  }
  return result;
}

// -----------------------------------------------------------------------------
// commit: ticket upsert + audit append under one exclusive lock
// -----------------------------------------------------------------------------
std::uint64_t InMemoryTicketRepository::commit(const domain::Ticket& ticket,
                                               domain::AuditEntry entry) {
  if (ticket.id == 0) {
    throw StorageFailure("refusing to store a ticket without an id");
  }

  std::unique_lock lock(mutex_);

  entry.sequence = audit_.size() + 1;
  entry.ticket_id = ticket.id;

  auto existing = tickets_.find(ticket.id);
  if (existing != tickets_.end()) {
    unindexTicket(existing->second);
    existing->second = ticket;
  } else {
    tickets_.emplace(ticket.id, ticket);
  }
  indexTicket(ticket);
  highest_id_ = std::max(highest_id_, ticket.id);

  audit_by_hub_[entry.hub_id].insert(
      AuditPosition{entry.timestamp, entry.sequence});
  audit_by_ticket_[entry.ticket_id].push_back(entry.sequence);
  audit_.push_back(std::move(entry));

  return audit_.size();
}

// -----------------------------------------------------------------------------
// readAudit: one batch in (timestamp, sequence) order
// -----------------------------------------------------------------------------
std::vector<domain::AuditEntry> InMemoryTicketRepository::readAudit(
    const AuditFilter& filter, const std::optional<AuditPosition>& after,
    std::uint64_t max_sequence, std::size_t max_count) const {
  std::shared_lock lock(mutex_);

  std::vector<domain::AuditEntry> batch;
  if (max_count == 0) {
    return batch;
  }

  auto accept = [&](const AuditPosition& pos) {
    if (pos.sequence > max_sequence || pos.sequence == 0 ||
        pos.sequence > audit_.size()) {
      return;
    }
    if (after && !(*after < pos)) {
      return;
    }
    const domain::AuditEntry& entry = audit_[pos.sequence - 1];
    if (filter.matches(entry)) {
      batch.push_back(entry);
    }
  };

  // --- Ticket filter: the per-ticket index is small, sort it directly ------
  if (filter.ticket_id) {
    auto it = audit_by_ticket_.find(*filter.ticket_id);
    if (it == audit_by_ticket_.end()) {
      return batch;
    }
    std::vector<AuditPosition> keys;
    keys.reserve(it->second.size());
    for (std::uint64_t seq : it->second) {
      keys.push_back(AuditPosition{audit_[seq - 1].timestamp, seq});
    }
    std::sort(keys.begin(), keys.end());
    for (const AuditPosition& pos : keys) {
      accept(pos);
      if (batch.size() >= max_count) {
        break;
      }
    }
    return batch;
  }

  // --- Hub scan over the (hub, timestamp) index ----------------------------
  auto hub_it = audit_by_hub_.find(filter.hub_id);
  if (hub_it == audit_by_hub_.end()) {
    return batch;
  }
  const std::set<AuditPosition>& keys = hub_it->second;

  // Start at whichever is later: the resume key or the range start.
  // Sequence 0 is never assigned, so {from, 0} sorts before every entry
  // stamped at `from`.
  auto it = keys.begin();
  if (filter.from_ms &&
      (!after || *after < AuditPosition{*filter.from_ms, 0})) {
    it = keys.lower_bound(AuditPosition{*filter.from_ms, 0});
  } else if (after) {
    it = keys.upper_bound(*after);
  }

  for (; it != keys.end() && batch.size() < max_count; ++it) {
    if (filter.to_ms && it->timestamp > *filter.to_ms) {
      break;
    }
    accept(*it);
  }
  return batch;
}

std::uint64_t InMemoryTicketRepository::lastSequence() const {
  std::shared_lock lock(mutex_);
  return audit_.size();
}

domain::TicketId InMemoryTicketRepository::highestTicketId() const {
  std::shared_lock lock(mutex_);
  return highest_id_;
}

std::size_t InMemoryTicketRepository::auditSize() const {
  std::shared_lock lock(mutex_);
  return audit_.size();
}

// -----------------------------------------------------------------------------
// Index maintenance (exclusive lock held by caller)
// -----------------------------------------------------------------------------
void InMemoryTicketRepository::indexTicket(const domain::Ticket& ticket) {
  state_index_[StateKey{ticket.hub_id, ticket.state, ticket.station_id}]
      .insert(ticket.id);
}

void InMemoryTicketRepository::unindexTicket(const domain::Ticket& ticket) {
  auto it = state_index_.find(
      StateKey{ticket.hub_id, ticket.state, ticket.station_id});
  if (it == state_index_.end()) {
    return;
  }
  it->second.erase(ticket.id);
  if (it->second.empty()) {
    state_index_.erase(it);
  }
}

}  // namespace kds
