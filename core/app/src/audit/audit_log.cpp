#include "kds/audit/audit_log.hpp"
#include "kds/kitchen/errors.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace kds {

// =============================================================================
// AuditCursor
// =============================================================================

AuditCursor::AuditCursor(const ITicketRepository& repository,
                         AuditFilter filter, std::uint64_t max_sequence,
                         std::size_t batch_size)
    : repository_(repository),
      filter_(std::move(filter)),
      max_sequence_(max_sequence),
      batch_size_(std::max<std::size_t>(batch_size, 1)) {}

std::optional<domain::AuditEntry> AuditCursor::next() {
  if (filter_.limit != 0 && returned_ >= filter_.limit) {
    return std::nullopt;
  }

  if (buffer_.empty() && !exhausted_) {
    refill();
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }

  domain::AuditEntry entry = std::move(buffer_.front());
  buffer_.pop_front();
  ++returned_;
  return entry;
}

std::vector<domain::AuditEntry> AuditCursor::collect() {
  std::vector<domain::AuditEntry> result;
  while (auto entry = next()) {
    result.push_back(std::move(*entry));
  }
  return result;
}

// -----------------------------------------------------------------------------
// refill(): fetch the next batch after the last key handed out
// -----------------------------------------------------------------------------
void AuditCursor::refill() {
  std::vector<domain::AuditEntry> batch =
      repository_.readAudit(filter_, position_, max_sequence_, batch_size_);

  if (batch.size() < batch_size_) {
    exhausted_ = true;
  }
  if (!batch.empty()) {
    const domain::AuditEntry& last = batch.back();
    position_ = AuditPosition{last.timestamp, last.sequence};
  }
  for (auto& entry : batch) {
    buffer_.push_back(std::move(entry));
  }
}

// =============================================================================
// AuditLog
// =============================================================================

AuditLog::AuditLog(ITicketRepository& repository, std::size_t batch_size)
    : repository_(repository), batch_size_(batch_size) {}

// -----------------------------------------------------------------------------
// append(): one repository commit for ticket + entry
// -----------------------------------------------------------------------------
std::uint64_t AuditLog::append(const domain::Ticket& ticket,
                               domain::AuditEntry entry) {
  try {
    return repository_.commit(ticket, std::move(entry));
  } catch (const StorageFailure& e) {
    std::cerr << "[AuditLog] ERROR: commit failed for ticket_id=" << ticket.id
              << ": " << e.what() << "\n";
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[AuditLog] ERROR: repository error for ticket_id="
              << ticket.id << ": " << e.what() << "\n";
    throw StorageFailure(e.what());
  }
}

AuditCursor AuditLog::query(AuditFilter filter) const {
  return AuditCursor(repository_, std::move(filter),
                     repository_.lastSequence(), batch_size_);
}

std::vector<domain::AuditEntry> AuditLog::history(AuditFilter filter) const {
  return query(std::move(filter)).collect();
}

}  // namespace kds
