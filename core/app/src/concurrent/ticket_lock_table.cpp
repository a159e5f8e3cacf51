#include "kds/concurrent/ticket_lock_table.hpp"

#include <utility>

namespace kds {

// -----------------------------------------------------------------------------
// Guard
// -----------------------------------------------------------------------------
TicketLockTable::Guard::Guard(TicketLockTable& table, domain::TicketId id,
                              std::shared_ptr<Entry> entry)
    : table_(table),
      id_(id),
      entry_(std::move(entry)),
      lock_(entry_->mutex) {}

TicketLockTable::Guard::~Guard() {
  lock_.unlock();
  table_.release(id_);
}

// -----------------------------------------------------------------------------
// acquire(): register as a user under the table lock, then block on the
// ticket mutex outside it
// -----------------------------------------------------------------------------
std::unique_ptr<TicketLockTable::Guard> TicketLockTable::acquire(
    domain::TicketId id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(table_mutex_);
    auto& slot = entries_[id];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    ++slot->users;
    entry = slot;
  }
  return std::make_unique<Guard>(*this, id, std::move(entry));
}

void TicketLockTable::release(domain::TicketId id) {
  std::lock_guard lock(table_mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return;
  }
  if (--it->second->users == 0) {
    entries_.erase(it);
  }
}

std::size_t TicketLockTable::size() const {
  std::lock_guard lock(table_mutex_);
  return entries_.size();
}

}  // namespace kds
