#pragma once

#include "kds/domain/ticket.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace kds {

// -----------------------------------------------------------------------------
// TicketLockTable: one mutex per ticket, created on demand
// -----------------------------------------------------------------------------
//
// @brief  Serializes transitions on the same ticket while letting
//         transitions on different tickets run in parallel.
//
// @details
// acquire(id) returns a Guard holding that ticket's mutex. The table mutex
// is only held while looking up (or creating) the per-ticket entry, never
// while the ticket lock itself is held, so two threads working on different
// tickets never wait for each other.
//
// Entries are reference counted by the Guards using them; the last Guard to
// release an entry erases it, so the table only holds tickets that are being
// transitioned right now.
//
// Thread model:
//   acquire() is safe from any thread. A Guard must be released on the
//   thread that acquired it (std::mutex rule).
// -----------------------------------------------------------------------------
class TicketLockTable {
 private:
  struct Entry {
    std::mutex mutex;
    std::size_t users{0};  // Guards holding or waiting on `mutex`
  };

 public:
  // RAII handle: holds the ticket's mutex until destroyed.
  class Guard {
   public:
    Guard(TicketLockTable& table, domain::TicketId id,
          std::shared_ptr<Entry> entry);
    ~Guard();

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard(Guard&&) = delete;
    Guard& operator=(Guard&&) = delete;

   private:
    TicketLockTable& table_;
    domain::TicketId id_;
    std::shared_ptr<Entry> entry_;
    std::unique_lock<std::mutex> lock_;
  };

  TicketLockTable() = default;

  TicketLockTable(const TicketLockTable&) = delete;
  TicketLockTable& operator=(const TicketLockTable&) = delete;

  // Blocks until the calling thread holds ticket `id`'s lock.
  std::unique_ptr<Guard> acquire(domain::TicketId id);

  // Number of tickets currently locked or waited on. For tests.
  std::size_t size() const;

 private:
  void release(domain::TicketId id);

  mutable std::mutex table_mutex_;
  std::unordered_map<domain::TicketId, std::shared_ptr<Entry>> entries_;
};

}  // namespace kds
