#pragma once

#include "kds/domain/ticket.hpp"

#include <atomic>
#include <cstdint>

namespace kds {

// -----------------------------------------------------------------------------
// TicketIdGenerator: thread-safe, monotonically increasing ticket IDs
// -----------------------------------------------------------------------------
//
// @brief  Hands out ticket IDs starting at 1 (0 is the "unset" sentinel).
//
// @details
// Owned by KitchenEngine as a value member and injected by reference into
// the StationRouter. Several display terminals may route orders at the same
// time, so the counter is atomic; relaxed ordering is enough because only
// uniqueness matters.
//
// seed() lets the engine continue numbering after tickets restored from an
// existing repository. It must be called before any routing starts.
// -----------------------------------------------------------------------------
class TicketIdGenerator {
 public:
  TicketIdGenerator() = default;

  TicketIdGenerator(const TicketIdGenerator&) = delete;
  TicketIdGenerator& operator=(const TicketIdGenerator&) = delete;
  TicketIdGenerator(TicketIdGenerator&&) = delete;
  TicketIdGenerator& operator=(TicketIdGenerator&&) = delete;

  domain::TicketId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Next call to next_id() returns max(current, highest_used + 1).
  void seed(domain::TicketId highest_used) {
    domain::TicketId wanted = highest_used + 1;
    domain::TicketId current = next_id_.load(std::memory_order_relaxed);
    while (current < wanted &&
           !next_id_.compare_exchange_weak(current, wanted,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<domain::TicketId> next_id_{1};
};

}  // namespace kds
