#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/storage/i_ticket_repository.hpp"

#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// ReadyQueue: Bumped tickets waiting at the pass
// -----------------------------------------------------------------------------
// A view over the repository's (hub, Bumped) index. Ordered by priority
// (highest first), then bumped_at (oldest first), then id. Each call reads a
// fresh snapshot; nothing is cached or mutated.
// -----------------------------------------------------------------------------
class ReadyQueue {
 public:
  explicit ReadyQueue(const ITicketRepository& repository);

  std::vector<domain::Ticket> list(const domain::HubId& hub) const;

 private:
  const ITicketRepository& repository_;
};

}  // namespace kds
