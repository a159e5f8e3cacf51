#include "kds/kitchen/ready_queue.hpp"

#include <algorithm>

namespace kds {

ReadyQueue::ReadyQueue(const ITicketRepository& repository)
    : repository_(repository) {}

std::vector<domain::Ticket> ReadyQueue::list(const domain::HubId& hub) const {
  std::vector<domain::Ticket> tickets =
      repository_.findByState(hub, domain::TicketState::Bumped);

  std::sort(tickets.begin(), tickets.end(),
            [](const domain::Ticket& a, const domain::Ticket& b) {
              if (a.priority != b.priority) {
                return a.priority > b.priority;
              }
              domain::TimeMs a_at = a.bumped_at.value_or(a.last_transition_at);
              domain::TimeMs b_at = b.bumped_at.value_or(b.last_transition_at);
              if (a_at != b_at) {
                return a_at < b_at;
              }
              return a.id < b.id;
            });
  return tickets;
}

}  // namespace kds
