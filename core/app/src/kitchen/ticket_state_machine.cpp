#include "kds/kitchen/ticket_state_machine.hpp"
#include "kds/kitchen/errors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace kds {

using domain::AuditAction;
using domain::TicketState;
using domain::Trigger;

TicketStateMachine::TicketStateMachine(ITicketRepository& repository,
                                       AuditLog& audit, TicketLockTable& locks,
                                       const ITimeProvider& time,
                                       EventSink sink)
    : repository_(repository),
      audit_(audit),
      locks_(locks),
      time_(time),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// nextState(): the transition table
// -----------------------------------------------------------------------------
std::optional<TicketState> TicketStateMachine::nextState(TicketState state,
                                                         Trigger trigger) {
  switch (trigger) {
    case Trigger::Accept:
      if (state == TicketState::Received) return TicketState::Accepted;
      break;
    case Trigger::Start:
      if (state == TicketState::Accepted) return TicketState::InProgress;
      break;
    case Trigger::Bump:
      if (state == TicketState::InProgress) return TicketState::Bumped;
      break;
    case Trigger::Complete:
      if (state == TicketState::Bumped) return TicketState::Completed;
      break;
    case Trigger::Serve:
      if (state == TicketState::Completed) return TicketState::Served;
      break;
    case Trigger::Cancel:
      if (domain::isActive(state) || state == TicketState::Bumped) {
        return TicketState::Cancelled;
      }
      break;
    case Trigger::Recall:
      // One step back. Received has nowhere to go.
      switch (state) {
        case TicketState::Accepted:   return TicketState::Received;
        case TicketState::InProgress: return TicketState::Accepted;
        case TicketState::Bumped:     return TicketState::InProgress;
        case TicketState::Completed:  return TicketState::Bumped;
        default: break;
      }
      break;
  }
  return std::nullopt;
}

std::optional<Trigger> TicketStateMachine::forwardTrigger(TicketState state) {
  switch (state) {
    case TicketState::Received:   return Trigger::Accept;
    case TicketState::Accepted:   return Trigger::Start;
    case TicketState::InProgress: return Trigger::Bump;
    case TicketState::Bumped:     return Trigger::Complete;
    case TicketState::Completed:  return Trigger::Serve;
    case TicketState::Served:
    case TicketState::Recalled:
    case TicketState::Cancelled:
      break;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// create(): first record + `received` entry in one commit
// -----------------------------------------------------------------------------
domain::Ticket TicketStateMachine::create(domain::Ticket ticket,
                                          const std::string& actor,
                                          bool auto_accept) {
  if (ticket.id == 0) {
    throw std::invalid_argument("ticket id must be non-zero");
  }

  auto guard = locks_.acquire(ticket.id);

  const domain::TimeMs now = time_.now_ms();
  ticket.state = TicketState::Received;
  ticket.created_at = now;
  ticket.last_transition_at = now;
  ticket.accepted_at.reset();
  ticket.started_at.reset();
  ticket.bumped_at.reset();
  ticket.completed_at.reset();
  ticket.served_at.reset();
  ticket.cancelled_at.reset();

  ticket = commit(ticket, TicketState::Received, AuditAction::Received, actor,
                  {});
  if (auto_accept) {
    ticket = transitionLocked(ticket, Trigger::Accept, actor);
  }
  return ticket;
}

domain::Ticket TicketStateMachine::apply(domain::TicketId id, Trigger trigger,
                                         const std::string& actor) {
  auto guard = locks_.acquire(id);
  return transitionLocked(load(id), trigger, actor);
}

std::optional<domain::Ticket> TicketStateMachine::applyIf(
    domain::TicketId id, Trigger trigger, const std::string& actor,
    const TransitionGuard& guard) {
  auto lock = locks_.acquire(id);
  domain::Ticket current = load(id);

  if (guard && !guard(current)) {
    return std::nullopt;
  }
  if (!nextState(current.state, trigger)) {
    return std::nullopt;
  }
  return transitionLocked(current, trigger, actor);
}

domain::Ticket TicketStateMachine::changePriority(domain::TicketId id,
                                                  int priority,
                                                  const std::string& actor) {
  auto guard = locks_.acquire(id);
  domain::Ticket current = load(id);

  if (domain::isTerminal(current.state)) {
    std::cerr << "[TicketStateMachine] WARNING: change_priority rejected for "
              << "ticket_id=" << id << " in state "
              << domain::toString(current.state) << "\n";
    throw IllegalTransitionError(id, current.state, "change_priority");
  }
  domain::Ticket updated = current;
  updated.priority = priority;

  std::string notes = "priority " + std::to_string(current.priority) + " -> " +
                      std::to_string(priority);
  return commit(updated, current.state, AuditAction::PriorityChanged, actor,
                std::move(notes));
}

domain::Ticket TicketStateMachine::advance(domain::TicketId id,
                                           const std::string& actor) {
  auto guard = locks_.acquire(id);
  domain::Ticket current = load(id);

  auto trigger = forwardTrigger(current.state);
  if (!trigger) {
    throw IllegalTransitionError(id, current.state, "advance");
  }
  return transitionLocked(current, *trigger, actor);
}

domain::Ticket TicketStateMachine::load(domain::TicketId id) const {
  auto ticket = repository_.find(id);
  if (!ticket) {
    throw NotFoundError(id);
  }
  return *ticket;
}

// -----------------------------------------------------------------------------
// transitionLocked(): validate, stamp, commit
// -----------------------------------------------------------------------------
domain::Ticket TicketStateMachine::transitionLocked(
    const domain::Ticket& current, Trigger trigger, const std::string& actor) {
  auto target = nextState(current.state, trigger);
  if (!target) {
    std::cerr << "[TicketStateMachine] WARNING: illegal transition "
              << domain::toString(trigger) << " for ticket_id=" << current.id
              << " in state " << domain::toString(current.state) << "\n";
    throw IllegalTransitionError(current.id, current.state,
                                 domain::toString(trigger));
  }

  // Stamps never run backwards, even if the wall clock is stepped back.
  const domain::TimeMs now =
      std::max(time_.now_ms(), current.last_transition_at);

  domain::Ticket updated = current;
  updated.state = *target;
  updated.last_transition_at = now;

  // Recall moves backwards and keeps the stamps already recorded. Forward
  // moves stamp the state they enter, again on re-entry.
  if (trigger != Trigger::Recall) {
    switch (*target) {
      case TicketState::Accepted:   updated.accepted_at = now; break;
      case TicketState::InProgress: updated.started_at = now; break;
      case TicketState::Bumped:     updated.bumped_at = now; break;
      case TicketState::Completed:  updated.completed_at = now; break;
      case TicketState::Served:     updated.served_at = now; break;
      case TicketState::Cancelled:  updated.cancelled_at = now; break;
      case TicketState::Received:
      case TicketState::Recalled:
        break;
    }
  }

  return commit(updated, current.state, domain::actionFor(trigger), actor, {});
}

// -----------------------------------------------------------------------------
// commit(): one audit append, then notify
// -----------------------------------------------------------------------------
domain::Ticket TicketStateMachine::commit(const domain::Ticket& updated,
                                          TicketState previous_state,
                                          AuditAction action,
                                          const std::string& actor,
                                          std::string notes) {
  domain::AuditEntry entry;
  entry.ticket_id = updated.id;
  entry.hub_id = updated.hub_id;
  entry.order_id = updated.order_id;
  entry.line_id = updated.line_id;
  entry.station_id = updated.station_id;
  entry.action = action;
  entry.actor = actor;
  entry.timestamp = action == AuditAction::PriorityChanged
                        ? time_.now_ms()
                        : updated.last_transition_at;
  entry.from_state = previous_state;
  entry.to_state = updated.state;
  entry.notes = std::move(notes);

  const domain::TimeMs timestamp = entry.timestamp;
  const std::uint64_t sequence = audit_.append(updated, std::move(entry));

  if (sink_) {
    TicketUpdateEvent event;
    event.ticket = updated;
    event.previous_state = previous_state;
    event.action = action;
    event.actor = actor;
    event.audit_sequence = sequence;
    event.timestamp = timestamp;
    sink_(std::move(event));
  }

  return updated;
}

}  // namespace kds
