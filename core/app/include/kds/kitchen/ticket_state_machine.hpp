#pragma once

#include "kds/audit/audit_log.hpp"
#include "kds/concurrent/ticket_lock_table.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"
#include "kds/events/event.hpp"
#include "kds/storage/i_ticket_repository.hpp"
#include "kds/time/i_time_provider.hpp"

#include <functional>
#include <optional>
#include <string>

namespace kds {

// -----------------------------------------------------------------------------
// TicketStateMachine: the only component that changes a ticket's state
// -----------------------------------------------------------------------------
//
// @brief  Validates triggers against the transition table, stamps the
//         matching timestamp and writes the new ticket record together with
//         exactly one audit entry.
//
// @details
// Transition table:
//
//   Received   --accept-->   Accepted
//   Accepted   --start-->    InProgress
//   InProgress --bump-->     Bumped
//   Bumped     --complete--> Completed
//   Completed  --serve-->    Served
//   Received|Accepted|InProgress|Bumped --cancel--> Cancelled
//   Accepted|InProgress|Bumped|Completed --recall--> one step back
//
// Every operation runs read, validate, mutate and write under the ticket's
// entry in the TicketLockTable. Two callers racing on the same ticket are
// serialized: the loser re-reads the winner's state and is rejected if its
// trigger is no longer legal. Different tickets never contend.
//
// The write goes through AuditLog::append(), a single repository commit. A
// StorageFailure therefore leaves the stored ticket and the audit log exactly
// as they were.
//
// After a successful commit a TicketUpdateEvent is handed to the event sink
// (bound to the notification loop by KitchenEngine). The sink only enqueues,
// so subscribers never run on the caller's thread or under the ticket lock.
//
// Thread-safety: every public method may be called from any thread.
// -----------------------------------------------------------------------------
class TicketStateMachine {
 public:
  // Evaluated under the ticket lock against the freshly read ticket.
  using TransitionGuard = std::function<bool(const domain::Ticket&)>;

  TicketStateMachine(ITicketRepository& repository, AuditLog& audit,
                     TicketLockTable& locks, const ITimeProvider& time,
                     EventSink sink = {});

  TicketStateMachine(const TicketStateMachine&) = delete;
  TicketStateMachine& operator=(const TicketStateMachine&) = delete;

  // -------------------------------------------------------------------------
  // create(ticket, actor)
  // -------------------------------------------------------------------------
  //
  // @brief  Registers a new ticket in Received with its `received` entry.
  //
  // @param  ticket  Id, hub, order/line refs, station, item and priority
  //                 filled in by the caller. State and timestamps are reset.
  //
  // @throws StorageFailure  if the commit fails (no ticket is stored).
  // @throws std::invalid_argument  if ticket.id is 0.
  // -------------------------------------------------------------------------
  domain::Ticket create(domain::Ticket ticket, const std::string& actor,
                        bool auto_accept = false);

  // -------------------------------------------------------------------------
  // apply(ticket_id, trigger, actor)
  // -------------------------------------------------------------------------
  //
  // @return The ticket after the transition.
  //
  // @throws NotFoundError           unknown id.
  // @throws IllegalTransitionError  trigger not legal in the current state.
  // @throws StorageFailure          commit failed, nothing applied.
  // -------------------------------------------------------------------------
  domain::Ticket apply(domain::TicketId id, domain::Trigger trigger,
                       const std::string& actor);

  // -------------------------------------------------------------------------
  // applyIf(ticket_id, trigger, actor, guard)
  // -------------------------------------------------------------------------
  //
  // @brief  Like apply(), but only when `guard` accepts the current ticket.
  //
  // @return std::nullopt when the guard declines or the trigger is no longer
  //         legal. Nothing is written in that case. Used by the
  //         AutoBumpScheduler, whose candidate list can go stale between the
  //         scan and the lock.
  //
  // @throws NotFoundError, StorageFailure as apply().
  // -------------------------------------------------------------------------
  std::optional<domain::Ticket> applyIf(domain::TicketId id,
                                        domain::Trigger trigger,
                                        const std::string& actor,
                                        const TransitionGuard& guard);

  // Same state, audit action `priority_changed`. Non-terminal tickets only.
  // Does not touch last_transition_at. Setting the current priority again
  // is still recorded ("priority 3 -> 3").
  domain::Ticket changePriority(domain::TicketId id, int priority,
                                const std::string& actor);

  // Applies the next forward trigger for the ticket's current state
  // (accept, start, bump, complete or serve).
  domain::Ticket advance(domain::TicketId id, const std::string& actor);

  // Target of `trigger` from `state`, or nullopt if the pair is illegal.
  static std::optional<domain::TicketState> nextState(
      domain::TicketState state, domain::Trigger trigger);

  // Forward trigger used by advance(), or nullopt for terminal states.
  static std::optional<domain::Trigger> forwardTrigger(
      domain::TicketState state);

 private:
  domain::Ticket load(domain::TicketId id) const;

  // Caller holds the ticket lock. Throws IllegalTransitionError.
  domain::Ticket transitionLocked(const domain::Ticket& current,
                                  domain::Trigger trigger,
                                  const std::string& actor);

  domain::Ticket commit(const domain::Ticket& updated,
                        domain::TicketState previous_state,
                        domain::AuditAction action, const std::string& actor,
                        std::string notes);

  ITicketRepository& repository_;
  AuditLog& audit_;
  TicketLockTable& locks_;
  const ITimeProvider& time_;
  EventSink sink_;
};

}  // namespace kds
