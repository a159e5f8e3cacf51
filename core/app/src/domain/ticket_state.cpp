#include "kds/domain/ticket_state.hpp"

namespace kds {
namespace domain {

// -----------------------------------------------------------------------------
// isTerminal / isActive
// -----------------------------------------------------------------------------
bool isTerminal(TicketState state) {
  using S = TicketState;
  return state == S::Served ||
         state == S::Recalled ||
         state == S::Cancelled;
}

bool isActive(TicketState state) {
  using S = TicketState;
  return state == S::Received ||
         state == S::Accepted ||
         state == S::InProgress;
}

// -----------------------------------------------------------------------------
// actionFor: trigger → audit action category
// -----------------------------------------------------------------------------
AuditAction actionFor(Trigger trigger) {
  switch (trigger) {
    case Trigger::Accept:   return AuditAction::Accepted;
    case Trigger::Start:    return AuditAction::Started;
    case Trigger::Bump:     return AuditAction::Bumped;
    case Trigger::Complete: return AuditAction::Completed;
    case Trigger::Serve:    return AuditAction::Served;
    case Trigger::Cancel:   return AuditAction::Cancelled;
    case Trigger::Recall:   return AuditAction::Recalled;
  }
  return AuditAction::Received;
}

// -----------------------------------------------------------------------------
// toString overloads
// -----------------------------------------------------------------------------
const char* toString(TicketState state) {
  using S = TicketState;
  switch (state) {
    case S::Received:   return "received";
    case S::Accepted:   return "accepted";
    case S::InProgress: return "in_progress";
    case S::Bumped:     return "bumped";
    case S::Completed:  return "completed";
    case S::Served:     return "served";
    case S::Recalled:   return "recalled";
    case S::Cancelled:  return "cancelled";
  }
  return "unknown";
}

const char* toString(Trigger trigger) {
  switch (trigger) {
    case Trigger::Accept:   return "accept";
    case Trigger::Start:    return "start";
    case Trigger::Bump:     return "bump";
    case Trigger::Complete: return "complete";
    case Trigger::Serve:    return "serve";
    case Trigger::Cancel:   return "cancel";
    case Trigger::Recall:   return "recall";
  }
  return "unknown";
}

const char* toString(AuditAction action) {
  using A = AuditAction;
  switch (action) {
    case A::Received:        return "received";
    case A::Accepted:        return "accepted";
    case A::Started:         return "started";
    case A::Bumped:          return "bumped";
    case A::Completed:       return "completed";
    case A::Served:          return "served";
    case A::Recalled:        return "recalled";
    case A::Cancelled:       return "cancelled";
    case A::PriorityChanged: return "priority_changed";
  }
  return "unknown";
}

const char* toString(Urgency urgency) {
  switch (urgency) {
    case Urgency::Normal:   return "normal";
    case Urgency::Warning:  return "warning";
    case Urgency::Critical: return "critical";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Parsers: linear scan over the enum range. The sets are tiny.
// -----------------------------------------------------------------------------
bool triggerFromString(const std::string& name, Trigger& out) {
  for (Trigger t : {Trigger::Accept, Trigger::Start, Trigger::Bump,
                    Trigger::Complete, Trigger::Serve, Trigger::Cancel,
                    Trigger::Recall}) {
    if (name == toString(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

bool actionFromString(const std::string& name, AuditAction& out) {
  using A = AuditAction;
  for (A a : {A::Received, A::Accepted, A::Started, A::Bumped, A::Completed,
              A::Served, A::Recalled, A::Cancelled, A::PriorityChanged}) {
    if (name == toString(a)) {
      out = a;
      return true;
    }
  }
  return false;
}

}  // namespace domain
}  // namespace kds
