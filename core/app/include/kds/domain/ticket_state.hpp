#pragma once

#include <string>

namespace kds {
namespace domain {

// -----------------------------------------------------------------------------
// TicketState: ticket lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a kitchen ticket can occupy between intake
//         and hand-off.
//
// @details
// The forward path is strictly linear. The TicketStateMachine enforces the
// legal transition graph:
//
//   Received ──accept──> Accepted ──start──> InProgress ──bump──> Bumped
//      │                    │                    │                  │
//      │                    │                    │               complete
//      │                    │                    │                  ▼
//      └──────── cancel ────┴────────────────────┴──> Cancelled  Completed
//                                                                   │
//                                                                 serve
//                                                                   ▼
//                                                                 Served
//
//   recall walks one step backwards from Accepted, InProgress, Bumped or
//   Completed (e.g. Bumped → InProgress) and re-enters the active flow.
//
// Terminal states: Served, Cancelled, Recalled.
// Recalled is only ever written by external tooling that writes a ticket off
// after a recall; no trigger of the state machine enters it. A ticket found
// in that state accepts no further triggers.
//
// Thread model:
//   Plain enum, safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class TicketState {
  Received,    // Created by the StationRouter, waiting for the station
  Accepted,    // Acknowledged by the station
  InProgress,  // Being prepared
  Bumped,      // Marked ready, sits in the Ready Queue
  Completed,   // Picked up from the pass
  Served,      // Delivered to the guest; terminal
  Recalled,    // Written off after a recall; terminal
  Cancelled,   // Cancelled; terminal
};

// -----------------------------------------------------------------------------
// Trigger: actions an actor can request against a ticket
// -----------------------------------------------------------------------------
enum class Trigger {
  Accept,
  Start,
  Bump,
  Complete,
  Serve,
  Cancel,
  Recall,
};

// -----------------------------------------------------------------------------
// AuditAction: action category recorded by every AuditEntry
// -----------------------------------------------------------------------------
// One value per trigger plus Received (ticket creation) and PriorityChanged
// (priority edits, which keep the state unchanged).
// -----------------------------------------------------------------------------
enum class AuditAction {
  Received,
  Accepted,
  Started,
  Bumped,
  Completed,
  Served,
  Recalled,
  Cancelled,
  PriorityChanged,
};

// -----------------------------------------------------------------------------
// Urgency: escalation level computed by the EscalationEngine
// -----------------------------------------------------------------------------
enum class Urgency {
  Normal,
  Warning,
  Critical,
};

// Returns true for Served, Recalled and Cancelled.
bool isTerminal(TicketState state);

// Returns true for Received, Accepted and InProgress, the states shown on
// the station display (Bumped tickets live in the Ready Queue instead).
bool isActive(TicketState state);

// Audit action written when `trigger` succeeds.
AuditAction actionFor(Trigger trigger);

// -----------------------------------------------------------------------------
// String conversion
// -----------------------------------------------------------------------------
// Lower-case wire names ("in_progress", "priority_changed", ...) used by the
// JSON command surface and telemetry. The *FromString parsers return false
// when the name is unknown and leave `out` untouched.
// -----------------------------------------------------------------------------
const char* toString(TicketState state);
const char* toString(Trigger trigger);
const char* toString(AuditAction action);
const char* toString(Urgency urgency);

bool triggerFromString(const std::string& name, Trigger& out);
bool actionFromString(const std::string& name, AuditAction& out);

}  // namespace domain
}  // namespace kds
