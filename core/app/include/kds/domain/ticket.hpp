#pragma once

#include "kds/domain/ticket_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kds {
namespace domain {

// -----------------------------------------------------------------------------
// TicketId / HubId / StationId
// -----------------------------------------------------------------------------
// TicketId is a plain integer produced by TicketIdGenerator (0 = unset).
// Hubs and stations are identified by the strings the orders collaborator
// uses; the core never interprets them.
// -----------------------------------------------------------------------------
using TicketId = std::uint64_t;
using HubId = std::string;
using StationId = std::string;

// Epoch milliseconds, as returned by ITimeProvider::now_ms().
using TimeMs = std::int64_t;

// -----------------------------------------------------------------------------
// Ticket
// -----------------------------------------------------------------------------
//
// @brief  One order line routed to one preparation station, plus its
//         lifecycle state and per-state timestamps.
//
// @details
// Created in state Received by the StationRouter. From then on only the
// TicketStateMachine mutates the authoritative copy held by the repository;
// every other component works on snapshots.
//
// order_id and line_id are weak back-references into the orders
// collaborator: identity only, no ownership. item_name, quantity and notes
// are display copies taken at routing time.
//
// Timestamps:
//   Each *_at field is stamped when its state is entered. A recall reverts
//   the state but keeps the stamps; re-entering a state after a recall
//   re-stamps it (bumping twice moves bumped_at forward). last_transition_at
//   is the start of the current state and is what the EscalationEngine and
//   AutoBumpScheduler measure elapsed time against.
//
// Thread model:
//   Value type. Snapshots are safe to copy between threads.
// -----------------------------------------------------------------------------
struct Ticket {
  TicketId id{0};
  HubId hub_id;
  std::string order_id;                    // Weak ref into the orders collaborator
  std::string line_id;                     // Weak ref to the order line
  StationId station_id;
  std::string item_name;
  int quantity{1};
  std::string notes;

  TicketState state{TicketState::Received};
  int priority{0};                         // Higher surfaces first

  TimeMs created_at{0};
  std::optional<TimeMs> accepted_at;
  std::optional<TimeMs> started_at;
  std::optional<TimeMs> bumped_at;
  std::optional<TimeMs> completed_at;
  std::optional<TimeMs> served_at;
  std::optional<TimeMs> cancelled_at;
  TimeMs last_transition_at{0};
};

}  // namespace domain
}  // namespace kds
