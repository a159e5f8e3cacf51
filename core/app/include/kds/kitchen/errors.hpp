#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"

#include <stdexcept>
#include <string>

namespace kds {

// -----------------------------------------------------------------------------
// KitchenError: root of the kitchen core's exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Every failure the core reports to a caller derives from this type,
//         so the command surface can catch one base and map `kind()` to an
//         error code.
//
// @details
//   RoutingError           one order line could not be routed (unknown or
//                          inactive station). Collected per line by the
//                          StationRouter, never aborts a whole order.
//   IllegalTransitionError the trigger is not valid in the ticket's current
//                          state. Nothing was written.
//   NotFoundError          unknown ticket id.
//   StorageFailure         the repository could not write the ticket and its
//                          audit entry. Nothing was written; safe to retry.
// -----------------------------------------------------------------------------
class KitchenError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  // Short machine-readable error kind ("routing_error", ...).
  virtual const char* kind() const noexcept = 0;
};

class RoutingError : public KitchenError {
 public:
  RoutingError(std::string line_id, domain::StationId station_id,
               const std::string& reason);

  const char* kind() const noexcept override { return "routing_error"; }

  const std::string& lineId() const { return line_id_; }
  const domain::StationId& stationId() const { return station_id_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string line_id_;
  domain::StationId station_id_;
  std::string reason_;
};

class IllegalTransitionError : public KitchenError {
 public:
  IllegalTransitionError(domain::TicketId ticket_id, domain::TicketState state,
                         const std::string& requested);

  const char* kind() const noexcept override { return "illegal_transition"; }

  domain::TicketId ticketId() const { return ticket_id_; }
  domain::TicketState state() const { return state_; }

 private:
  domain::TicketId ticket_id_;
  domain::TicketState state_;
};

class NotFoundError : public KitchenError {
 public:
  explicit NotFoundError(domain::TicketId ticket_id);

  const char* kind() const noexcept override { return "not_found"; }

  domain::TicketId ticketId() const { return ticket_id_; }

 private:
  domain::TicketId ticket_id_;
};

class StorageFailure : public KitchenError {
 public:
  using KitchenError::KitchenError;

  const char* kind() const noexcept override { return "storage_failure"; }
};

}  // namespace kds
