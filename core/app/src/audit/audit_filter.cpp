#include "kds/audit/audit_filter.hpp"

namespace kds {

bool AuditFilter::matches(const domain::AuditEntry& entry) const {
  if (entry.hub_id != hub_id) {
    return false;
  }
  if (ticket_id && entry.ticket_id != *ticket_id) {
    return false;
  }
  if (order_id && entry.order_id != *order_id) {
    return false;
  }
  if (station_id && entry.station_id != *station_id) {
    return false;
  }
  if (actor && entry.actor != *actor) {
    return false;
  }
  if (action && entry.action != *action) {
    return false;
  }
  if (from_ms && entry.timestamp < *from_ms) {
    return false;
  }
  if (to_ms && entry.timestamp > *to_ms) {
    return false;
  }
  return true;
}

}  // namespace kds
