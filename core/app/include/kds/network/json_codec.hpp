#pragma once

#include "kds/domain/audit_entry.hpp"
#include "kds/domain/order.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/events/event.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>

namespace kds {

// -----------------------------------------------------------------------------
// json_codec: wire format shared by the command surface and telemetry
// -----------------------------------------------------------------------------
// Enum values go out as their lower-case names ("in_progress",
// "priority_changed"). Unset timestamps are written as null.
// orderFromJson() throws nlohmann::json::exception on missing or mistyped
// fields.
// -----------------------------------------------------------------------------

nlohmann::json ticketToJson(const domain::Ticket& ticket);
nlohmann::json auditEntryToJson(const domain::AuditEntry& entry);

domain::Order orderFromJson(const nlohmann::json& j);

// Telemetry payload with a "type" field, or nullopt for events that are not
// published.
std::optional<nlohmann::json> eventToJson(const Event& event);

}  // namespace kds
