#include "kds/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace kds {

namespace {

nlohmann::json optionalTime(const std::optional<domain::TimeMs>& t) {
  if (!t) {
    return nullptr;
  }
  return *t;
}

nlohmann::json formatTicketUpdate(const TicketUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "ticket_update";
  j["ticket"] = ticketToJson(e.ticket);
  j["previous_state"] = domain::toString(e.previous_state);
  j["action"] = domain::toString(e.action);
  j["actor"] = e.actor;
  j["audit_sequence"] = e.audit_sequence;
  j["timestamp"] = e.timestamp;
  return j;
}

nlohmann::json formatEscalation(const EscalationEvent& e) {
  nlohmann::json j;
  j["type"] = "escalation";
  j["ticket_id"] = e.ticket_id;
  j["hub_id"] = e.hub_id;
  j["station_id"] = e.station_id;
  j["state"] = domain::toString(e.state);
  j["previous_urgency"] = domain::toString(e.previous_urgency);
  j["urgency"] = domain::toString(e.urgency);
  j["elapsed_ms"] = e.elapsed_ms;
  j["play_sound"] = e.play_sound;
  j["timestamp"] = e.timestamp;
  return j;
}

nlohmann::json formatOrderRouted(const OrderRoutedEvent& e) {
  nlohmann::json j;
  j["type"] = "order_routed";
  j["order_id"] = e.order_id;
  j["hub_id"] = e.hub_id;
  j["order_number"] = e.order_number;
  j["ticket_ids"] = e.ticket_ids;
  j["failed_lines"] = e.failed_lines;
  j["play_sound"] = e.play_sound;
  j["timestamp"] = e.timestamp;
  return j;
}

}  // namespace

nlohmann::json ticketToJson(const domain::Ticket& t) {
  nlohmann::json j;
  j["id"] = t.id;
  j["hub_id"] = t.hub_id;
  j["order_id"] = t.order_id;
  j["line_id"] = t.line_id;
  j["station_id"] = t.station_id;
  j["item_name"] = t.item_name;
  j["quantity"] = t.quantity;
  j["notes"] = t.notes;
  j["state"] = domain::toString(t.state);
  j["priority"] = t.priority;
  j["created_at"] = t.created_at;
  j["accepted_at"] = optionalTime(t.accepted_at);
  j["started_at"] = optionalTime(t.started_at);
  j["bumped_at"] = optionalTime(t.bumped_at);
  j["completed_at"] = optionalTime(t.completed_at);
  j["served_at"] = optionalTime(t.served_at);
  j["cancelled_at"] = optionalTime(t.cancelled_at);
  j["last_transition_at"] = t.last_transition_at;
  return j;
}

nlohmann::json auditEntryToJson(const domain::AuditEntry& e) {
  nlohmann::json j;
  j["sequence"] = e.sequence;
  j["ticket_id"] = e.ticket_id;
  j["hub_id"] = e.hub_id;
  j["order_id"] = e.order_id;
  j["line_id"] = e.line_id;
  j["station_id"] = e.station_id;
  j["action"] = domain::toString(e.action);
  j["actor"] = e.actor;
  j["timestamp"] = e.timestamp;
  j["from_state"] = domain::toString(e.from_state);
  j["to_state"] = domain::toString(e.to_state);
  j["notes"] = e.notes;
  return j;
}

domain::Order orderFromJson(const nlohmann::json& j) {
  domain::Order order;
  order.order_id = j.at("order_id").get<std::string>();
  order.hub_id = j.at("hub_id").get<std::string>();
  order.order_number = j.value("order_number", std::string{});
  order.table = j.value("table", std::string{});
  order.priority = j.value("priority", 0);

  for (const auto& l : j.at("lines")) {
    domain::OrderLine line;
    line.line_id = l.at("line_id").get<std::string>();
    line.item_id = l.value("item_id", std::string{});
    line.item_name = l.value("item_name", std::string{});
    line.quantity = l.value("quantity", 1);
    line.notes = l.value("notes", std::string{});
    line.station_id = l.value("station_id", std::string{});
    order.lines.push_back(std::move(line));
  }
  return order;
}

std::optional<nlohmann::json> eventToJson(const Event& event) {
  if (auto* e = std::get_if<TicketUpdateEvent>(&event)) {
    return formatTicketUpdate(*e);
  }
  if (auto* e = std::get_if<EscalationEvent>(&event)) {
    return formatEscalation(*e);
  }
  if (auto* e = std::get_if<OrderRoutedEvent>(&event)) {
    return formatOrderRouted(*e);
  }
  return std::nullopt;
}

}  // namespace kds
