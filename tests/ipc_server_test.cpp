// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Telemetry bodies and topics of kds::IpcServer. Socket I/O is not exercised
// here.
// =============================================================================

#include "kds/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

TEST(IpcServerTelemetryTest, TicketUpdate) {
  kds::TicketUpdateEvent e;
  e.ticket.id = 12;
  e.ticket.hub_id = "h1";
  e.ticket.state = kds::domain::TicketState::Bumped;
  e.ticket.bumped_at = 900;
  e.previous_state = kds::domain::TicketState::InProgress;
  e.action = kds::domain::AuditAction::Bumped;
  e.actor = "system";
  e.audit_sequence = 33;

  auto text = kds::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);

  EXPECT_EQ(j["type"], "ticket_update");
  EXPECT_EQ(j["ticket"]["id"], 12);
  EXPECT_EQ(j["ticket"]["state"], "bumped");
  EXPECT_EQ(j["ticket"]["bumped_at"], 900);
  EXPECT_TRUE(j["ticket"]["served_at"].is_null());
  EXPECT_EQ(j["previous_state"], "in_progress");
  EXPECT_EQ(j["action"], "bumped");
  EXPECT_EQ(j["audit_sequence"], 33);
}

TEST(IpcServerTelemetryTest, EscalationAndOrderRouted) {
  kds::EscalationEvent esc;
  esc.ticket_id = 4;
  esc.urgency = kds::domain::Urgency::Critical;
  esc.previous_urgency = kds::domain::Urgency::Warning;
  esc.play_sound = true;

  auto j = nlohmann::json::parse(*kds::IpcServer::formatTelemetry(esc));
  EXPECT_EQ(j["type"], "escalation");
  EXPECT_EQ(j["urgency"], "critical");
  EXPECT_EQ(j["previous_urgency"], "warning");
  EXPECT_EQ(j["play_sound"], true);

  kds::OrderRoutedEvent routed;
  routed.order_id = "o-1";
  routed.ticket_ids = {1, 2};
  routed.failed_lines = {"l-3"};

  j = nlohmann::json::parse(*kds::IpcServer::formatTelemetry(routed));
  EXPECT_EQ(j["type"], "order_routed");
  EXPECT_EQ(j["ticket_ids"].size(), 2u);
  EXPECT_EQ(j["failed_lines"][0], "l-3");
}

TEST(IpcServerTelemetryTest, StopWithoutStartIsSafe) {
  kds::IpcServer server([](const std::string&) { return std::string("{}"); });
  EXPECT_NO_FATAL_FAILURE(server.stop());
}

TEST(IpcServerTelemetryTest, TopicIsHubThenType) {
  kds::TicketUpdateEvent update;
  update.ticket.hub_id = "h1";
  kds::EscalationEvent esc;
  esc.hub_id = "h2";
  kds::OrderRoutedEvent routed;
  routed.hub_id = "h1";

  EXPECT_EQ(kds::IpcServer::telemetryTopic(update), "h1/ticket_update");
  EXPECT_EQ(kds::IpcServer::telemetryTopic(esc), "h2/escalation");
  EXPECT_EQ(kds::IpcServer::telemetryTopic(routed), "h1/order_routed");
}
