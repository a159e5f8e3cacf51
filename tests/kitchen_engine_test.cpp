// =============================================================================
// kitchen_engine_test.cpp
// =============================================================================
// Tests for kds::KitchenEngine, the display-facing API.
//
// Validates:
//   - Lifecycle: start() / stop() idempotent, destructor joins threads
//   - Order intake through to the Ready Queue and history
//   - listActive ordering, urgency and elapsed display; counts()
//   - Subscribers run on the notification thread, not the caller's
//   - Ticket ids continue after those already in the repository
//   - executeCommand(): replies and error kinds
//   - stop() with telemetry still queued for the IPC bridge
//
// Only StopDrainsTelemetryBeforeClosingIpc configures IPC endpoints, and it
// binds inproc ones, so no TCP ports are opened.
// =============================================================================

#include "kds/domain/audit_entry.hpp"
#include "kds/engine/kitchen_engine.hpp"
#include "kds/kitchen/errors.hpp"
#include "kds/settings/in_memory_settings_provider.hpp"
#include "kds/stations/in_memory_station_directory.hpp"
#include "kds/storage/in_memory_ticket_repository.hpp"
#include "kds/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using kds::domain::TicketState;
using kds::domain::Trigger;
using kds::domain::Urgency;

class KitchenEngineTest : public ::testing::Test {
 protected:
  kds::SimulationTimeProvider clock{0};
  kds::InMemoryTicketRepository repo;
  kds::InMemorySettingsProvider settings;
  kds::InMemoryStationDirectory stations;

  void SetUp() override {
    kds::domain::KitchenSettings h1;
    h1.hub_id = "h1";
    h1.warning_threshold_seconds = 600;
    h1.critical_threshold_seconds = 1200;
    settings.put(h1);

    stations.put({"grill", "h1", "Grill", true});
    stations.put({"fryer", "h1", "Fryer", true});
    stations.put({"cold", "h1", "Cold", false});
  }

  static kds::domain::Order order(const std::string& id, int priority,
                                  std::vector<std::string> station_ids) {
    kds::domain::Order o;
    o.order_id = id;
    o.hub_id = "h1";
    o.order_number = id;
    o.priority = priority;
    int n = 0;
    for (auto& station : station_ids) {
      kds::domain::OrderLine line;
      line.line_id = id + "-" + std::to_string(++n);
      line.item_name = "Item";
      line.station_id = std::move(station);
      o.lines.push_back(std::move(line));
    }
    return o;
  }

  static nlohmann::json run(kds::KitchenEngine& engine,
                            const nlohmann::json& request) {
    return nlohmann::json::parse(engine.executeCommand(request.dump()));
  }
};

// -----------------------------------------------------------------------------
// 1. Lifecycle.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, StartStopIsIdempotent) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  engine.start();
  engine.start();
  EXPECT_TRUE(engine.scheduler().running());
  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.scheduler().running());
}

TEST_F(KitchenEngineTest, DestructorStopsRunningEngine) {
  auto engine =
      std::make_unique<kds::KitchenEngine>(repo, settings, stations, clock);
  engine->start();
  EXPECT_NO_FATAL_FAILURE(engine.reset());
}

// -----------------------------------------------------------------------------
// The loop thread is still delivering to the IPC telemetry bridge when stop()
// is called. Every queued event must be delivered and the server must still
// be alive when it is.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, StopDrainsTelemetryBeforeClosingIpc) {
  constexpr int kRounds = 5;
  constexpr int kOrders = 40;

  for (int round = 0; round < kRounds; ++round) {
    const std::string suffix = std::to_string(round);
    kds::KitchenEngine engine(repo, settings, stations, clock,
                              "inproc://kds-engine-cmd-" + suffix,
                              "inproc://kds-engine-pub-" + suffix);

    std::atomic<int> delivered{0};
    engine.eventBus().subscribe([&delivered](const kds::Event&) {
      std::this_thread::sleep_for(std::chrono::microseconds(200));
      delivered.fetch_add(1);
    });
    engine.start();

    for (int i = 0; i < kOrders; ++i) {
      engine.intakeOrder(
          order("r" + suffix + "-" + std::to_string(i), 0, {"grill", "fryer"}));
    }
    ASSERT_NO_FATAL_FAILURE(engine.stop());

    // One OrderRoutedEvent and two Received updates per order.
    EXPECT_EQ(delivered.load(), kOrders * 3);
  }
}

// -----------------------------------------------------------------------------
// 2. Intake -> cook -> ready -> history, end to end.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, OrderFlowsToReadyQueue) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  engine.start();

  auto routed = engine.intakeOrder(order("o1", 0, {"grill", "cold", "fryer"}));
  ASSERT_EQ(routed.tickets.size(), 2u);
  ASSERT_EQ(routed.failures.size(), 1u);

  const auto grill = routed.tickets[0].id;
  const auto fryer = routed.tickets[1].id;

  clock.advance_by(60'000);
  engine.transition(grill, Trigger::Accept, "cook");
  engine.transition(grill, Trigger::Start, "cook");
  engine.advance(fryer, "cook");
  clock.advance_by(60'000);
  engine.transition(grill, Trigger::Bump, "cook");

  auto ready = engine.listReady("h1");
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].id, grill);

  auto counts = engine.counts("h1");
  EXPECT_EQ(counts.received, 0u);
  EXPECT_EQ(counts.accepted, 1u);
  EXPECT_EQ(counts.in_progress, 0u);
  EXPECT_EQ(counts.ready, 1u);
  EXPECT_EQ(counts.total_active, 1u);

  kds::AuditFilter filter;
  filter.ticket_id = grill;
  auto history = engine.listHistory("h1", filter);
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history.back().action, kds::domain::AuditAction::Bumped);

  EXPECT_THROW(engine.transition(grill, Trigger::Accept, "cook"),
               kds::IllegalTransitionError);
  engine.stop();
}

// -----------------------------------------------------------------------------
// 3. listActive: priority desc, then oldest first; urgency and display.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, ListActiveOrderingAndUrgency) {
  kds::KitchenEngine engine(repo, settings, stations, clock);

  auto a = engine.intakeOrder(order("a", 0, {"grill"})).tickets[0].id;
  clock.advance_by(1'000);
  auto b = engine.intakeOrder(order("b", 5, {"fryer"})).tickets[0].id;
  clock.advance_by(1'000);
  auto c = engine.intakeOrder(order("c", 0, {"grill"})).tickets[0].id;
  auto d = engine.intakeOrder(order("d", 0, {"grill"})).tickets[0].id;
  engine.advance(d, "cook");
  engine.advance(d, "cook");
  engine.advance(d, "cook");  // Bumped: no longer active

  clock.set_time(11 * 60'000);  // a: 11 min in Received -> Warning

  auto views = engine.listActive("h1");
  ASSERT_EQ(views.size(), 3u);
  EXPECT_EQ(views[0].ticket.id, b);
  EXPECT_EQ(views[1].ticket.id, a);
  EXPECT_EQ(views[2].ticket.id, c);

  EXPECT_EQ(views[1].urgency, Urgency::Warning);
  EXPECT_EQ(views[1].elapsed_display, "11m");
  EXPECT_EQ(views[1].elapsed_ms, 11 * 60'000);

  auto grill_only = engine.listActive("h1", std::string("grill"));
  ASSERT_EQ(grill_only.size(), 2u);
  EXPECT_EQ(grill_only[0].ticket.id, a);

  clock.set_time(65 * 60'000);
  auto late = engine.listActive("h1");
  EXPECT_EQ(late[1].urgency, Urgency::Critical);
  EXPECT_EQ(late[1].elapsed_display, "1:05");
}

TEST_F(KitchenEngineTest, HistoryDefaultsToFiftyEntries) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  for (int i = 0; i < 30; ++i) {
    auto id = engine.intakeOrder(order("o" + std::to_string(i), 0, {"grill"}))
                  .tickets[0]
                  .id;
    engine.advance(id, "cook");
  }

  EXPECT_EQ(engine.listHistory("h1").size(), 50u);

  kds::AuditFilter filter;
  filter.limit = 100;
  EXPECT_EQ(engine.listHistory("h1", filter).size(), 60u);
}

TEST_F(KitchenEngineTest, UnknownHubUsesDefaultSettings) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  auto s = engine.settings("elsewhere");
  EXPECT_EQ(s.hub_id, "elsewhere");
  EXPECT_EQ(s.critical_threshold_seconds, 1800);
  EXPECT_EQ(engine.settings("h1").warning_threshold_seconds, 600);
}

// -----------------------------------------------------------------------------
// 4. Subscribers run on the notification thread.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, SubscribersRunOffTheCallerThread) {
  kds::KitchenEngine engine(repo, settings, stations, clock);

  std::promise<std::thread::id> promise;
  auto future = promise.get_future();
  std::atomic<bool> fired{false};
  engine.eventBus().subscribe<kds::TicketUpdateEvent>(
      [&](const kds::TicketUpdateEvent& e) {
        if (e.ticket.state == TicketState::Accepted && !fired.exchange(true)) {
          promise.set_value(std::this_thread::get_id());
        }
      });
  engine.start();

  auto id = engine.intakeOrder(order("o1", 0, {"grill"})).tickets[0].id;
  engine.transition(id, Trigger::Accept, "cook");

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  engine.stop();
}

TEST_F(KitchenEngineTest, TicketIdsContinueAfterExistingOnes) {
  kds::domain::Ticket old;
  old.id = 41;
  old.hub_id = "h1";
  old.station_id = "grill";
  old.state = TicketState::Served;
  kds::domain::AuditEntry entry;
  entry.hub_id = "h1";
  repo.commit(old, entry);

  kds::KitchenEngine engine(repo, settings, stations, clock);
  EXPECT_EQ(engine.intakeOrder(order("o1", 0, {"grill"})).tickets[0].id, 42u);
}

// -----------------------------------------------------------------------------
// 5. JSON command surface.
// -----------------------------------------------------------------------------
TEST_F(KitchenEngineTest, CommandPing) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  auto reply = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["response"], "PONG");

  reply = run(engine, {{"cmd", "ping"}});
  EXPECT_EQ(reply["response"], "PONG");
}

TEST_F(KitchenEngineTest, CommandIntakeAndTransition) {
  kds::KitchenEngine engine(repo, settings, stations, clock);

  nlohmann::json intake = {
      {"cmd", "intake"},
      {"order",
       {{"order_id", "o-9"},
        {"hub_id", "h1"},
        {"order_number", "009"},
        {"priority", 2},
        {"lines",
         {{{"line_id", "l1"}, {"item_name", "Fries"}, {"station_id", "fryer"}},
          {{"line_id", "l2"}, {"item_name", "Salad"}, {"station_id", "cold"}}}}}}};

  auto reply = run(engine, intake);
  ASSERT_EQ(reply["status"], "ok");
  ASSERT_EQ(reply["tickets"].size(), 1u);
  ASSERT_EQ(reply["failures"].size(), 1u);
  EXPECT_EQ(reply["failures"][0]["line_id"], "l2");
  EXPECT_EQ(reply["failures"][0]["error"], "routing_error");

  const auto id = reply["tickets"][0]["id"].get<kds::domain::TicketId>();
  EXPECT_EQ(reply["tickets"][0]["state"], "received");
  EXPECT_EQ(reply["tickets"][0]["priority"], 2);

  reply = run(engine, {{"cmd", "transition"},
                       {"ticket_id", id},
                       {"trigger", "accept"},
                       {"actor", "cook"}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["ticket"]["state"], "accepted");

  reply = run(engine, {{"cmd", "advance"}, {"ticket_id", id}, {"actor", "cook"}});
  EXPECT_EQ(reply["ticket"]["state"], "in_progress");

  reply = run(engine, {{"cmd", "change_priority"},
                       {"ticket_id", id},
                       {"priority", 7},
                       {"actor", "manager"}});
  EXPECT_EQ(reply["ticket"]["priority"], 7);

  reply = run(engine, {{"cmd", "list_active"}, {"hub_id", "h1"}});
  ASSERT_EQ(reply["tickets"].size(), 1u);
  EXPECT_EQ(reply["tickets"][0]["urgency"], "normal");
  EXPECT_EQ(reply["tickets"][0]["elapsed_display"], "0m");

  reply = run(engine, {{"cmd", "counts"}, {"hub_id", "h1"}});
  EXPECT_EQ(reply["counts"]["in_progress"], 1);
  EXPECT_EQ(reply["counts"]["total_active"], 1);

  reply = run(engine, {{"cmd", "history"},
                       {"hub_id", "h1"},
                       {"ticket_id", id},
                       {"action", "priority_changed"}});
  ASSERT_EQ(reply["entries"].size(), 1u);
  EXPECT_EQ(reply["entries"][0]["notes"], "priority 2 -> 7");

  reply = run(engine, {{"cmd", "settings"}, {"hub_id", "h1"}});
  EXPECT_EQ(reply["settings"]["warning_threshold_seconds"], 600);
}

TEST_F(KitchenEngineTest, CommandErrorsCarryKind) {
  kds::KitchenEngine engine(repo, settings, stations, clock);
  auto id = engine.intakeOrder(order("o1", 0, {"grill"})).tickets[0].id;

  auto reply = run(engine, {{"cmd", "transition"},
                            {"ticket_id", id},
                            {"trigger", "serve"},
                            {"actor", "cook"}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["error"], "illegal_transition");

  reply = run(engine, {{"cmd", "advance"}, {"ticket_id", 999}, {"actor", "x"}});
  EXPECT_EQ(reply["error"], "not_found");

  reply = run(engine, {{"cmd", "transition"},
                       {"ticket_id", id},
                       {"trigger", "explode"},
                       {"actor", "cook"}});
  EXPECT_EQ(reply["error"], "bad_request");

  reply = run(engine, {{"cmd", "transition"}, {"ticket_id", id}});
  EXPECT_EQ(reply["error"], "bad_request");

  reply = run(engine, {{"cmd", "reboot"}});
  EXPECT_EQ(reply["error"], "unknown_command");

  reply = nlohmann::json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["error"], "bad_request");
}
