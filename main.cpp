// -----------------------------------------------------------------------------
// kds_engine: kitchen display core, single executable entry point.
//
//   1) Load the JSON config (hubs, stations, IPC endpoints) named on the
//      command line. Without an argument the engine runs with default
//      settings and no stations.
//   2) Fill the in-memory settings provider and station directory, create
//      the in-memory ticket repository and the wall clock.
//   3) Create the KitchenEngine, subscribe logging callbacks on its
//      notification bus and start it.
//   4) Idle on the main thread until SIGINT/SIGTERM, then shut down.
//
// Thread layout:
//   main thread      → waits for a signal
//   notify thread    → event subscribers (logging below, IPC telemetry)
//   scheduler thread → auto-bump and escalation ticks
//   ipc thread       → ZeroMQ command/telemetry sockets
// -----------------------------------------------------------------------------

#include "kds/domain/ticket_state.hpp"
#include "kds/engine/kitchen_engine.hpp"
#include "kds/events/escalation_event.hpp"
#include "kds/events/order_routed_event.hpp"
#include "kds/events/ticket_update_event.hpp"
#include "kds/settings/in_memory_settings_provider.hpp"
#include "kds/settings/settings_json.hpp"
#include "kds/stations/in_memory_station_directory.hpp"
#include "kds/storage/in_memory_ticket_repository.hpp"
#include "kds/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

// Set from the signal handler, polled by main().
volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int /*signum*/) { g_stop_requested = 1; }

}  // namespace

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  kds::EngineConfig config;
  if (argc > 1) {
    try {
      config = kds::loadEngineConfig(argv[1]);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[main] invalid config " << argv[1] << ": " << e.what()
                << "\n";
      return 1;
    } catch (const std::runtime_error& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators
  // -------------------------------------------------------------------------
  kds::InMemorySettingsProvider settings;
  for (const auto& hub : config.hubs) {
    settings.put(hub);
  }

  kds::InMemoryStationDirectory stations;
  for (const auto& station : config.stations) {
    stations.put(station);
  }

  kds::InMemoryTicketRepository repository;
  kds::LiveTimeProvider clock;

  std::cout << "[main] loaded " << config.hubs.size() << " hub(s), "
            << config.stations.size() << " station(s).\n";

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  kds::KitchenEngine engine(repository, settings, stations, clock,
                            config.ipc_enabled ? config.cmd_endpoint : "",
                            config.ipc_enabled ? config.pub_endpoint : "");

  // These callbacks run on the notification thread.
  engine.eventBus().subscribe<kds::TicketUpdateEvent>(
      [](const kds::TicketUpdateEvent& e) {
        std::cout << "[TicketUpdate] ticket_id=" << e.ticket.id
                  << " hub=" << e.ticket.hub_id
                  << " station=" << e.ticket.station_id << " "
                  << kds::domain::toString(e.previous_state) << " -> "
                  << kds::domain::toString(e.ticket.state)
                  << " by=" << e.actor << "\n";
      });

  engine.eventBus().subscribe<kds::EscalationEvent>(
      [](const kds::EscalationEvent& e) {
        std::cout << "[Escalation] ticket_id=" << e.ticket_id
                  << " hub=" << e.hub_id << " "
                  << kds::domain::toString(e.previous_urgency) << " -> "
                  << kds::domain::toString(e.urgency)
                  << " elapsed_ms=" << e.elapsed_ms
                  << (e.play_sound ? " [sound]" : "") << "\n";
      });

  engine.eventBus().subscribe<kds::OrderRoutedEvent>(
      [](const kds::OrderRoutedEvent& e) {
        std::cout << "[OrderRouted] order=" << e.order_id << " hub="
                  << e.hub_id << " tickets=" << e.ticket_ids.size()
                  << " failed=" << e.failed_lines.size()
                  << (e.play_sound ? " [sound]" : "") << "\n";
      });

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start engine: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for shutdown
  // -------------------------------------------------------------------------
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::cout << "[main] Press Ctrl-C to shut down.\n";
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Signal received. Stopping engine...\n";
  engine.stop();

  return 0;
}
