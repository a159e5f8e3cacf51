#pragma once

#include "kds/audit/audit_filter.hpp"
#include "kds/audit/audit_log.hpp"
#include "kds/concurrent/notification_loop.hpp"
#include "kds/concurrent/ticket_id_generator.hpp"
#include "kds/concurrent/ticket_lock_table.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/domain/kitchen_settings.hpp"
#include "kds/domain/order.hpp"
#include "kds/domain/ticket.hpp"
#include "kds/kitchen/auto_bump_scheduler.hpp"
#include "kds/kitchen/ready_queue.hpp"
#include "kds/kitchen/station_router.hpp"
#include "kds/kitchen/ticket_state_machine.hpp"
#include "kds/network/ipc_server.hpp"
#include "kds/settings/i_settings_provider.hpp"
#include "kds/stations/i_station_directory.hpp"
#include "kds/storage/i_ticket_repository.hpp"
#include "kds/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kds {

// A ticket as a display renders it.
struct TicketView {
  domain::Ticket ticket;
  std::int64_t elapsed_ms{0};
  domain::Urgency urgency{domain::Urgency::Normal};
  std::string elapsed_display;  // "7m", "1:05"
};

struct TicketCounts {
  std::size_t received{0};
  std::size_t accepted{0};
  std::size_t in_progress{0};
  std::size_t ready{0};
  std::size_t total_active{0};  // received + accepted + in_progress
};

// -----------------------------------------------------------------------------
// KitchenEngine: top-level orchestrator of the kitchen core
// -----------------------------------------------------------------------------
//
// @brief  Owns every kitchen component and the threads they run on, and
//         exposes the display-facing API.
//
// @details
// Collaborators (storage, settings, stations, clock) are injected by
// reference and must outlive the engine.
//
// Threads, all started by start() and joined by stop():
//
//   notify_loop_     NotificationLoop. Every TicketUpdateEvent,
//                    EscalationEvent and OrderRoutedEvent is pushed here by
//                    the component that produced it; subscribers of
//                    eventBus() run on this thread only.
//   scheduler_       AutoBumpScheduler thread (per-hub ticks).
//   ipc_server_      Optional. Created only when both endpoints are
//                    non-empty. Commands call executeCommand() on the IPC
//                    thread; telemetry is bridged from notify_loop_.
//
// The synchronous API (intakeOrder, transition, list*) is usable before
// start(): events produced meanwhile wait in the loop's queue.
//
// Shutdown order: the scheduler (it writes transitions), then the
// notification loop, which drains what is left into its subscribers
// including the IPC telemetry bridge, then IPC. Commands arriving over IPC
// during shutdown still work; their events wait in the loop's queue.
// -----------------------------------------------------------------------------
class KitchenEngine {
 public:
  static constexpr std::size_t kDefaultHistoryLimit = 50;

  KitchenEngine(ITicketRepository& repository,
                const ISettingsProvider& settings,
                const IStationDirectory& stations, const ITimeProvider& time,
                std::string ipc_cmd_endpoint = "",
                std::string ipc_pub_endpoint = "");

  ~KitchenEngine();

  KitchenEngine(const KitchenEngine&) = delete;
  KitchenEngine& operator=(const KitchenEngine&) = delete;
  KitchenEngine(KitchenEngine&&) = delete;
  KitchenEngine& operator=(KitchenEngine&&) = delete;

  void start();
  void stop();

  // --- Order intake ----------------------------------------------------------
  RoutingResult intakeOrder(const domain::Order& order);

  // --- Display reads ---------------------------------------------------------

  // Received, Accepted and InProgress tickets, highest priority first, then
  // oldest first.
  std::vector<TicketView> listActive(
      const domain::HubId& hub,
      const std::optional<domain::StationId>& station = std::nullopt) const;

  std::vector<domain::Ticket> listReady(const domain::HubId& hub) const;

  // filter.hub_id is replaced by `hub`. A zero limit means
  // kDefaultHistoryLimit.
  std::vector<domain::AuditEntry> listHistory(const domain::HubId& hub,
                                              AuditFilter filter = {}) const;

  TicketCounts counts(const domain::HubId& hub) const;

  domain::KitchenSettings settings(const domain::HubId& hub) const;

  // --- Ticket actions --------------------------------------------------------
  domain::Ticket transition(domain::TicketId id, domain::Trigger trigger,
                            const std::string& actor);
  domain::Ticket changePriority(domain::TicketId id, int priority,
                                const std::string& actor);
  domain::Ticket advance(domain::TicketId id, const std::string& actor);

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  JSON command surface used by the IPC server.
  //
  // @details
  // The request is a JSON object with a "cmd" field:
  //   ping | intake | list_active | list_ready | history | counts |
  //   settings | transition | advance | change_priority
  // The bare string "PING" is accepted too. Replies carry
  // {"status":"ok", ...} or {"status":"error","error":<kind>,"message":...}
  // where kind is a KitchenError::kind(), "bad_request" or
  // "unknown_command". Never throws for bad input.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // Subscribers run on the notification loop thread.
  EventBus& eventBus() { return notify_loop_.eventBus(); }

  AutoBumpScheduler& scheduler() { return scheduler_; }

  const AuditLog& auditLog() const { return audit_log_; }

 private:
  TicketView makeView(const domain::Ticket& ticket,
                      const domain::KitchenSettings& settings,
                      domain::TimeMs now) const;

  ITicketRepository& repository_;
  const ISettingsProvider& settings_;
  const IStationDirectory& stations_;
  const ITimeProvider& time_;

  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  NotificationLoop notify_loop_;

  TicketIdGenerator ids_;
  TicketLockTable locks_;
  AuditLog audit_log_;
  TicketStateMachine state_machine_;
  StationRouter router_;
  ReadyQueue ready_queue_;
  AutoBumpScheduler scheduler_;

  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_sub_id_{0};

  bool running_{false};
};

}  // namespace kds
