#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/domain/ticket_state.hpp"
#include "kds/events/event.hpp"
#include "kds/kitchen/ticket_state_machine.hpp"
#include "kds/settings/i_settings_provider.hpp"
#include "kds/storage/i_ticket_repository.hpp"
#include "kds/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// AutoBumpScheduler: background promotion and escalation sweep
// -----------------------------------------------------------------------------
//
// @brief  Periodically bumps InProgress tickets that have waited longer than
//         the hub's auto_bump_delay_seconds, and reports urgency rises.
//
// @details
// Each hub is ticked on its own cadence (KitchenSettings::
// auto_bump_interval_ms), measured on the injected ITimeProvider. Settings
// are re-read on every tick, so turning auto-bump off takes effect on the
// next tick.
//
// A tick for one hub:
//   1. If auto_bump_enabled: every InProgress ticket aged past the delay is
//      bumped by the system actor through TicketStateMachine::applyIf(). The
//      guard re-checks state and age under the ticket lock, so a ticket a
//      cook bumped (or recalled) in the meantime is skipped without error.
//   2. Active tickets are classified by the EscalationEngine. When a
//      ticket's urgency rises above the last level reported for its current
//      state an EscalationEvent is published.
//
// Per-hub isolation: a failure while ticking one hub is logged and does not
// stop other hubs. A StorageFailure on one ticket is logged and the ticket
// is retried on the next tick.
//
// Thread model:
//   start() spawns the scheduler thread, stop() joins it. tick() and
//   runDueTicks() may also be called directly (tests drive them with a
//   SimulationTimeProvider). Ticks are serialized by tick_mutex_; they
//   contend with human transitions only on individual ticket locks.
// -----------------------------------------------------------------------------
class AutoBumpScheduler {
 public:
  struct TickResult {
    std::vector<domain::TicketId> bumped;
    std::size_t escalations{0};
  };

  AutoBumpScheduler(const ITicketRepository& repository,
                    TicketStateMachine& state_machine,
                    const ISettingsProvider& settings,
                    const ITimeProvider& time, EventSink sink = {});

  ~AutoBumpScheduler();

  AutoBumpScheduler(const AutoBumpScheduler&) = delete;
  AutoBumpScheduler& operator=(const AutoBumpScheduler&) = delete;
  AutoBumpScheduler(AutoBumpScheduler&&) = delete;
  AutoBumpScheduler& operator=(AutoBumpScheduler&&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One sweep of `hub`, regardless of its cadence.
  TickResult tick(const domain::HubId& hub);

  // Ticks every configured hub whose next due time has passed. Returns the
  // number of hubs ticked.
  std::size_t runDueTicks();

 private:
  // Wall-clock wait between due checks on the scheduler thread.
  static constexpr int kPollIntervalMs = 100;
  static constexpr std::int64_t kDefaultIntervalMs = 1000;

  struct TrackedUrgency {
    domain::HubId hub;
    domain::TicketState state{domain::TicketState::Received};
    domain::Urgency urgency{domain::Urgency::Normal};
  };

  void run();

  void autoBump(const domain::KitchenSettings& settings, TickResult& result);
  void escalate(const domain::KitchenSettings& settings, TickResult& result);

  const ITicketRepository& repository_;
  TicketStateMachine& state_machine_;
  const ISettingsProvider& settings_;
  const ITimeProvider& time_;
  EventSink sink_;

  std::mutex tick_mutex_;
  std::unordered_map<domain::HubId, domain::TimeMs> next_due_;
  std::unordered_map<domain::TicketId, TrackedUrgency> reported_;

  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread thread_;
};

}  // namespace kds
