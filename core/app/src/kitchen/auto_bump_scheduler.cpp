#include "kds/kitchen/auto_bump_scheduler.hpp"
#include "kds/domain/audit_entry.hpp"
#include "kds/kitchen/errors.hpp"
#include "kds/kitchen/escalation_engine.hpp"
#include "kds/time/time_utils.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace kds {

AutoBumpScheduler::AutoBumpScheduler(const ITicketRepository& repository,
                                     TicketStateMachine& state_machine,
                                     const ISettingsProvider& settings,
                                     const ITimeProvider& time, EventSink sink)
    : repository_(repository),
      state_machine_(state_machine),
      settings_(settings),
      time_(time),
      sink_(std::move(sink)) {}

AutoBumpScheduler::~AutoBumpScheduler() { stop(); }

void AutoBumpScheduler::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[AutoBumpScheduler] started.\n";
}

void AutoBumpScheduler::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wait_cv_.notify_all();
  thread_.join();
  std::cout << "[AutoBumpScheduler] stopped.\n";
}

void AutoBumpScheduler::run() {
  while (running_.load()) {
    runDueTicks();

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(kPollIntervalMs),
                      [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// runDueTicks(): per-hub cadence, one hub's failure never blocks another
// -----------------------------------------------------------------------------
std::size_t AutoBumpScheduler::runDueTicks() {
  std::size_t ticked = 0;

  for (const auto& hub : settings_.hubs()) {
    const domain::TimeMs now = time_.now_ms();
    {
      std::lock_guard lock(tick_mutex_);
      auto it = next_due_.find(hub);
      if (it != next_due_.end() && now < it->second) {
        continue;
      }
    }

    std::int64_t interval = kDefaultIntervalMs;
    try {
      domain::KitchenSettings settings = settings_.settings(hub);
      if (settings.auto_bump_interval_ms > 0) {
        interval = settings.auto_bump_interval_ms;
      }
      tick(hub);
      ++ticked;
    } catch (const std::exception& e) {
      std::cerr << "[AutoBumpScheduler] ERROR: tick failed for hub=" << hub
                << ": " << e.what() << "\n";
    }

    std::lock_guard lock(tick_mutex_);
    next_due_[hub] = now + interval;
  }

  return ticked;
}

AutoBumpScheduler::TickResult AutoBumpScheduler::tick(
    const domain::HubId& hub) {
  domain::KitchenSettings settings = settings_.settings(hub);

  TickResult result;
  std::lock_guard lock(tick_mutex_);

  if (settings.auto_bump_enabled) {
    autoBump(settings, result);
  }
  escalate(settings, result);
  return result;
}

// -----------------------------------------------------------------------------
// autoBump(): guarded bump of every aged InProgress ticket
// -----------------------------------------------------------------------------
void AutoBumpScheduler::autoBump(const domain::KitchenSettings& settings,
                                 TickResult& result) {
  const std::int64_t delay_ms = seconds_to_ms(settings.auto_bump_delay_seconds);
  const domain::TimeMs now = time_.now_ms();

  auto aged = [this, delay_ms](const domain::Ticket& t) {
    return t.state == domain::TicketState::InProgress &&
           EscalationEngine::elapsed(t, time_.now_ms()) >= delay_ms;
  };

  for (const auto& candidate : repository_.findByState(
           settings.hub_id, domain::TicketState::InProgress)) {
    if (EscalationEngine::elapsed(candidate, now) < delay_ms) {
      continue;
    }

    try {
      auto bumped = state_machine_.applyIf(
          candidate.id, domain::Trigger::Bump, domain::kSystemActor, aged);
      if (bumped) {
        result.bumped.push_back(bumped->id);
        std::cout << "[AutoBumpScheduler] auto-bumped ticket_id="
                  << bumped->id << " hub=" << settings.hub_id << "\n";
      }
    } catch (const StorageFailure& e) {
      std::cerr << "[AutoBumpScheduler] WARNING: bump of ticket_id="
                << candidate.id << " failed, retrying next tick: " << e.what()
                << "\n";
    } catch (const NotFoundError& e) {
      std::cerr << "[AutoBumpScheduler] WARNING: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// escalate(): report urgency rises for active tickets
// -----------------------------------------------------------------------------
void AutoBumpScheduler::escalate(const domain::KitchenSettings& settings,
                                 TickResult& result) {
  static constexpr domain::TicketState kWatched[] = {
      domain::TicketState::Received, domain::TicketState::Accepted,
      domain::TicketState::InProgress};

  const domain::TimeMs now = time_.now_ms();
  std::unordered_set<domain::TicketId> seen;

  for (domain::TicketState state : kWatched) {
    for (const auto& ticket : repository_.findByState(settings.hub_id, state)) {
      seen.insert(ticket.id);

      domain::Urgency urgency =
          EscalationEngine::classify(ticket, settings, now);

      domain::Urgency previous = domain::Urgency::Normal;
      auto it = reported_.find(ticket.id);
      if (it != reported_.end() && it->second.state == ticket.state) {
        previous = it->second.urgency;
      }

      reported_[ticket.id] = TrackedUrgency{ticket.hub_id, ticket.state,
                                            urgency};

      if (urgency <= previous) {
        continue;
      }

      ++result.escalations;
      if (sink_) {
        EscalationEvent event;
        event.ticket_id = ticket.id;
        event.hub_id = ticket.hub_id;
        event.station_id = ticket.station_id;
        event.state = ticket.state;
        event.previous_urgency = previous;
        event.urgency = urgency;
        event.elapsed_ms = EscalationEngine::elapsed(ticket, now);
        event.play_sound = urgency == domain::Urgency::Critical &&
                           settings.sound_enabled && settings.sound_on_rush;
        event.timestamp = now;
        sink_(std::move(event));
      }
    }
  }

  // Forget tickets of this hub that left the active states.
  for (auto it = reported_.begin(); it != reported_.end();) {
    if (it->second.hub == settings.hub_id && seen.count(it->first) == 0) {
      it = reported_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace kds
