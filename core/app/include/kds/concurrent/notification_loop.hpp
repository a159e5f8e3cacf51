#pragma once

#include "kds/concurrent/thread_safe_queue.hpp"
#include "kds/eventbus/event_bus.hpp"
#include "kds/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

namespace kds {

// -----------------------------------------------------------------------------
// NotificationLoop
// -----------------------------------------------------------------------------
// Responsibility: The thread that tells displays what happened. The state
// machine, router and scheduler push events from whichever thread did the
// work; this loop publishes them on its EventBus in push order. A ticket
// transition never waits for a slow display.
//
// Events pushed while the loop is stopped stay queued and are published
// after the next start(). stop() publishes everything pushed before it was
// called, then joins.
// -----------------------------------------------------------------------------
class NotificationLoop {
 public:
  NotificationLoop() = default;
  ~NotificationLoop();

  NotificationLoop(const NotificationLoop&) = delete;
  NotificationLoop& operator=(const NotificationLoop&) = delete;

  void start();
  void stop();

  // Safe from any thread.
  void push(Event event) { pending_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }

  bool running() const { return thread_.joinable(); }

  // Events published since construction.
  std::uint64_t published() const { return published_.load(); }

  std::size_t backlog() const { return pending_.size(); }

 private:
  void run();

  ThreadSafeQueue<Event> pending_;
  EventBus bus_;
  std::atomic<std::uint64_t> published_{0};
  std::thread thread_;
};

}  // namespace kds
