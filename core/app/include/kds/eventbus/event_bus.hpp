#pragma once

#include "kds/domain/ticket.hpp"
#include "kds/events/event.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace kds {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Fan-out of kitchen events to display adapters. A
// subscription may be scoped to one hub (a station screen only cares about
// its own kitchen) and to one event kind.
//
// Delivery: callbacks run synchronously on the publishing thread, outside the
// bus lock, so a callback may subscribe, unsubscribe or publish. A callback
// that throws std::exception is logged and counted; the remaining
// subscribers still receive the event.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using Callback = std::function<void(const Event&)>;
  using SubscriptionId = std::uint64_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Every event, every hub.
  SubscriptionId subscribe(Callback callback);

  // Every event of one hub.
  SubscriptionId subscribeHub(domain::HubId hub_id, Callback callback);

  // Only events holding EventType, optionally limited to one hub.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback,
                           std::optional<domain::HubId> hub_id = std::nullopt);

  // Unknown ids are ignored. A publish() already running may still deliver
  // to the removed callback once.
  void unsubscribe(SubscriptionId id);

  // Returns how many subscriptions matched the event's hub.
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

  // Callbacks that threw since construction.
  std::uint64_t failedDeliveries() const;

 private:
  struct Subscription {
    SubscriptionId id;
    std::optional<domain::HubId> hub_id;
    Callback callback;
  };

  SubscriptionId add(std::optional<domain::HubId> hub_id, Callback callback);

  mutable std::mutex mutex_;
  SubscriptionId next_id_{1};
  std::vector<Subscription> subscriptions_;
  std::uint64_t failed_deliveries_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback,
    std::optional<domain::HubId> hub_id) {
  return add(std::move(hub_id),
             [cb = std::move(callback)](const Event& event) {
               if (const auto* typed = std::get_if<EventType>(&event)) {
                 cb(*typed);
               }
             });
}

}  // namespace kds
