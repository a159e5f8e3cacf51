#include "kds/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace kds {

EventBus::SubscriptionId EventBus::subscribe(Callback callback) {
  return add(std::nullopt, std::move(callback));
}

EventBus::SubscriptionId EventBus::subscribeHub(domain::HubId hub_id,
                                                Callback callback) {
  return add(std::move(hub_id), std::move(callback));
}

EventBus::SubscriptionId EventBus::add(std::optional<domain::HubId> hub_id,
                                       Callback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscriptions_.push_back({id, std::move(hub_id), std::move(callback)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const Subscription& s) { return s.id == id; });
  if (it != subscriptions_.end()) {
    subscriptions_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(): pick matching subscriptions under the lock, call them without it
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  const domain::HubId& hub = hubOf(event);

  std::vector<Subscription> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscriptions_) {
      if (!s.hub_id || *s.hub_id == hub) {
        targets.push_back(s);
      }
    }
  }

  for (const auto& s : targets) {
    try {
      s.callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] WARNING: subscriber " << s.id
                << " threw on hub " << hub << ": " << e.what() << "\n";
      std::lock_guard lock(mutex_);
      ++failed_deliveries_;
    }
  }
  return targets.size();
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

std::uint64_t EventBus::failedDeliveries() const {
  std::lock_guard lock(mutex_);
  return failed_deliveries_;
}

}  // namespace kds
