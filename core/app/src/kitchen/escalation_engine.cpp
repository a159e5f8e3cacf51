#include "kds/kitchen/escalation_engine.hpp"
#include "kds/time/time_utils.hpp"

#include <algorithm>

namespace kds {

std::int64_t EscalationEngine::elapsed(const domain::Ticket& ticket,
                                       domain::TimeMs now) {
  return std::max<std::int64_t>(0, now - ticket.last_transition_at);
}

domain::Urgency EscalationEngine::classify(
    const domain::Ticket& ticket, const domain::KitchenSettings& settings,
    domain::TimeMs now) {
  if (domain::isTerminal(ticket.state)) {
    return domain::Urgency::Normal;
  }

  const std::int64_t age = elapsed(ticket, now);

  if (settings.critical_threshold_seconds > 0 &&
      age >= seconds_to_ms(settings.critical_threshold_seconds)) {
    return domain::Urgency::Critical;
  }
  if (settings.warning_threshold_seconds > 0 &&
      age >= seconds_to_ms(settings.warning_threshold_seconds)) {
    return domain::Urgency::Warning;
  }
  return domain::Urgency::Normal;
}

}  // namespace kds
