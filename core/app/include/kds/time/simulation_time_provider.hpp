#pragma once

#include "kds/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace kds {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// Clock moved by hand. Scheduler and escalation tests route a ticket, jump
// the clock past a threshold and tick, all without waiting.
//
// Setting the clock backwards is allowed. Ticket ages then clamp to zero
// (see EscalationEngine::elapsed); stored stamps are never rewritten.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : now_ms_(start_ms) {}

  std::int64_t now_ms() const override { return now_ms_.load(); }

  void set_time(std::int64_t now_ms) { now_ms_.store(now_ms); }

  // Returns the time after the move. Concurrent advances all count.
  std::int64_t advance_by(std::int64_t delta_ms) {
    return now_ms_.fetch_add(delta_ms) + delta_ms;
  }

  std::int64_t advance_seconds(std::int64_t seconds) {
    return advance_by(seconds * 1000);
  }

 private:
  std::atomic<std::int64_t> now_ms_;
};

}  // namespace kds
