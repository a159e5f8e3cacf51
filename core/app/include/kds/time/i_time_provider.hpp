#pragma once

#include <cstdint>

namespace kds {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
// Source of "now" for ticket stamps, audit timestamps and ticket ages.
// The executable wires LiveTimeProvider; tests drive a SimulationTimeProvider
// so a ticket can sit in InProgress for five minutes without any sleeping.
//
// now_ms() is epoch milliseconds, the unit ticket stamps are stored in.
// Implementations must tolerate concurrent callers: the scheduler thread,
// the IPC thread and display threads all read the clock.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace kds
