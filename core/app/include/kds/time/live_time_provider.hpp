#pragma once

#include "kds/time/i_time_provider.hpp"

namespace kds {

// Wall clock (system_clock). Ticket stamps have to line up with the order
// timestamps other systems write, so a steady clock would not do.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace kds
