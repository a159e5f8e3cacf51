#include "kds/time/live_time_provider.hpp"

#include <chrono>

namespace kds {

std::int64_t LiveTimeProvider::now_ms() const {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::system_clock;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

}  // namespace kds
