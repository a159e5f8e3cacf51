#include "kds/time/time_utils.hpp"

#include <cstdio>

namespace kds {

std::string formatElapsed(std::int64_t elapsed_ms) {
  if (elapsed_ms < 0) {
    elapsed_ms = 0;
  }

  const std::int64_t total_minutes = elapsed_ms / 60'000;
  if (total_minutes < 60) {
    return std::to_string(total_minutes) + "m";
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld",
                static_cast<long long>(total_minutes / 60),
                static_cast<long long>(total_minutes % 60));
  return buf;
}

}  // namespace kds
