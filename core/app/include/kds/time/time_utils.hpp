#pragma once

#include <cstdint>
#include <string>

namespace kds {

// -----------------------------------------------------------------------------
// Time conversion and formatting helpers
// -----------------------------------------------------------------------------
// Settings carry thresholds in seconds; tickets carry epoch milliseconds.
// -----------------------------------------------------------------------------

inline std::int64_t seconds_to_ms(std::int64_t seconds) {
  return seconds * 1000;
}

// -------------------------------------------------------------------------
// formatElapsed(elapsed_ms)
// -------------------------------------------------------------------------
// @brief  Renders a ticket age the way station screens show it.
//
// @return "0m" … "59m" below one hour, "H:MM" from one hour on
//         (e.g. 5'400'000 ms → "1:30"). Negative input renders as "0m".
// -------------------------------------------------------------------------
std::string formatElapsed(std::int64_t elapsed_ms);

}  // namespace kds
