#pragma once

#include "kds/domain/ticket.hpp"

#include <cstdint>

namespace kds {
namespace domain {

// -----------------------------------------------------------------------------
// KitchenSettings: per-hub configuration record
// -----------------------------------------------------------------------------
//
// @brief  Read-only inputs to the kitchen core for a single hub.
//
// @details
// Supplied by the settings collaborator through ISettingsProvider and passed
// by value into every operation that needs it. The core never writes
// settings back.
//
// Threshold semantics:
//   warning_threshold_seconds / critical_threshold_seconds ≤ 0 disable the
//   corresponding escalation level. auto_bump_delay_seconds is compared with
//   >=, so a delay of 0 bumps every InProgress ticket on the next tick.
//
// Display fields (items_per_page, refresh_interval_seconds, show_timer,
// color_coding_enabled) are passed through to display terminals untouched.
// Sound flags only decide the play_sound hint on published events.
// -----------------------------------------------------------------------------
struct KitchenSettings {
  HubId hub_id;

  // Escalation
  std::int64_t warning_threshold_seconds{15 * 60};
  std::int64_t critical_threshold_seconds{30 * 60};

  // Auto-bump
  bool auto_bump_enabled{false};
  std::int64_t auto_bump_delay_seconds{5};
  std::int64_t auto_bump_interval_ms{1000};  // Scheduler tick for this hub

  // Intake
  bool auto_accept_enabled{false};

  // Display
  int items_per_page{12};
  int refresh_interval_seconds{10};
  bool show_timer{true};
  bool color_coding_enabled{true};

  // Sound
  bool sound_enabled{true};
  bool sound_on_new_order{true};
  bool sound_on_rush{true};
};

}  // namespace domain
}  // namespace kds
