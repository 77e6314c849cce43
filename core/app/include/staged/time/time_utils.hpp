#pragma once

#include <cmath>
#include <cstdint>

namespace staged {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting configured durations (hours, days) into
//         the engine's epoch-millisecond arithmetic.
//
// @details
// Configuration states durations in the unit of the field name
// (cooldown_hours, recent_window_days, retention_hours); all comparisons
// are done in int64 milliseconds against ITimeProvider::now_ms(). Keeping
// the conversions here means every component rounds the same way.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1'000;
constexpr std::int64_t kMsPerHour = 3'600'000;
constexpr std::int64_t kMsPerDay = 86'400'000;

inline std::int64_t hours_to_ms(double hours) {
  return static_cast<std::int64_t>(std::llround(hours * kMsPerHour));
}

inline std::int64_t days_to_ms(double days) {
  return static_cast<std::int64_t>(std::llround(days * kMsPerDay));
}

// -------------------------------------------------------------------------
// utc_day_start_ms
// -------------------------------------------------------------------------
// @brief  Midnight UTC of the day containing `ms`.
//
// @details
// Daily limits (buys per instrument, stop-losses per day) count events at
// or after this instant. Floor division so pre-epoch values still land on
// the start of their own day.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_start_ms(std::int64_t ms) {
  std::int64_t day = ms / kMsPerDay;
  if (ms % kMsPerDay < 0) {
    --day;
  }
  return day * kMsPerDay;
}

}  // namespace staged
