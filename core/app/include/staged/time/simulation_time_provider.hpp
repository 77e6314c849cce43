#pragma once

#include "staged/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace staged {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the caller
//         rather than read from the system clock.
//
// @details
// Tests and replay harnesses use it to step through cooldown windows,
// stop-loss counting windows and backup retention ages deterministically:
//
//   SimulationTimeProvider clock(kMonday9am);
//   ... close a stage ...
//   clock.advance_by(7 * kMsPerHour);   // past a 6h cooldown
//
// Internal storage is a std::atomic<int64_t>: the cycle thread, the feed
// thread and the IPC thread may all read it while a test thread advances
// it, and a lock-free atomic gives the visibility guarantee without
// contention.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility and is not enforced; tests
  // occasionally need to set arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  /// Moves the clock forward by `delta_ms`.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace staged
