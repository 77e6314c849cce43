#pragma once

#include <cstdint>

namespace staged {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every timestamp the engine writes (stage entries, sell records, equity
// samples, generation directory names) and every duration it checks
// (re-entry cooldowns, stop-loss windows, quote staleness, backup retention)
// comes from an injected ITimeProvider:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the test or replay
//                              harness, so cooldown and retention behaviour
//                              can be exercised without sleeping.
//
// Timestamps are int64 milliseconds since the Unix epoch, the same unit the
// persisted documents and the quote feed use.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads;
//   the cycle thread, the feed thread and the IPC thread all read the clock.
//
// Ownership:
//   Components hold a shared_ptr or a const reference; the provider must
//   outlive every component that reads it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return int64_t  Epoch time in milliseconds. May be 0 before a
  //         simulation clock is initialized.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace staged
