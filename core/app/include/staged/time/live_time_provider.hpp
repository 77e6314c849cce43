#pragma once

#include "staged/time/i_time_provider.hpp"

namespace staged {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the trading engine in live and paper mode. Cooldowns and backup
// retention are measured against this clock, so it must be the wall clock
// (not steady_clock): persisted timestamps have to stay comparable across
// process restarts.
//
// Thread model:
//   std::chrono::system_clock::now() is safe from any thread; no mutex.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace staged
