#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/domain/market_condition.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace staged {
namespace risk {

/// Inputs to one breaker evaluation, gathered by the orchestrator.
struct BreakerInputs {
  std::optional<domain::MarketConditionSnapshot> market;  // nullopt: unavailable
  double trailing_performance{0.0};
  std::int64_t now_ms{0};
  bool operator_halt{false};
};

struct BreakerStatus {
  bool tripped{false};
  std::vector<std::string> reasons;
};

// -----------------------------------------------------------------------------
// evaluateCircuitBreakers(ledgers, inputs, config)
// -----------------------------------------------------------------------------
//
// @brief  Decides whether new entries are suppressed for this cycle.
//
// @details
// Trips on any of:
//   - operator halt,
//   - broad index change <= market_decline_threshold,
//   - trailing portfolio performance <= portfolio_loss_threshold,
//   - stop-loss sales since UTC midnight >= daily_stop_loss_limit,
//   - stop-loss sales within recent_window_days >= recent_stop_loss_limit.
// Every tripped condition contributes one reason string. A tripped breaker
// is a mode switch for the cycle: exits and persistence continue. With
// enable == false only the operator halt is honoured.
// -----------------------------------------------------------------------------
BreakerStatus evaluateCircuitBreakers(const domain::LedgerMap& ledgers,
                                      const BreakerInputs& inputs,
                                      const config::CircuitBreakerConfig& config);

}  // namespace risk
}  // namespace staged
