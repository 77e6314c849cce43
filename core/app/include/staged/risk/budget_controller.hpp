#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/budget_state.hpp"

#include <cstdint>

namespace staged {
namespace risk {

// -----------------------------------------------------------------------------
// rescale(initial_budget, trailing_performance, config)
// -----------------------------------------------------------------------------
//
// @brief  Effective budget for the current cycle.
//
// @details
// Proportional: step function over config.bands (ordered by descending
//   min_performance); the first band the performance reaches gives the
//   multiplier, below every band the floor applies, and the multiplier is
//   clamped to [floor_multiplier, ceiling_multiplier]. With the default
//   bands flat performance yields x1.00.
// Strict: always the initial budget.
// Adaptive: with equity = initial x (1 + performance), the initial budget
//   while equity >= initial x (1 - loss_tolerance), otherwise
//   max(0.8 x equity, initial x (1 - loss_tolerance)).
// -----------------------------------------------------------------------------
double rescale(double initial_budget, double trailing_performance,
               const config::BudgetConfig& config);

/// max(0, min(max_exposure_fraction, 1 - min_cash_fraction) x effective
/// - current_exposure): what may still be committed to new entries.
double enforceExposureCap(double effective_budget, double current_exposure,
                          const config::ExposureConfig& config);

// -----------------------------------------------------------------------------
// BudgetController — owner of the process-wide BudgetState
// -----------------------------------------------------------------------------
//
// @brief  Tracks cumulative realized PnL and the rolling equity window, and
//         derives the effective budget from them.
//
// @details
// The orchestrator feeds it once per cycle: realized PnL from confirmed
// sells, then one equity sample. The window is trimmed to
// performance_horizon_days on every sample (the newest sample always
// stays). Trailing performance is the relative change from the oldest
// sample in the window to the newest; fewer than two samples count as flat.
//
// The initial budget always comes from configuration. restore() keeps the
// persisted window and PnL but adopts the configured initial budget.
//
// Thread model:
//   Owned and mutated by the cycle thread only. The engine publishes copies
//   of state() to other threads.
// -----------------------------------------------------------------------------
class BudgetController {
 public:
  explicit BudgetController(config::BudgetConfig config);

  void restore(const domain::BudgetState& state);

  /// Adopts a reloaded configuration; the window is re-trimmed on the next
  /// sample.
  void updateConfig(const config::BudgetConfig& config);

  void recordRealizedPnl(double pnl);

  void recordEquity(std::int64_t timestamp_ms, double equity);

  double trailingPerformance() const;

  /// Recomputes and stores the effective budget.
  double refreshEffectiveBudget();

  double effectiveBudget() const { return state_.effective_budget; }

  const domain::BudgetState& state() const { return state_; }

 private:
  config::BudgetConfig config_;
  domain::BudgetState state_;
};

}  // namespace risk
}  // namespace staged
