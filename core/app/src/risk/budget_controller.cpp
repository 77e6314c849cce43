#include "staged/risk/budget_controller.hpp"
#include "staged/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace staged {
namespace risk {

double rescale(double initial_budget, double trailing_performance,
               const config::BudgetConfig& config) {
  switch (config.strategy) {
    case config::BudgetStrategy::Strict:
      return initial_budget;

    case config::BudgetStrategy::Adaptive: {
      const double equity = initial_budget * (1.0 + trailing_performance);
      const double floor = initial_budget * (1.0 - config.loss_tolerance);
      if (equity >= floor) {
        return initial_budget;
      }
      return std::max(0.8 * equity, floor);
    }

    case config::BudgetStrategy::Proportional:
      break;
  }

  double multiplier = config.floor_multiplier;
  for (const auto& band : config.bands) {
    if (trailing_performance >= band.min_performance) {
      multiplier = band.multiplier;
      break;
    }
  }
  multiplier =
      std::clamp(multiplier, config.floor_multiplier, config.ceiling_multiplier);
  return initial_budget * multiplier;
}

double enforceExposureCap(double effective_budget, double current_exposure,
                          const config::ExposureConfig& config) {
  const double fraction =
      std::min(config.max_exposure_fraction, 1.0 - config.min_cash_fraction);
  return std::max(0.0, fraction * effective_budget - current_exposure);
}

// -----------------------------------------------------------------------------
// BudgetController
// -----------------------------------------------------------------------------
BudgetController::BudgetController(config::BudgetConfig config)
    : config_(std::move(config)) {
  state_.initial_budget = config_.initial_budget;
  state_.effective_budget = config_.initial_budget;
}

void BudgetController::restore(const domain::BudgetState& state) {
  state_ = state;
  if (state_.initial_budget != config_.initial_budget) {
    std::cout << "[BudgetController] initial budget changed "
              << state_.initial_budget << " -> " << config_.initial_budget
              << "\n";
    state_.initial_budget = config_.initial_budget;
  }
}

void BudgetController::updateConfig(const config::BudgetConfig& config) {
  config_ = config;
  state_.initial_budget = config_.initial_budget;
}

void BudgetController::recordRealizedPnl(double pnl) {
  state_.cumulative_realized_pnl += pnl;
}

void BudgetController::recordEquity(std::int64_t timestamp_ms, double equity) {
  auto& window = state_.performance_window;
  if (!window.empty() && timestamp_ms < window.back().timestamp_ms) {
    std::cerr << "[BudgetController] WARNING: equity sample out of order ("
              << timestamp_ms << " < " << window.back().timestamp_ms
              << "); dropped\n";
    return;
  }
  window.push_back({timestamp_ms, equity});

  const std::int64_t cutoff =
      timestamp_ms - days_to_ms(config_.performance_horizon_days);
  const auto first_kept = std::find_if(
      window.begin(), window.end(),
      [cutoff](const domain::EquitySample& s) { return s.timestamp_ms >= cutoff; });
  window.erase(window.begin(), first_kept);
}

double BudgetController::trailingPerformance() const {
  const auto& window = state_.performance_window;
  if (window.size() < 2 || !(window.front().equity > 0.0)) {
    return 0.0;
  }
  return (window.back().equity - window.front().equity) /
         window.front().equity;
}

double BudgetController::refreshEffectiveBudget() {
  state_.effective_budget =
      rescale(state_.initial_budget, trailingPerformance(), config_);
  return state_.effective_budget;
}

}  // namespace risk
}  // namespace staged
