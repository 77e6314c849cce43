#pragma once

#include <cstdint>
#include <vector>

namespace staged {
namespace domain {

// -----------------------------------------------------------------------------
// EquitySample — one point of the rolling performance window
// -----------------------------------------------------------------------------
struct EquitySample {
  std::int64_t timestamp_ms{0};
  double equity{0.0};
};

// -----------------------------------------------------------------------------
// BudgetState — process-wide capital bookkeeping
// -----------------------------------------------------------------------------
//
// @brief  Initial and effective budget, cumulative realized PnL, and the
//         trailing equity samples used for performance-based rescaling.
//
// @details
// Exactly one instance exists per engine, owned by BudgetController. It is
// persisted across restarts as its own document (budget_state.json) next to
// the ledger generations. performance_window is trimmed to the configured
// horizon every time a sample is recorded and is ordered by timestamp.
// -----------------------------------------------------------------------------
struct BudgetState {
  double initial_budget{0.0};
  double effective_budget{0.0};
  double cumulative_realized_pnl{0.0};
  std::vector<EquitySample> performance_window;
};

}  // namespace domain
}  // namespace staged
