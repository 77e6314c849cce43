#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/exit_decision.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/domain/market_condition.hpp"

#include <vector>

namespace staged {
namespace risk {

// -----------------------------------------------------------------------------
// ExitEngine — sell/hold decision per instrument
// -----------------------------------------------------------------------------
//
// @brief  Decides whether one open stage of an instrument should be sold
//         this cycle, and how much of it.
//
// @details
// Open stages are visited from the lowest entry price upward (equal prices:
// lower stage number first). Each rule is scanned across all visited stages
// before the next rule is tried, so precedence is global across stages:
//
//   1. Overvalued:  discount rate <= -overvalued_threshold
//                   -> FullSell of the first visited stage.
//   2. Stop-loss:   (price - entry) / entry <= -stop_loss_threshold
//                   -> StopLoss of that stage's full remaining quantity.
//                   Never deferred by any cooldown.
//   3. Profit:      unrealized return >= the stage's profit target
//                   -> PartialSell of floor(ratio x remaining), at least 1
//                   and at most remaining. The ratio is damped by
//                   uptrend_sell_ratio_multiplier in a strong uptrend when
//                   the instrument enables high_profit_sell_reduction.
//   4. Otherwise Hold.
//
// Circuit breakers only gate entries and are applied by the orchestrator.
//
// Thread model:
//   Stateless; every call is independent.
// -----------------------------------------------------------------------------
class ExitEngine {
 public:
  explicit ExitEngine(config::ExitConfig config);

  // -------------------------------------------------------------------------
  // decide(ledger, current_price, fair_value, market, high_profit_reduction)
  // -------------------------------------------------------------------------
  // @param  fair_value  Valuation for the overvalued rule. A non-positive
  //                     value disables that rule for this call.
  //
  // @return The first matching decision, or an ExitDecision with action Hold.
  // -------------------------------------------------------------------------
  domain::ExitDecision decide(const domain::InstrumentLedger& ledger,
                              double current_price, double fair_value,
                              const domain::MarketConditionSnapshot& market,
                              bool high_profit_sell_reduction) const;

  /// Profit target for `stage_number`; the last configured target applies
  /// to stages past the end of the list.
  double profitTarget(int stage_number) const;

  const config::ExitConfig& config() const { return config_; }

 private:
  std::vector<const domain::StageEntry*> visitOrder(
      const domain::InstrumentLedger& ledger) const;

  config::ExitConfig config_;
};

}  // namespace risk
}  // namespace staged
