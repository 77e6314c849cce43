#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/domain/market_condition.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace staged {
namespace sizing {

// -----------------------------------------------------------------------------
// Sizing Engine
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that turn a valuation discount into an allocation
//         for the next stage, and gate stages beyond the first.
//
// @details
// Allocation is a step function of the discount rate: the first band (bands
// ordered by descending min_discount) whose minimum the rate reaches gives
// the fraction of the available budget to commit. Nothing is allocated at
// or below a zero discount. Because bands are validated to have
// non-increasing fractions, sizing is monotone non-decreasing in the
// discount rate.
//
// Stage N > 1 additionally requires, in this order:
//   1. stage N - 1 is open (no skipping),
//   2. slot N is eligible for re-entry (cooldown and pullback),
//   3. the price sits below stage N - 1's entry price by at least the
//      stage's dynamic drop requirement.
// Any failed gate sizes the stage at 0.
//
// Thread model:
//   Stateless free functions; safe from any thread.
// -----------------------------------------------------------------------------

/// Per-call inputs that change every cycle.
struct EntryContext {
  std::int64_t now_ms{0};
  double current_price{0.0};
  domain::MarketConditionSnapshot market;
};

/// (fair_value - current_price) / fair_value. Throws std::invalid_argument
/// when fair_value <= 0.
double discountRate(double fair_value, double current_price);

/// Fraction of the first band whose min_discount the rate reaches; 0 when
/// the rate is <= 0 or below every band.
double bandFraction(double discount_rate,
                    const std::vector<config::SizingBand>& bands);

// -----------------------------------------------------------------------------
// dynamicDropRequirement(stage, market, config)
// -----------------------------------------------------------------------------
//
// @brief  Minimum fall below the previous stage's entry price before
//         `stage_number` may enter.
//
// @details
// base = base_drops[stage - 2] (the last entry is reused past the end).
// With adjustment enabled, the base is shifted by downtrend_bonus in a
// (strong) downtrend, by uptrend_penalty in a (strong) uptrend, and by
// high_volatility_bonus when volatility exceeds the threshold; the result is
// clamped to [min_factor x base, max_factor x base]. Disabled adjustment
// returns the base unchanged. Stage 1 has no requirement (0).
// -----------------------------------------------------------------------------
double dynamicDropRequirement(int stage_number,
                              const domain::MarketConditionSnapshot& market,
                              const config::DropRequirementConfig& config);

/// Requirements for stages 2..max_stages, as stored on the ledger for
/// inspection.
std::map<int, double> dropRequirements(
    int max_stages, const domain::MarketConditionSnapshot& market,
    const config::DropRequirementConfig& config);

// -----------------------------------------------------------------------------
// sizeForStage(discount, available, stage, ledger, context, config)
// -----------------------------------------------------------------------------
//
// @brief  Amount of capital to commit to `stage_number`.
//
// @return A value in [0, available_budget]. 0 when the stage is out of
//         range, its slot is already open, any gate fails, or the discount
//         allocates nothing.
// -----------------------------------------------------------------------------
double sizeForStage(double discount_rate, double available_budget,
                    int stage_number, const domain::InstrumentLedger& ledger,
                    const EntryContext& context,
                    const config::EngineConfig& config);

}  // namespace sizing
}  // namespace staged
