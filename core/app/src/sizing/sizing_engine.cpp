#include "staged/sizing/sizing_engine.hpp"
#include "staged/ledger/position_ledger.hpp"

#include <algorithm>
#include <stdexcept>

namespace staged {
namespace sizing {

double discountRate(double fair_value, double current_price) {
  if (!(fair_value > 0.0)) {
    throw std::invalid_argument("discountRate: fair value must be positive");
  }
  return (fair_value - current_price) / fair_value;
}

double bandFraction(double discount_rate,
                    const std::vector<config::SizingBand>& bands) {
  if (!(discount_rate > 0.0)) {
    return 0.0;
  }
  for (const auto& band : bands) {
    if (discount_rate >= band.min_discount) {
      return band.fraction;
    }
  }
  return 0.0;
}

double dynamicDropRequirement(int stage_number,
                              const domain::MarketConditionSnapshot& market,
                              const config::DropRequirementConfig& config) {
  if (stage_number < 2 || config.base_drops.empty()) {
    return 0.0;
  }
  const std::size_t index = std::min<std::size_t>(
      static_cast<std::size_t>(stage_number - 2), config.base_drops.size() - 1);
  const double base = config.base_drops[index];
  if (!config.enable) {
    return base;
  }

  double requirement = base;
  if (domain::isDowntrend(market.trend)) {
    requirement += config.downtrend_bonus;
  } else if (domain::isUptrend(market.trend)) {
    requirement += config.uptrend_penalty;
  }
  if (market.volatility > config.high_volatility_threshold) {
    requirement += config.high_volatility_bonus;
  }
  return std::clamp(requirement, config.min_factor * base,
                    config.max_factor * base);
}

std::map<int, double> dropRequirements(
    int max_stages, const domain::MarketConditionSnapshot& market,
    const config::DropRequirementConfig& config) {
  std::map<int, double> out;
  for (int stage = 2; stage <= max_stages; ++stage) {
    out[stage] = dynamicDropRequirement(stage, market, config);
  }
  return out;
}

double sizeForStage(double discount_rate, double available_budget,
                    int stage_number, const domain::InstrumentLedger& ledger,
                    const EntryContext& context,
                    const config::EngineConfig& config) {
  if (!(available_budget > 0.0)) {
    return 0.0;
  }
  if (stage_number < 1 || stage_number > config.sizing.max_stages) {
    return 0.0;
  }
  const domain::StageEntry* slot = ledger::findStage(ledger, stage_number);
  if (slot != nullptr && slot->is_open) {
    return 0.0;
  }

  // A slot closed earlier, stage 1 included, waits out its cooldown.
  if (!ledger::isReentryAllowed(ledger, stage_number, context.now_ms,
                                context.current_price, context.market,
                                config.cooldown)) {
    return 0.0;
  }

  if (stage_number > 1) {
    const domain::StageEntry* previous =
        ledger::findStage(ledger, stage_number - 1);
    if (previous == nullptr || !previous->is_open) {
      return 0.0;
    }
    const double drop = (previous->entry_price - context.current_price) /
                        previous->entry_price;
    if (drop < dynamicDropRequirement(stage_number, context.market,
                                      config.drop_requirement)) {
      return 0.0;
    }
  }

  const double amount =
      bandFraction(discount_rate, config.sizing.bands) * available_budget;
  return std::clamp(amount, 0.0, available_budget);
}

}  // namespace sizing
}  // namespace staged
