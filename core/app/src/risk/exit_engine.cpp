#include "staged/risk/exit_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace staged {

namespace domain {

const char* exitActionToString(ExitAction action) {
  switch (action) {
    case ExitAction::Hold:        return "HOLD";
    case ExitAction::PartialSell: return "PARTIAL_SELL";
    case ExitAction::StopLoss:    return "STOP_LOSS";
    case ExitAction::FullSell:    return "FULL_SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain

namespace risk {

ExitEngine::ExitEngine(config::ExitConfig config) : config_(std::move(config)) {}

double ExitEngine::profitTarget(int stage_number) const {
  if (config_.profit_targets.empty()) {
    return std::numeric_limits<double>::infinity();
  }
  const std::size_t index = std::min<std::size_t>(
      static_cast<std::size_t>(std::max(stage_number - 1, 0)),
      config_.profit_targets.size() - 1);
  return config_.profit_targets[index];
}

std::vector<const domain::StageEntry*> ExitEngine::visitOrder(
    const domain::InstrumentLedger& ledger) const {
  std::vector<const domain::StageEntry*> open;
  for (const auto& s : ledger.stages) {
    if (s.is_open && s.remaining_quantity > 0) {
      open.push_back(&s);
    }
  }
  std::sort(open.begin(), open.end(),
            [](const domain::StageEntry* a, const domain::StageEntry* b) {
              if (a->entry_price != b->entry_price) {
                return a->entry_price < b->entry_price;
              }
              return a->stage_number < b->stage_number;
            });
  return open;
}

domain::ExitDecision ExitEngine::decide(
    const domain::InstrumentLedger& ledger, double current_price,
    double fair_value, const domain::MarketConditionSnapshot& market,
    bool high_profit_sell_reduction) const {
  const auto stages = visitOrder(ledger);
  if (stages.empty() || !(current_price > 0.0)) {
    return {};
  }

  // Rule 1: overvalued. Instrument-wide, so it applies to the first visited
  // stage.
  if (fair_value > 0.0) {
    const double discount = (fair_value - current_price) / fair_value;
    if (discount <= -config_.overvalued_threshold) {
      const auto* s = stages.front();
      return {domain::ExitAction::FullSell, s->stage_number,
              s->remaining_quantity, domain::kReasonOvervalued};
    }
  }

  // Rule 2: stop-loss.
  for (const auto* s : stages) {
    const double ret = (current_price - s->entry_price) / s->entry_price;
    if (ret <= -config_.stop_loss_threshold) {
      return {domain::ExitAction::StopLoss, s->stage_number,
              s->remaining_quantity, domain::kReasonStopLoss};
    }
  }

  // Rule 3: profit target.
  double ratio = config_.partial_sell_ratio;
  if (high_profit_sell_reduction &&
      market.trend == domain::MarketTrend::StrongUptrend) {
    ratio *= config_.uptrend_sell_ratio_multiplier;
  }
  for (const auto* s : stages) {
    const double ret = (current_price - s->entry_price) / s->entry_price;
    if (ret >= profitTarget(s->stage_number)) {
      auto quantity = static_cast<std::int64_t>(
          std::floor(static_cast<double>(s->remaining_quantity) * ratio));
      quantity = std::clamp<std::int64_t>(quantity, 1, s->remaining_quantity);
      return {domain::ExitAction::PartialSell, s->stage_number, quantity,
              domain::kReasonProfitTarget};
    }
  }

  return {};
}

}  // namespace risk
}  // namespace staged
