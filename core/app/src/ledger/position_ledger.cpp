#include "staged/ledger/position_ledger.hpp"
#include "staged/domain/errors.hpp"
#include "staged/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace staged {
namespace ledger {

namespace {

std::string stageLabel(const domain::InstrumentLedger& ledger, int stage) {
  std::ostringstream os;
  os << ledger.instrument.code << " stage " << stage;
  return os.str();
}

}  // namespace

domain::InstrumentLedger emptyLedger(const domain::Instrument& instrument) {
  domain::InstrumentLedger ledger;
  ledger.instrument = instrument;
  return ledger;
}

// -----------------------------------------------------------------------------
// openStage
// -----------------------------------------------------------------------------
domain::InstrumentLedger openStage(const domain::InstrumentLedger& ledger,
                                   double price, std::int64_t quantity,
                                   std::int64_t timestamp_ms,
                                   int max_stages) {
  if (!(price > 0.0) || !std::isfinite(price)) {
    throw std::invalid_argument("openStage: price must be positive");
  }
  if (quantity <= 0) {
    throw std::invalid_argument("openStage: quantity must be positive");
  }

  const int slot = nextStageNumber(ledger, max_stages);
  if (slot == 0) {
    throw CapacityExceeded(ledger.instrument.code + ": all " +
                           std::to_string(max_stages) +
                           " stage slots are open");
  }

  domain::InstrumentLedger next = ledger;
  auto it = std::find_if(next.stages.begin(), next.stages.end(),
                         [slot](const domain::StageEntry& s) {
                           return s.stage_number == slot;
                         });

  if (it == next.stages.end()) {
    domain::StageEntry fresh;
    fresh.stage_number = slot;
    auto pos = std::upper_bound(
        next.stages.begin(), next.stages.end(), slot,
        [](int n, const domain::StageEntry& s) { return n < s.stage_number; });
    it = next.stages.insert(pos, fresh);
  }

  // Re-entry keeps sell_history and last_close_* of the slot.
  it->entry_price = price;
  it->entry_quantity = quantity;
  it->remaining_quantity = quantity;
  it->entry_timestamp_ms = timestamp_ms;
  it->is_open = true;
  return next;
}

// -----------------------------------------------------------------------------
// closeStagePartial
// -----------------------------------------------------------------------------
CloseResult closeStagePartial(const domain::InstrumentLedger& ledger,
                              int stage_number, std::int64_t quantity,
                              double price, std::int64_t timestamp_ms,
                              const std::string& reason,
                              const FeeFunction& fees) {
  if (quantity <= 0) {
    throw std::invalid_argument("closeStagePartial: quantity must be positive");
  }
  if (!(price > 0.0) || !std::isfinite(price)) {
    throw std::invalid_argument("closeStagePartial: price must be positive");
  }

  const domain::StageEntry* current = findStage(ledger, stage_number);
  if (current == nullptr || !current->is_open) {
    throw UnknownStage("no open " + stageLabel(ledger, stage_number));
  }
  if (quantity > current->remaining_quantity) {
    std::ostringstream os;
    os << stageLabel(ledger, stage_number) << ": cannot sell " << quantity
       << ", only " << current->remaining_quantity << " remaining";
    throw InsufficientQuantity(os.str());
  }

  const double fee = fees ? fees(price, quantity, false) : 0.0;
  const double realized =
      (price - current->entry_price) * static_cast<double>(quantity) - fee;

  CloseResult result{ledger, realized};
  auto& stage = *std::find_if(result.ledger.stages.begin(),
                              result.ledger.stages.end(),
                              [stage_number](const domain::StageEntry& s) {
                                return s.stage_number == stage_number;
                              });

  domain::SellRecord record;
  record.timestamp_ms = timestamp_ms;
  record.quantity = quantity;
  record.price = price;
  record.realized_pnl = realized;
  record.reason = reason;
  stage.sell_history.push_back(std::move(record));

  stage.remaining_quantity -= quantity;
  result.ledger.realized_pnl += realized;

  if (stage.remaining_quantity == 0) {
    stage.is_open = false;
    stage.last_close_timestamp_ms = timestamp_ms;
    stage.last_close_price = price;
    stage.last_close_reason = reason;
  }
  return result;
}

// -----------------------------------------------------------------------------
// reentryCooldownHours
// -----------------------------------------------------------------------------
double reentryCooldownHours(const domain::StageEntry& stage,
                            const domain::MarketConditionSnapshot& market,
                            const config::CooldownConfig& cooldown) {
  const bool stop_loss = stage.last_close_reason == domain::kReasonStopLoss;
  const double fixed = stop_loss ? cooldown.stop_loss_cooldown_hours
                                 : cooldown.cooldown_hours;
  if (!cooldown.adaptive) {
    return fixed;
  }

  double outcome = 1.0;
  const double realized =
      stage.entry_price > 0.0
          ? (stage.last_close_price - stage.entry_price) / stage.entry_price
          : 0.0;
  if (stop_loss) {
    outcome = cooldown.stop_loss_multiplier;
  } else if (realized < 0.0) {
    outcome = cooldown.loss_multiplier;
  } else {
    for (const auto& band : cooldown.profit_bands) {
      if (realized >= band.min_return) {
        outcome = band.multiplier;
        break;
      }
    }
  }

  double volatility = cooldown.unknown_volatility_multiplier;
  double trend = 1.0;
  if (market.trend != domain::MarketTrend::Unknown) {
    if (market.volatility > cooldown.high_volatility_threshold) {
      volatility = cooldown.high_volatility_multiplier;
    } else if (market.volatility > cooldown.medium_volatility_threshold) {
      volatility = cooldown.medium_volatility_multiplier;
    } else {
      volatility = cooldown.low_volatility_multiplier;
    }
    if (domain::isDowntrend(market.trend)) {
      trend = cooldown.downtrend_multiplier;
    } else if (domain::isUptrend(market.trend)) {
      trend = cooldown.uptrend_multiplier;
    } else {
      trend = cooldown.neutral_multiplier;
    }
  }

  const double adaptive =
      std::clamp(cooldown.cooldown_hours * outcome * volatility * trend,
                 cooldown.min_hours, cooldown.max_hours);
  return std::max(fixed, adaptive);
}

// -----------------------------------------------------------------------------
// isReentryAllowed
// -----------------------------------------------------------------------------
bool isReentryAllowed(const domain::InstrumentLedger& ledger,
                      int stage_number, std::int64_t now_ms,
                      double current_price,
                      const domain::MarketConditionSnapshot& market,
                      const config::CooldownConfig& cooldown) {
  const domain::StageEntry* stage = findStage(ledger, stage_number);
  if (stage == nullptr) {
    return true;
  }
  if (stage->is_open) {
    return false;
  }
  if (stage->last_close_timestamp_ms == 0) {
    return true;
  }

  const double hours = reentryCooldownHours(*stage, market, cooldown);
  if (now_ms - stage->last_close_timestamp_ms < hours_to_ms(hours)) {
    return false;
  }

  if (cooldown.min_pullback > 0.0 && stage->last_close_price > 0.0) {
    const double pullback =
        (stage->last_close_price - current_price) / stage->last_close_price;
    if (pullback < cooldown.min_pullback) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
const domain::StageEntry* findStage(const domain::InstrumentLedger& ledger,
                                    int stage_number) {
  for (const auto& s : ledger.stages) {
    if (s.stage_number == stage_number) {
      return &s;
    }
  }
  return nullptr;
}

int nextStageNumber(const domain::InstrumentLedger& ledger, int max_stages) {
  const int limit = std::clamp(max_stages, 1, domain::kMaxStageSlots);
  for (int n = 1; n <= limit; ++n) {
    const domain::StageEntry* s = findStage(ledger, n);
    if (s == nullptr || !s->is_open) {
      return n;
    }
  }
  return 0;
}

int openStageCount(const domain::InstrumentLedger& ledger) {
  return static_cast<int>(
      std::count_if(ledger.stages.begin(), ledger.stages.end(),
                    [](const domain::StageEntry& s) { return s.is_open; }));
}

std::int64_t openQuantity(const domain::InstrumentLedger& ledger) {
  std::int64_t total = 0;
  for (const auto& s : ledger.stages) {
    if (s.is_open) {
      total += s.remaining_quantity;
    }
  }
  return total;
}

double costBasis(const domain::InstrumentLedger& ledger) {
  double total = 0.0;
  for (const auto& s : ledger.stages) {
    if (s.is_open) {
      total += s.entry_price * static_cast<double>(s.remaining_quantity);
    }
  }
  return total;
}

double openExposure(const domain::InstrumentLedger& ledger, double price) {
  return static_cast<double>(openQuantity(ledger)) * price;
}

int stopLossCountSince(const domain::InstrumentLedger& ledger,
                       std::int64_t since_ms) {
  int count = 0;
  for (const auto& s : ledger.stages) {
    for (const auto& r : s.sell_history) {
      if (r.reason == domain::kReasonStopLoss && r.timestamp_ms >= since_ms) {
        ++count;
      }
    }
  }
  return count;
}

int entriesSince(const domain::InstrumentLedger& ledger,
                 std::int64_t since_ms) {
  return static_cast<int>(std::count_if(
      ledger.stages.begin(), ledger.stages.end(),
      [since_ms](const domain::StageEntry& s) {
        return s.entry_quantity > 0 && s.entry_timestamp_ms >= since_ms;
      }));
}

// -----------------------------------------------------------------------------
// checkInvariants
// -----------------------------------------------------------------------------
std::optional<std::string> checkInvariants(
    const domain::InstrumentLedger& ledger) {
  if (ledger.instrument.code.empty()) {
    return std::string("instrument code is empty");
  }
  if (ledger.stages.size() > static_cast<std::size_t>(domain::kMaxStageSlots)) {
    return "more than " + std::to_string(domain::kMaxStageSlots) + " stages";
  }
  if (!std::isfinite(ledger.realized_pnl)) {
    return std::string("realized_pnl is not finite");
  }

  int previous = 0;
  for (const auto& s : ledger.stages) {
    const std::string label = "stage " + std::to_string(s.stage_number);
    if (s.stage_number < 1 || s.stage_number > domain::kMaxStageSlots) {
      return label + ": number out of range";
    }
    if (s.stage_number <= previous) {
      return label + ": stage numbers not strictly ascending";
    }
    previous = s.stage_number;

    if (s.remaining_quantity < 0) {
      return label + ": negative remaining quantity";
    }
    if (s.remaining_quantity > s.entry_quantity) {
      return label + ": remaining quantity exceeds entry quantity";
    }
    if (s.is_open != (s.remaining_quantity > 0)) {
      return label + ": open flag disagrees with remaining quantity";
    }
    if (s.is_open && !(s.entry_price > 0.0)) {
      return label + ": open stage without a positive entry price";
    }
    if (!std::isfinite(s.entry_price) || !std::isfinite(s.last_close_price)) {
      return label + ": non-finite price";
    }
    for (const auto& r : s.sell_history) {
      if (r.quantity <= 0 || !(r.price > 0.0) ||
          !std::isfinite(r.realized_pnl)) {
        return label + ": malformed sell record";
      }
    }
  }
  return std::nullopt;
}

}  // namespace ledger
}  // namespace staged
