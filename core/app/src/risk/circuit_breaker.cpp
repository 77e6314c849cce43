#include "staged/risk/circuit_breaker.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/time/time_utils.hpp"

#include <sstream>

namespace staged {
namespace risk {

BreakerStatus evaluateCircuitBreakers(
    const domain::LedgerMap& ledgers, const BreakerInputs& inputs,
    const config::CircuitBreakerConfig& config) {
  BreakerStatus status;
  auto trip = [&status](const std::string& reason) {
    status.tripped = true;
    status.reasons.push_back(reason);
  };

  if (inputs.operator_halt) {
    trip("operator halt");
  }
  if (!config.enable) {
    return status;
  }

  if (inputs.market &&
      inputs.market->index_change <= config.market_decline_threshold) {
    std::ostringstream os;
    os << "market decline " << inputs.market->index_change * 100.0 << "%";
    trip(os.str());
  }

  if (inputs.trailing_performance <= config.portfolio_loss_threshold) {
    std::ostringstream os;
    os << "portfolio loss " << inputs.trailing_performance * 100.0 << "%";
    trip(os.str());
  }

  const std::int64_t day_start = utc_day_start_ms(inputs.now_ms);
  const std::int64_t window_start =
      inputs.now_ms - days_to_ms(config.recent_window_days);
  int today = 0;
  int recent = 0;
  for (const auto& [code, ledger] : ledgers) {
    today += ledger::stopLossCountSince(ledger, day_start);
    recent += ledger::stopLossCountSince(ledger, window_start);
  }

  if (config.daily_stop_loss_limit > 0 && today >= config.daily_stop_loss_limit) {
    trip(std::to_string(today) + " stop-loss(es) today");
  }
  if (config.recent_stop_loss_limit > 0 &&
      recent >= config.recent_stop_loss_limit) {
    std::ostringstream os;
    os << recent << " stop-loss(es) in the last " << config.recent_window_days
       << " day(s)";
    trip(os.str());
  }
  return status;
}

}  // namespace risk
}  // namespace staged
