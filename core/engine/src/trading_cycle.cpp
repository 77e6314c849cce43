#include "staged/engine/trading_cycle.hpp"
#include "staged/domain/errors.hpp"
#include "staged/fees/fee_schedule.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/risk/circuit_breaker.hpp"
#include "staged/risk/exit_engine.hpp"
#include "staged/sizing/sizing_engine.hpp"
#include "staged/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace staged {

const char* cycleOutcomeToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::Completed:     return "COMPLETED";
    case CycleOutcome::MarketClosed:  return "MARKET_CLOSED";
    case CycleOutcome::CommitPending: return "COMMIT_PENDING";
  }
  return "UNKNOWN";
}

namespace {

const config::InstrumentConfig* findInstrument(
    const config::EngineConfig& config, const std::string& code) {
  for (const auto& ic : config.instruments) {
    if (ic.instrument.code == code) {
      return &ic;
    }
  }
  return nullptr;
}

}  // namespace

TradingCycle::TradingCycle(CycleCollaborators collaborators,
                           store::LedgerStore& store,
                           risk::BudgetController& budget,
                           domain::LedgerMap ledgers)
    : io_(collaborators),
      store_(store),
      budget_(budget),
      ledgers_(std::move(ledgers)) {}

// -----------------------------------------------------------------------------
// runCycle
// -----------------------------------------------------------------------------
CycleReport TradingCycle::runCycle(const config::EngineConfig& config,
                                   bool operator_halt) {
  CycleReport report;
  const std::int64_t now = io_.clock.now_ms();
  report.summary.cycle_id = ++cycle_id_;
  report.summary.timestamp_ms = now;

  // --- 1) A save the previous pass could not commit goes first ---
  if (commit_pending_) {
    std::cout << "[TradingCycle] retrying pending commit\n";
    if (!trySave(report)) {
      report.outcome = CycleOutcome::CommitPending;
      report.summary.commit_pending = true;
      report.summary.effective_budget = budget_.effectiveBudget();
      publish(report);
      return report;
    }
  }

  // --- 2) Market hours ---
  if (!io_.prices.isMarketOpen()) {
    std::cout << "[TradingCycle] cycle " << cycle_id_
              << ": market closed, nothing to do\n";
    report.outcome = CycleOutcome::MarketClosed;
    report.summary.effective_budget = budget_.effectiveBudget();
    return report;
  }

  ensureConfiguredInstruments(config);

  // --- 3) Per-instrument inputs ---
  const std::vector<InstrumentInputs> inputs = gatherInputs(config, report);

  // --- 4) Market condition ---
  std::optional<domain::MarketConditionSnapshot> market;
  try {
    market = io_.market.marketCondition();
  } catch (const Unavailable& e) {
    std::cerr << "[TradingCycle] WARNING: market condition unavailable ("
              << e.what() << "); entries suppressed\n";
  }
  const domain::MarketConditionSnapshot market_view =
      market ? *market : domain::MarketConditionSnapshot{};

  // --- 5) Circuit breakers ---
  risk::BreakerInputs breaker_inputs;
  breaker_inputs.market = market;
  breaker_inputs.trailing_performance = budget_.trailingPerformance();
  breaker_inputs.now_ms = now;
  breaker_inputs.operator_halt = operator_halt;
  const risk::BreakerStatus breaker = risk::evaluateCircuitBreakers(
      ledgers_, breaker_inputs, config.circuit_breaker);
  if (breaker.tripped) {
    std::ostringstream os;
    for (std::size_t i = 0; i < breaker.reasons.size(); ++i) {
      os << (i ? "; " : "") << breaker.reasons[i];
    }
    std::cerr << "[TradingCycle] circuit breaker tripped: " << os.str()
              << "\n";
    alert(report, AlertSeverity::Warning, "",
          "circuit breaker tripped: " + os.str());
  }
  const bool entries_allowed = !breaker.tripped && market.has_value();
  report.summary.entries_suppressed = !entries_allowed;
  report.summary.breaker_reasons = breaker.reasons;

  // --- 6) Budget and exposure cap ---
  const double effective = budget_.refreshEffectiveBudget();
  double exposure = 0.0;
  for (const auto& [code, ledger] : ledgers_) {
    const auto it = std::find_if(
        inputs.begin(), inputs.end(),
        [&code](const InstrumentInputs& in) { return in.code == code; });
    exposure += (it != inputs.end() && it->available)
                    ? ledger::openExposure(ledger, it->price)
                    : ledger::costBasis(ledger);
  }
  double remaining_cap =
      risk::enforceExposureCap(effective, exposure, config.exposure);
  report.summary.effective_budget = effective;

  // --- 7) Decisions, one per instrument, in code order ---
  const domain::LedgerMap pre_pass = ledgers_;
  const risk::ExitEngine exits(config.exit);
  const std::int64_t day_start = utc_day_start_ms(now);
  std::vector<PlannedOrder> planned;

  for (const auto& in : inputs) {
    if (!in.available) {
      continue;
    }
    ++report.summary.instruments_evaluated;
    auto& ledger = ledgers_.at(in.code);
    ledger.drop_requirements = sizing::dropRequirements(
        config.sizing.max_stages, market_view, config.drop_requirement);

    const auto* ic = findInstrument(config, in.code);
    const bool reduce = ic != nullptr && ic->high_profit_sell_reduction;
    const domain::ExitDecision exit = exits.decide(
        ledger, in.price, in.valuation.fair_value, market_view, reduce);

    if (exit.action != domain::ExitAction::Hold) {
      const std::int64_t quantity =
          std::min(exit.quantity, in.owned_quantity);
      if (quantity <= 0) {
        alert(report, AlertSeverity::Warning, in.code,
              std::string(domain::exitActionToString(exit.action)) +
                  " wanted but the broker reports no holdings");
        continue;
      }
      if (quantity < exit.quantity) {
        std::cerr << "[TradingCycle] WARNING: " << in.code << " sell of "
                  << exit.quantity << " capped to broker holding "
                  << quantity << "\n";
      }
      planned.push_back({in.code, domain::Side::Sell, in.price, quantity,
                         exit.stage_number, exit.reason});
      continue;
    }

    if (!entries_allowed) {
      continue;
    }
    if (in.valuation.confidence < config.sizing.min_signal_confidence) {
      continue;
    }
    if (ledger::entriesSince(ledger, day_start) >=
        config.cycle.max_daily_buys_per_instrument) {
      continue;
    }
    const int stage = ledger::nextStageNumber(ledger, config.sizing.max_stages);
    if (stage == 0) {
      continue;
    }

    sizing::EntryContext ctx;
    ctx.now_ms = now;
    ctx.current_price = in.price;
    ctx.market = market_view;
    const double rate = sizing::discountRate(in.valuation.fair_value, in.price);
    const double amount =
        sizing::sizeForStage(rate, remaining_cap, stage, ledger, ctx, config);

    const auto lot = static_cast<std::int64_t>(config.sizing.lot_size);
    const auto lots = static_cast<std::int64_t>(
        std::floor(amount / in.price / static_cast<double>(lot)));
    const std::int64_t quantity = lots * lot;
    if (quantity <= 0) {
      continue;
    }
    remaining_cap -= static_cast<double>(quantity) * in.price;
    planned.push_back({in.code, domain::Side::Buy, in.price, quantity, stage,
                       "ENTRY"});
  }

  // --- 8) Orders ---
  const std::vector<OrderResult> results = placeOrders(planned, report);
  report.summary.orders_placed = static_cast<int>(planned.size());

  // --- 9) Confirmed fills into the ledgers ---
  const FeeFunction fees = makeFeeFunction(config.fees);
  for (const auto& r : results) {
    if (!r.filled) {
      continue;
    }
    const auto& code = r.order.code;
    try {
      TradeExecutedEvent trade;
      trade.fill = r.fill;
      trade.stage_number = r.order.stage_number;
      trade.reason = r.order.reason;

      if (r.order.side == domain::Side::Buy) {
        trade.stage_number =
            ledger::nextStageNumber(ledgers_.at(code), config.sizing.max_stages);
        ledgers_[code] =
            ledger::openStage(ledgers_.at(code), r.fill.price, r.fill.quantity,
                              r.fill.timestamp_ms, config.sizing.max_stages);
      } else {
        ledger::CloseResult closed = ledger::closeStagePartial(
            ledgers_.at(code), r.order.stage_number, r.fill.quantity,
            r.fill.price, r.fill.timestamp_ms, r.order.reason, fees);
        ledgers_[code] = std::move(closed.ledger);
        trade.realized_pnl = closed.realized_pnl;
        budget_.recordRealizedPnl(closed.realized_pnl);
      }

      std::cout << "[TradingCycle] " << code << " "
                << domain::sideToString(r.fill.side) << " "
                << r.fill.quantity << " @ " << r.fill.price << " stage "
                << trade.stage_number << " (" << trade.reason << ")\n";
      report.trades.push_back(std::move(trade));
      ++report.summary.fills_applied;
    } catch (const EngineError& e) {
      ledgers_[code] = pre_pass.at(code);
      alert(report, AlertSeverity::Critical, code,
            "fill " + r.fill.order_id + " could not be applied (" + e.what() +
                "); ledger restored, reconcile with the broker");
    } catch (const std::invalid_argument& e) {
      ledgers_[code] = pre_pass.at(code);
      alert(report, AlertSeverity::Critical, code,
            "fill " + r.fill.order_id + " rejected by the ledger (" +
                e.what() + "); ledger restored, reconcile with the broker");
    }
  }

  // --- 10) Persist ledgers ---
  trySave(report);
  report.summary.commit_pending = commit_pending_;

  // --- 11) Budget state ---
  // The budget document never runs ahead of the durable ledgers; it is
  // written by the pass that lands the pending commit.
  budget_.recordEquity(now, portfolioEquity(inputs));
  if (commit_pending_) {
    std::cerr << "[TradingCycle] WARNING: budget state held back until the "
                 "ledger commit lands\n";
  } else {
    try {
      store_.saveBudgetState(budget_.state());
    } catch (const PersistenceError& e) {
      std::cerr << "[TradingCycle] WARNING: budget state not saved: "
                << e.what() << "\n";
    }
  }

  std::cout << "[TradingCycle] cycle " << cycle_id_ << " done: "
            << report.summary.instruments_evaluated << " evaluated, "
            << report.summary.orders_placed << " order(s), "
            << report.summary.fills_applied << " fill(s), budget "
            << effective << (commit_pending_ ? ", COMMIT PENDING" : "")
            << "\n";

  // --- 12) Notifications ---
  publish(report);
  return report;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
void TradingCycle::ensureConfiguredInstruments(
    const config::EngineConfig& config) {
  for (const auto& ic : config.instruments) {
    auto it = ledgers_.find(ic.instrument.code);
    if (it == ledgers_.end()) {
      std::cout << "[TradingCycle] tracking new instrument "
                << ic.instrument.code << "\n";
      ledgers_.emplace(ic.instrument.code, ledger::emptyLedger(ic.instrument));
    } else {
      it->second.instrument = ic.instrument;
    }
  }
}

std::vector<TradingCycle::InstrumentInputs> TradingCycle::gatherInputs(
    const config::EngineConfig& config, CycleReport& report) {
  std::vector<std::string> codes;
  for (const auto& ic : config.instruments) {
    codes.push_back(ic.instrument.code);
  }
  std::sort(codes.begin(), codes.end());
  codes.erase(std::unique(codes.begin(), codes.end()), codes.end());

  std::vector<std::future<InstrumentInputs>> pending;
  pending.reserve(codes.size());
  for (const auto& code : codes) {
    pending.push_back(std::async(std::launch::async, [this, code] {
      InstrumentInputs in;
      in.code = code;
      in.price = io_.prices.currentPrice(code);
      in.owned_quantity = io_.prices.ownedQuantity(code);
      in.valuation = io_.valuations.fairValueSignal(code);
      in.available = true;
      return in;
    }));
  }

  std::vector<InstrumentInputs> inputs;
  inputs.reserve(codes.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    InstrumentInputs in;
    in.code = codes[i];
    try {
      in = pending[i].get();
    } catch (const Unavailable& e) {
      std::cout << "[TradingCycle] " << codes[i]
                << " skipped: " << e.what() << "\n";
    } catch (const std::exception& e) {
      alert(report, AlertSeverity::Warning, codes[i],
            std::string("input gathering failed: ") + e.what());
    }
    if (in.available &&
        (!(in.price > 0.0) || !(in.valuation.fair_value > 0.0))) {
      std::cerr << "[TradingCycle] WARNING: " << in.code
                << " has a non-positive price or fair value; skipped\n";
      in.available = false;
    }
    inputs.push_back(std::move(in));
  }
  return inputs;
}

std::vector<TradingCycle::OrderResult> TradingCycle::placeOrders(
    const std::vector<PlannedOrder>& orders, CycleReport& report) {
  std::vector<std::future<domain::OrderFill>> pending;
  pending.reserve(orders.size());
  for (const auto& order : orders) {
    pending.push_back(std::async(std::launch::async, [this, order] {
      return order.side == domain::Side::Buy
                 ? io_.executor.placeBuy(order.code, order.price,
                                         order.quantity)
                 : io_.executor.placeSell(order.code, order.price,
                                          order.quantity);
    }));
  }

  std::vector<OrderResult> results;
  results.reserve(orders.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    OrderResult r;
    r.order = orders[i];
    try {
      r.fill = pending[i].get();
      r.filled = r.fill.quantity > 0;
    } catch (const OrderRejected& e) {
      alert(report, AlertSeverity::Warning, r.order.code,
            std::string(domain::sideToString(r.order.side)) +
                " order rejected: " + e.what());
    } catch (const OrderTimeout& e) {
      alert(report, AlertSeverity::Warning, r.order.code,
            std::string(domain::sideToString(r.order.side)) +
                " order timed out: " + e.what());
    } catch (const EngineError& e) {
      alert(report, AlertSeverity::Critical, r.order.code,
            std::string("order failed: ") + e.what());
    }
    results.push_back(std::move(r));
  }
  return results;
}

// initial budget + realized PnL + unrealized PnL at this pass's prices.
// Instruments without a price contribute no unrealized PnL.
double TradingCycle::portfolioEquity(
    const std::vector<InstrumentInputs>& inputs) const {
  double unrealized = 0.0;
  for (const auto& in : inputs) {
    if (!in.available) {
      continue;
    }
    const auto it = ledgers_.find(in.code);
    if (it != ledgers_.end()) {
      unrealized += ledger::openExposure(it->second, in.price) -
                    ledger::costBasis(it->second);
    }
  }
  const auto& state = budget_.state();
  return state.initial_budget + state.cumulative_realized_pnl + unrealized;
}

bool TradingCycle::trySave(CycleReport& report) {
  try {
    store_.save(ledgers_);
    if (commit_pending_) {
      std::cout << "[TradingCycle] pending commit written\n";
    }
    commit_pending_ = false;
    return true;
  } catch (const PersistenceError& e) {
    commit_pending_ = true;
    alert(report, AlertSeverity::Critical, "",
          std::string("ledger save failed, commit pending: ") + e.what());
    return false;
  }
}

void TradingCycle::alert(CycleReport& report, AlertSeverity severity,
                         const std::string& code, const std::string& message) {
  std::cerr << "[TradingCycle] " << alertSeverityToString(severity)
            << (code.empty() ? "" : " " + code) << ": " << message << "\n";
  report.alerts.push_back({severity, code, message, io_.clock.now_ms()});
}

void TradingCycle::publish(const CycleReport& report) {
  auto send = [this](const Notification& n) {
    try {
      io_.notifications.notify(n);
    } catch (const std::exception& e) {
      std::cerr << "[TradingCycle] WARNING: notification dropped: "
                << e.what() << "\n";
    }
  };
  for (const auto& trade : report.trades) {
    send(trade);
  }
  for (const auto& a : report.alerts) {
    send(a);
  }
  send(report.summary);
}

}  // namespace staged
