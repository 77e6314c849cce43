#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/domain/order_fill.hpp"
#include "staged/events/notification.hpp"
#include "staged/execution/i_order_executor.hpp"
#include "staged/gateway/i_market_condition_source.hpp"
#include "staged/gateway/i_notification_sink.hpp"
#include "staged/gateway/i_price_source.hpp"
#include "staged/gateway/i_valuation_source.hpp"
#include "staged/risk/budget_controller.hpp"
#include "staged/store/ledger_store.hpp"
#include "staged/time/i_time_provider.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace staged {

/// Non-owning references to everything a cycle talks to. All referents must
/// outlive the TradingCycle.
struct CycleCollaborators {
  IPriceSource& prices;
  IValuationSource& valuations;
  IMarketConditionSource& market;
  IOrderExecutor& executor;
  INotificationSink& notifications;
  const ITimeProvider& clock;
};

enum class CycleOutcome {
  Completed,
  MarketClosed,   // nothing evaluated
  CommitPending,  // the retried save of the previous pass failed again
};

const char* cycleOutcomeToString(CycleOutcome outcome);

struct CycleReport {
  CycleOutcome outcome{CycleOutcome::Completed};
  CycleSummaryEvent summary;
  std::vector<TradeExecutedEvent> trades;
  std::vector<RiskAlertEvent> alerts;
};

// -----------------------------------------------------------------------------
// TradingCycle
// -----------------------------------------------------------------------------
//
// @brief  One evaluation pass over every configured instrument: gather
//         signals, decide, place orders, apply confirmed fills, persist.
//
// @details
// Pass structure (runCycle):
//   1. Retry a save left pending by the previous pass; no new pass runs
//      while it keeps failing.
//   2. Skip entirely while the market is closed.
//   3. Gather price, broker holdings and fair value per instrument
//      concurrently. An instrument with any input unavailable gets no
//      decision this pass.
//   4. Market condition; unavailable means trend Unknown and no entries.
//   5. Circuit breakers.
//   6. Effective budget and the exposure cap on new entries.
//   7. Decide per instrument in code order: an exit first; with HOLD and
//      entries allowed, size the next stage.
//   8. Place the planned orders concurrently.
//   9. Apply confirmed fills. A fill the ledger refuses restores that
//      instrument's pre-pass ledger and raises a critical alert.
//  10. Persist every ledger with one store save.
//  11. Update and persist the budget state.
//  12. Publish trades, alerts and the summary.
//
// A rejected or timed-out order never touches the ledger. Quantities
// reported by the broker cap every sell.
//
// Thread model:
//   runCycle() must not be called concurrently; TradingEngine serialises
//   passes on its scheduler thread. The gathering and order phases fan out
//   with std::async and join before the pass moves on.
// -----------------------------------------------------------------------------
class TradingCycle {
 public:
  TradingCycle(CycleCollaborators collaborators, store::LedgerStore& store,
               risk::BudgetController& budget, domain::LedgerMap ledgers);

  TradingCycle(const TradingCycle&) = delete;
  TradingCycle& operator=(const TradingCycle&) = delete;

  CycleReport runCycle(const config::EngineConfig& config, bool operator_halt);

  /// In-memory ledgers; authoritative even while a save is pending.
  const domain::LedgerMap& ledgers() const { return ledgers_; }

  bool commitPending() const { return commit_pending_; }

  std::int64_t cyclesRun() const { return cycle_id_; }

 private:
  struct InstrumentInputs {
    std::string code;
    bool available{false};
    double price{0.0};
    std::int64_t owned_quantity{0};
    FairValueSignal valuation;
  };

  struct PlannedOrder {
    std::string code;
    domain::Side side{domain::Side::Buy};
    double price{0.0};
    std::int64_t quantity{0};
    int stage_number{0};
    std::string reason;
  };

  struct OrderResult {
    PlannedOrder order;
    bool filled{false};
    domain::OrderFill fill;
  };

  void ensureConfiguredInstruments(const config::EngineConfig& config);
  std::vector<InstrumentInputs> gatherInputs(
      const config::EngineConfig& config, CycleReport& report);
  std::vector<OrderResult> placeOrders(const std::vector<PlannedOrder>& orders,
                                       CycleReport& report);
  double portfolioEquity(const std::vector<InstrumentInputs>& inputs) const;
  bool trySave(CycleReport& report);
  void alert(CycleReport& report, AlertSeverity severity,
             const std::string& code, const std::string& message);
  void publish(const CycleReport& report);

  CycleCollaborators io_;
  store::LedgerStore& store_;
  risk::BudgetController& budget_;

  domain::LedgerMap ledgers_;
  bool commit_pending_{false};
  std::int64_t cycle_id_{0};
};

}  // namespace staged
