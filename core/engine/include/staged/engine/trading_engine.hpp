#pragma once

#include "staged/config/config_loader.hpp"
#include "staged/domain/budget_state.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/engine/trading_cycle.hpp"
#include "staged/execution/i_order_executor.hpp"
#include "staged/gateway/i_market_condition_source.hpp"
#include "staged/gateway/i_notification_sink.hpp"
#include "staged/gateway/i_price_source.hpp"
#include "staged/gateway/i_valuation_source.hpp"
#include "staged/network/ipc_server.hpp"
#include "staged/risk/budget_controller.hpp"
#include "staged/store/ledger_store.hpp"
#include "staged/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace staged {

/// External collaborators of the engine. References are non-owning and must
/// outlive the TradingEngine.
struct EngineWiring {
  IPriceSource& prices;
  IValuationSource& valuations;
  IMarketConditionSource& market;
  IOrderExecutor& executor;
  const ITimeProvider& clock;
  INotificationSink* extra_sink{nullptr};  // receives every notification
  bool enable_ipc{true};  // bind the IPC endpoints from configuration
};

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Process root: restores durable state, schedules evaluation passes
//         and serves operator commands.
//
// @details
// Provides a lifecycle API (initialize/start/stop) so that main() and tests
// can run the engine without wiring internals by hand.
//
// Thread layout:
//
//   scheduler thread   → TradingCycle::runCycle() every cycle.interval_seconds
//   ipc thread         → IpcServer: operator commands and notification PUB
//   caller's thread    → initialize(), start(), stop()
//
// Passes never overlap: runOnce() holds cycle_mutex_ for the whole pass, and
// the scheduler only wakes for the next one after the previous returned. A
// CYCLE command wakes the scheduler early instead of running on the IPC
// thread.
//
// The configuration file is re-read before every pass; a reload that fails
// validation keeps the previous configuration. Store settings apply on the
// next restart.
//
// Ownership:
//   TradingEngine
//    ├── store_        (unique_ptr<LedgerStore>)
//    ├── budget_       (unique_ptr<BudgetController>)
//    ├── cycle_        (unique_ptr<TradingCycle> — owns the working ledgers)
//    ├── ipc_server_   (unique_ptr<IpcServer> — optional)
//    └── broadcast_    (fan-out sink handed to the cycle)
//
// STATUS and ledgers() read a snapshot published after each pass under
// status_mutex_, never the cycle's working state.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(config::ConfigSource& config, EngineWiring wiring);

  // Destructor calls stop() for RAII safety.
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // initialize()
  // -------------------------------------------------------------------------
  //
  // @brief  Loads ledgers and budget state from the store. Idempotent.
  //
  // @throws CorruptState when a document is invalid and no older valid copy
  //         exists; the process must not trade on guessed state.
  // -------------------------------------------------------------------------
  void initialize();

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  initialize(), then brings up IPC and the scheduler thread.
  //
  // @details
  // Startup sequence:
  //   1. Restore durable state.
  //   2. Bind the IPC server (commands + notifications).
  //   3. Spawn the scheduler; its first pass runs immediately.
  //
  // Idempotent: calling start() on a running engine does nothing.
  // -------------------------------------------------------------------------
  void start();

  /// Joins the scheduler after its current pass, then stops IPC.
  void stop();

  /// Runs one pass on the calling thread, serialised with the scheduler.
  CycleReport runOnce();

  void halt();
  void resume();
  bool isHalted() const { return halted_.load(); }

  /// Copy of the ledgers as of the end of the last pass (or the load).
  domain::LedgerMap ledgers() const;

  std::optional<CycleReport> lastReport() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Operator command handler: PING, STATUS, HALT, RESUME, CYCLE.
  //
  // @return JSON string with "status" ("ok" | "error") and "response".
  //
  // Thread-safety: Called from the IPC thread; touches only atomics and the
  //                published snapshot.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

 private:
  class Broadcast final : public INotificationSink {
   public:
    explicit Broadcast(TradingEngine& engine) : engine_(engine) {}
    void notify(const Notification& notification) override;

   private:
    TradingEngine& engine_;
  };

  void schedulerLoop();
  void publishStatus(const std::optional<CycleReport>& report);

  config::ConfigSource& config_;
  EngineWiring wiring_;
  Broadcast broadcast_;

  std::unique_ptr<store::LedgerStore> store_;
  std::unique_ptr<risk::BudgetController> budget_;
  std::unique_ptr<TradingCycle> cycle_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::mutex cycle_mutex_;

  std::mutex schedule_mutex_;
  std::condition_variable schedule_cv_;
  bool stop_requested_{false};
  bool cycle_requested_{false};
  std::thread scheduler_;

  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};

  mutable std::mutex status_mutex_;
  domain::LedgerMap ledger_snapshot_;
  domain::BudgetState budget_snapshot_;
  bool commit_pending_snapshot_{false};
  std::optional<CycleReport> last_report_;
};

}  // namespace staged
