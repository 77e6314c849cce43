#include "staged/engine/trading_engine.hpp"
#include "staged/ledger/position_ledger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace staged {

TradingEngine::TradingEngine(config::ConfigSource& config, EngineWiring wiring)
    : config_(config), wiring_(wiring), broadcast_(*this) {}

TradingEngine::~TradingEngine() {
  stop();
}

// -----------------------------------------------------------------------------
// initialize()
// -----------------------------------------------------------------------------
void TradingEngine::initialize() {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  if (cycle_) {
    return;
  }
  const config::EngineConfig cfg = config_.current();

  // ---  1) Ledgers (CorruptState propagates to the caller) -------------------
  store_ = std::make_unique<store::LedgerStore>(cfg.store, wiring_.clock);
  std::vector<domain::Instrument> instruments;
  for (const auto& ic : cfg.instruments) {
    instruments.push_back(ic.instrument);
  }
  domain::LedgerMap ledgers = store_->load(instruments);

  // ---  2) Budget state -------------------------------------------------------
  budget_ = std::make_unique<risk::BudgetController>(cfg.budget);
  if (auto state = store_->loadBudgetState()) {
    budget_->restore(*state);
  }
  budget_->refreshEffectiveBudget();

  // ---  3) Cycle owns the working ledgers from here on -----------------------
  cycle_ = std::make_unique<TradingCycle>(
      CycleCollaborators{wiring_.prices, wiring_.valuations, wiring_.market,
                         wiring_.executor, broadcast_, wiring_.clock},
      *store_, *budget_, std::move(ledgers));

  std::cout << "[TradingEngine] initialized: " << cycle_->ledgers().size()
            << " ledger(s), generation "
            << store_->currentGeneration().value_or("<none>")
            << ", effective budget " << budget_->effectiveBudget() << "\n";
  publishStatus(std::nullopt);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Durable state ------------------------------------------------------
  initialize();

  // ---  2) IPC server ---------------------------------------------------------
  const config::EngineConfig cfg = config_.current();
  if (wiring_.enable_ipc && !cfg.endpoints.ipc_cmd_endpoint.empty() &&
      !cfg.endpoints.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cfg.endpoints.ipc_cmd_endpoint, cfg.endpoints.ipc_pub_endpoint);
    ipc_server_->start();
  }

  // ---  3) Scheduler LAST ------------------------------------------------------
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    stop_requested_ = false;
    cycle_requested_ = false;
  }
  scheduler_ = std::thread(&TradingEngine::schedulerLoop, this);
  running_ = true;

  std::cout << "[TradingEngine] started. Threads: scheduler"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Scheduler finishes its current pass --------------------------------
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    stop_requested_ = true;
  }
  schedule_cv_.notify_all();
  if (scheduler_.joinable()) {
    scheduler_.join();
  }

  // ---  2) IPC last, so the final notifications drain --------------------------
  ipc_server_.reset();

  running_ = false;
  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// runOnce()
// -----------------------------------------------------------------------------
CycleReport TradingEngine::runOnce() {
  initialize();

  std::lock_guard<std::mutex> lock(cycle_mutex_);
  if (config_.reloadIfChanged()) {
    std::cout << "[TradingEngine] configuration reloaded\n";
  }
  const config::EngineConfig cfg = config_.current();
  budget_->updateConfig(cfg.budget);

  CycleReport report = cycle_->runCycle(cfg, halted_.load());
  publishStatus(report);
  return report;
}

void TradingEngine::schedulerLoop() {
  while (true) {
    try {
      runOnce();
    } catch (const std::exception& e) {
      // The scheduler keeps going; the failed pass left the previous durable
      // generation in place.
      std::cerr << "[TradingEngine] CRITICAL: cycle failed: " << e.what()
                << "\n";
    }

    const auto interval =
        std::chrono::seconds(config_.current().cycle.interval_seconds);
    std::unique_lock<std::mutex> lock(schedule_mutex_);
    schedule_cv_.wait_for(lock, interval, [this] {
      return stop_requested_ || cycle_requested_;
    });
    if (stop_requested_) {
      break;
    }
    cycle_requested_ = false;
  }
}

void TradingEngine::halt() {
  halted_ = true;
  std::cout << "[TradingEngine] operator HALT: new entries suppressed\n";
}

void TradingEngine::resume() {
  halted_ = false;
  std::cout << "[TradingEngine] operator RESUME\n";
}

domain::LedgerMap TradingEngine::ledgers() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return ledger_snapshot_;
}

std::optional<CycleReport> TradingEngine::lastReport() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return last_report_;
}

void TradingEngine::publishStatus(const std::optional<CycleReport>& report) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  ledger_snapshot_ = cycle_->ledgers();
  budget_snapshot_ = budget_->state();
  commit_pending_snapshot_ = cycle_->commitPending();
  if (report) {
    last_report_ = report;
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    std::lock_guard<std::mutex> lock(status_mutex_);
    response["status"] = "ok";
    response["halted"] = halted_.load();
    response["commit_pending"] = commit_pending_snapshot_;
    response["budget"] = {
        {"initial", budget_snapshot_.initial_budget},
        {"effective", budget_snapshot_.effective_budget},
        {"cumulative_realized_pnl", budget_snapshot_.cumulative_realized_pnl}};

    nlohmann::json ledgers_json = nlohmann::json::array();
    for (const auto& [code, ledger] : ledger_snapshot_) {
      nlohmann::json l;
      l["code"] = code;
      l["name"] = ledger.instrument.name;
      l["open_stages"] = ledger::openStageCount(ledger);
      l["open_quantity"] = ledger::openQuantity(ledger);
      l["cost_basis"] = ledger::costBasis(ledger);
      l["realized_pnl"] = ledger.realized_pnl;
      nlohmann::json stages = nlohmann::json::array();
      for (const auto& s : ledger.stages) {
        if (s.is_open) {
          stages.push_back({{"stage", s.stage_number},
                            {"entry_price", s.entry_price},
                            {"remaining_quantity", s.remaining_quantity}});
        }
      }
      l["stages"] = std::move(stages);
      ledgers_json.push_back(std::move(l));
    }
    response["ledgers"] = std::move(ledgers_json);

    if (last_report_) {
      const auto& s = last_report_->summary;
      response["last_cycle"] = {
          {"cycle_id", s.cycle_id},
          {"outcome", cycleOutcomeToString(last_report_->outcome)},
          {"timestamp_ms", s.timestamp_ms},
          {"instruments_evaluated", s.instruments_evaluated},
          {"orders_placed", s.orders_placed},
          {"fills_applied", s.fills_applied},
          {"entries_suppressed", s.entries_suppressed},
          {"breaker_reasons", s.breaker_reasons}};
    }
  } else if (cmd == "HALT") {
    halt();
    response["status"] = "ok";
    response["response"] = "New entries halted";
  } else if (cmd == "RESUME") {
    resume();
    response["status"] = "ok";
    response["response"] = "Entries resumed";
  } else if (cmd == "CYCLE") {
    if (!running_) {
      response["status"] = "error";
      response["response"] = "Engine is not running";
    } else {
      {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        cycle_requested_ = true;
      }
      schedule_cv_.notify_all();
      response["status"] = "ok";
      response["response"] = "Cycle scheduled";
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Broadcast: every cycle notification to IPC subscribers and the extra sink
// -----------------------------------------------------------------------------
void TradingEngine::Broadcast::notify(const Notification& notification) {
  if (engine_.ipc_server_) {
    engine_.ipc_server_->notify(notification);
  }
  if (engine_.wiring_.extra_sink != nullptr) {
    engine_.wiring_.extra_sink->notify(notification);
  }
}

}  // namespace staged
