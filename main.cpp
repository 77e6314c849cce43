// -----------------------------------------------------------------------------
// staged_trader — single executable entry point.
//
// Paper trading mode:
//   1) Load and validate the engine configuration (argv[1], default
//      config/engine_config.json).
//   2) Subscribe to the quote/valuation/market feed over ZeroMQ.
//   3) Create the paper executor and restore durable state. A corrupt store
//      with no valid backup stops the process here with a non-zero exit.
//   4) Seed the simulated broker holdings from the restored ledgers.
//   5) Start the engine (scheduler + IPC) and wait for Ctrl-C.
//   6) Shut down cleanly.
//
// Thread layout:
//   main thread        → waits for SIGINT
//   scheduler thread   → TradingEngine passes
//   ipc thread         → operator commands and notification PUB
//   feed thread        → ZmqQuoteFeed receive loop
//
// Exit codes: 0 clean shutdown, 1 corrupt state or startup failure,
// 2 invalid configuration.
// -----------------------------------------------------------------------------

#include "staged/config/config_loader.hpp"
#include "staged/domain/errors.hpp"
#include "staged/engine/trading_engine.hpp"
#include "staged/execution/paper_order_executor.hpp"
#include "staged/gateway/zmq_quote_feed.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler.
// The only global in the program. Set once by SIGINT/SIGTERM, polled by the
// main thread.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

// -----------------------------------------------------------------------------
// shutdown_handler
// -----------------------------------------------------------------------------
// @brief  POSIX signal handler for SIGINT and SIGTERM.
//
// @details
// Only stores to a sig_atomic_t. main() notices within one poll interval and
// runs engine.stop(), which lets the current pass finish before joining.
// -----------------------------------------------------------------------------
static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested = 1;
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/engine_config.json";

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  std::unique_ptr<staged::config::ConfigSource> config;
  try {
    config = std::make_unique<staged::config::ConfigSource>(config_path);
  } catch (const staged::ConfigError& e) {
    std::cerr << "[main] FATAL: invalid configuration " << config_path << ": "
              << e.what() << "\n";
    return 2;
  }
  const staged::config::EngineConfig cfg = config->current();

  staged::LiveTimeProvider clock;

  // -------------------------------------------------------------------------
  // 2) Market data feed.
  // -------------------------------------------------------------------------
  staged::ZmqQuoteFeed feed(cfg.endpoints.feed_endpoint, clock,
                            cfg.endpoints.max_quote_age_seconds);

  // -------------------------------------------------------------------------
  // 3) Paper executor and the engine.
  // PaperAccount reports holdings from the executor, so sells are clamped
  // to what the simulated broker actually holds.
  // -------------------------------------------------------------------------
  staged::PaperOrderExecutor executor(clock, cfg.cycle.order_timeout_seconds);
  staged::PaperAccount account(feed, executor);

  staged::TradingEngine engine(
      *config, staged::EngineWiring{account, feed, feed, executor, clock});

  try {
    engine.initialize();
  } catch (const staged::CorruptState& e) {
    std::cerr << "[main] FATAL: persisted state is corrupt and no valid "
                 "backup exists: "
              << e.what() << "\n"
              << "[main] Refusing to start. Inspect " << cfg.store.root
              << " by hand.\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Seed simulated holdings from the restored ledgers.
  // -------------------------------------------------------------------------
  for (const auto& [code, ledger] : engine.ledgers()) {
    executor.setHolding(code, staged::ledger::openQuantity(ledger));
  }

  // -------------------------------------------------------------------------
  // 5) Start everything and wait for a shutdown signal.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  try {
    feed.start();
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] FATAL: cannot bind endpoints: " << e.what() << "\n";
    engine.stop();
    feed.stop();
    return 1;
  }

  std::cout << "[main] feed " << cfg.endpoints.feed_endpoint << ", commands "
            << cfg.endpoints.ipc_cmd_endpoint << ", notifications "
            << cfg.endpoints.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: engine first (finishes its pass), then the feed.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();
  feed.stop();

  return 0;
}
