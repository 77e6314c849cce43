#pragma once

#include "staged/execution/i_order_executor.hpp"
#include "staged/gateway/i_price_source.hpp"
#include "staged/time/i_time_provider.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace staged {

// -----------------------------------------------------------------------------
// PaperOrderExecutor — simulated broker
// -----------------------------------------------------------------------------
//
// @brief  Fills every order immediately at the requested price, unless an
//         outcome was scripted for that instrument.
//
// @details
// Used for paper trading and by the integration tests. Scripted outcomes are
// consumed one per order, per instrument, in FIFO order:
//
//   executor.script("005930", PaperOutcome::Reject);   // next order rejected
//   executor.script("005930", PaperOutcome::Timeout);  // the one after times out
//
// Fills are stamped with the injected time provider so simulated runs stay
// deterministic. Order IDs are "PAPER-<n>" from a process-wide counter.
//
// Thread model:
//   placeBuy/placeSell may run concurrently for different instruments;
//   script state and the fill log are guarded by mutex_.
// -----------------------------------------------------------------------------
enum class PaperOutcome {
  Fill,
  Reject,
  Timeout,
};

class PaperOrderExecutor final : public IOrderExecutor {
 public:
  PaperOrderExecutor(const ITimeProvider& time_provider,
                     int order_timeout_seconds);

  PaperOrderExecutor(const PaperOrderExecutor&) = delete;
  PaperOrderExecutor& operator=(const PaperOrderExecutor&) = delete;

  domain::OrderFill placeBuy(const std::string& code, double price,
                             std::int64_t quantity) override;
  domain::OrderFill placeSell(const std::string& code, double price,
                              std::int64_t quantity) override;

  void script(const std::string& code, PaperOutcome outcome);

  /// Every confirmed fill so far, in confirmation order.
  std::vector<domain::OrderFill> fills() const;

  /// Net quantity bought minus sold through this executor, plus any seed.
  std::int64_t holding(const std::string& code) const;

  /// Sets the simulated broker position, e.g. from the ledgers' open
  /// quantity at startup.
  void setHolding(const std::string& code, std::int64_t quantity);

 private:
  domain::OrderFill place(const std::string& code, domain::Side side,
                          double price, std::int64_t quantity);

  const ITimeProvider& time_provider_;
  const int order_timeout_seconds_;
  std::atomic<std::uint64_t> next_id_{1};

  mutable std::mutex mutex_;
  std::map<std::string, std::deque<PaperOutcome>> scripted_;
  std::vector<domain::OrderFill> fills_;
  std::map<std::string, std::int64_t> holdings_;
};

// -----------------------------------------------------------------------------
// PaperAccount — prices from a real feed, holdings from the paper broker
// -----------------------------------------------------------------------------
// In paper mode no broker reports holdings, so the orchestrator's sell clamp
// reads them from the PaperOrderExecutor instead.
// -----------------------------------------------------------------------------
class PaperAccount final : public IPriceSource {
 public:
  PaperAccount(IPriceSource& prices, const PaperOrderExecutor& executor)
      : prices_(prices), executor_(executor) {}

  double currentPrice(const std::string& code) override {
    return prices_.currentPrice(code);
  }
  std::int64_t ownedQuantity(const std::string& code) override {
    return executor_.holding(code);
  }
  bool isMarketOpen() override { return prices_.isMarketOpen(); }

 private:
  IPriceSource& prices_;
  const PaperOrderExecutor& executor_;
};

}  // namespace staged
