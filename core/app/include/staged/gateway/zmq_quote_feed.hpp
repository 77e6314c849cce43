#pragma once

#include "staged/domain/market_condition.hpp"
#include "staged/gateway/i_market_condition_source.hpp"
#include "staged/gateway/i_price_source.hpp"
#include "staged/gateway/i_valuation_source.hpp"
#include "staged/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace staged {

// -----------------------------------------------------------------------------
// ZmqQuoteFeed — ZeroMQ SUB adapter for prices, valuations and market state
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to a JSON feed, caches the latest message of each kind,
//         and serves the cache through IPriceSource, IValuationSource and
//         IMarketConditionSource.
//
// @details
// Expected message format (one JSON object per ZMQ message):
//
//   {"type":"quote","code":"005930","price":71200,"timestamp_ms":...,
//    "owned_quantity":120}                       // owned_quantity optional
//   {"type":"valuation","code":"005930","fair_value":82000,
//    "confidence":0.8,"timestamp_ms":...}        // confidence optional
//   {"type":"market","trend":"downtrend","index_change":-0.012,
//    "volatility":0.021,"timestamp_ms":...}
//   {"type":"session","open":true}
//
// Malformed messages are logged and skipped; they never stop the loop.
//
// Freshness:
//   Quotes and market snapshots older than max_age_seconds (measured with
//   the injected clock against the message timestamp) are Unavailable.
//   Valuations are point-in-time truth and do not expire.
//
// Session state:
//   isMarketOpen() follows the last "session" message. Before any session
//   message arrives, the market counts as open while at least one quote is
//   fresh.
//
// Thread model:
//   The receive loop runs on the feed's own thread (start()/stop()). Cache
//   reads happen concurrently from the cycle's std::async tasks; all cache
//   access holds mutex_.
// -----------------------------------------------------------------------------
class ZmqQuoteFeed final : public IPriceSource,
                           public IValuationSource,
                           public IMarketConditionSource {
 public:
  ZmqQuoteFeed(std::string endpoint, const ITimeProvider& clock,
               int max_age_seconds);
  ~ZmqQuoteFeed() override;

  ZmqQuoteFeed(const ZmqQuoteFeed&) = delete;
  ZmqQuoteFeed& operator=(const ZmqQuoteFeed&) = delete;

  /// Connects the SUB socket and spawns the receive thread.
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // applyMessage(msg)
  // -------------------------------------------------------------------------
  // @brief  Folds one decoded feed message into the cache.
  //
  // @throws nlohmann::json::exception or std::invalid_argument when the
  //         message is malformed; the cache is unchanged in that case.
  // -------------------------------------------------------------------------
  void applyMessage(const nlohmann::json& msg);

  double currentPrice(const std::string& code) override;
  std::int64_t ownedQuantity(const std::string& code) override;
  bool isMarketOpen() override;

  FairValueSignal fairValueSignal(const std::string& code) override;

  domain::MarketConditionSnapshot marketCondition() override;

 private:
  static constexpr int kRecvTimeoutMs = 100;

  struct Quote {
    double price{0.0};
    std::optional<std::int64_t> owned_quantity;
    std::int64_t timestamp_ms{0};
  };

  void run();
  bool isFresh(std::int64_t timestamp_ms) const;

  std::string endpoint_;
  const ITimeProvider& clock_;
  const std::int64_t max_age_ms_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  std::map<std::string, Quote> quotes_;
  std::map<std::string, FairValueSignal> valuations_;
  std::optional<domain::MarketConditionSnapshot> market_;
  std::optional<bool> session_open_;
};

}  // namespace staged
