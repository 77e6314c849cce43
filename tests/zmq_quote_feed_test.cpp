// =============================================================================
// zmq_quote_feed_test.cpp
// =============================================================================
// Unit tests for staged::ZmqQuoteFeed's message cache.
//
// Validates:
//   - Quote, valuation, market and session messages update the cache
//   - Quotes and market snapshots go stale; valuations do not
//   - Malformed messages throw and leave the cache unchanged
//   - Holdings survive quotes that omit them
//   - One live publish reaches the cache through the SUB socket
// =============================================================================

#include "staged/domain/errors.hpp"
#include "staged/gateway/zmq_quote_feed.hpp"
#include "staged/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <thread>

using nlohmann::json;

namespace {
constexpr std::int64_t kT0 = 1'700'000'000'000;
}  // namespace

class ZmqQuoteFeedTest : public ::testing::Test {
 protected:
  staged::SimulationTimeProvider clock{kT0};
  staged::ZmqQuoteFeed feed{"tcp://127.0.0.1:57611", clock, 30};
};

// -----------------------------------------------------------------------------
// 1. Nothing received yet.
// -----------------------------------------------------------------------------
TEST_F(ZmqQuoteFeedTest, EmptyCacheIsUnavailable) {
  EXPECT_THROW(feed.currentPrice("005930"), staged::Unavailable);
  EXPECT_THROW(feed.ownedQuantity("005930"), staged::Unavailable);
  EXPECT_THROW(feed.fairValueSignal("005930"), staged::Unavailable);
  EXPECT_THROW(feed.marketCondition(), staged::Unavailable);
  EXPECT_FALSE(feed.isMarketOpen());
}

// -----------------------------------------------------------------------------
// 2. Each message type lands in the cache.
// -----------------------------------------------------------------------------
TEST_F(ZmqQuoteFeedTest, MessagesUpdateCache) {
  feed.applyMessage({{"type", "quote"}, {"code", "005930"}, {"price", 71200},
                     {"timestamp_ms", kT0}, {"owned_quantity", 120}});
  feed.applyMessage({{"type", "valuation"}, {"code", "005930"},
                     {"fair_value", 82000}, {"confidence", 0.8},
                     {"timestamp_ms", kT0}});
  feed.applyMessage({{"type", "market"}, {"trend", "downtrend"},
                     {"index_change", -0.012}, {"volatility", 0.021},
                     {"timestamp_ms", kT0}});

  EXPECT_DOUBLE_EQ(feed.currentPrice("005930"), 71200.0);
  EXPECT_EQ(feed.ownedQuantity("005930"), 120);

  const auto signal = feed.fairValueSignal("005930");
  EXPECT_DOUBLE_EQ(signal.fair_value, 82000.0);
  EXPECT_DOUBLE_EQ(signal.confidence, 0.8);

  const auto market = feed.marketCondition();
  EXPECT_EQ(market.trend, staged::domain::MarketTrend::Downtrend);
  EXPECT_DOUBLE_EQ(market.index_change, -0.012);

  // Fresh quote counts as an open market until a session message arrives.
  EXPECT_TRUE(feed.isMarketOpen());
  feed.applyMessage({{"type", "session"}, {"open", false}});
  EXPECT_FALSE(feed.isMarketOpen());
}

TEST_F(ZmqQuoteFeedTest, ValuationConfidenceDefaultsToOne) {
  feed.applyMessage({{"type", "valuation"}, {"code", "000660"},
                     {"fair_value", 150000}, {"timestamp_ms", kT0}});
  EXPECT_DOUBLE_EQ(feed.fairValueSignal("000660").confidence, 1.0);
}

// -----------------------------------------------------------------------------
// 3. Staleness.
// -----------------------------------------------------------------------------
TEST_F(ZmqQuoteFeedTest, QuotesAndMarketGoStaleValuationsDoNot) {
  feed.applyMessage({{"type", "quote"}, {"code", "005930"}, {"price", 71200},
                     {"timestamp_ms", kT0}});
  feed.applyMessage({{"type", "valuation"}, {"code", "005930"},
                     {"fair_value", 82000}, {"timestamp_ms", kT0}});
  feed.applyMessage({{"type", "market"}, {"trend", "neutral"},
                     {"index_change", 0.0}, {"timestamp_ms", kT0}});

  clock.advance_by(30'000);
  EXPECT_NO_THROW(feed.currentPrice("005930"));

  clock.advance_by(1);
  EXPECT_THROW(feed.currentPrice("005930"), staged::Unavailable);
  EXPECT_THROW(feed.marketCondition(), staged::Unavailable);
  EXPECT_FALSE(feed.isMarketOpen());
  EXPECT_NO_THROW(feed.fairValueSignal("005930"));
}

// -----------------------------------------------------------------------------
// 4. Holdings carry over quotes that omit them.
// -----------------------------------------------------------------------------
TEST_F(ZmqQuoteFeedTest, HoldingsPersistAcrossQuotes) {
  feed.applyMessage({{"type", "quote"}, {"code", "005930"}, {"price", 71200},
                     {"timestamp_ms", kT0}});
  EXPECT_THROW(feed.ownedQuantity("005930"), staged::Unavailable);

  feed.applyMessage({{"type", "quote"}, {"code", "005930"}, {"price", 71300},
                     {"timestamp_ms", kT0}, {"owned_quantity", 40}});
  feed.applyMessage({{"type", "quote"}, {"code", "005930"}, {"price", 71400},
                     {"timestamp_ms", kT0 + 1000}});
  EXPECT_EQ(feed.ownedQuantity("005930"), 40);
  EXPECT_DOUBLE_EQ(feed.currentPrice("005930"), 71400.0);
}

// -----------------------------------------------------------------------------
// 5. Malformed messages.
// -----------------------------------------------------------------------------
TEST_F(ZmqQuoteFeedTest, MalformedMessagesThrowWithoutSideEffects) {
  EXPECT_THROW(feed.applyMessage({{"code", "005930"}}), json::exception);
  EXPECT_THROW(feed.applyMessage({{"type", "trade"}}), std::invalid_argument);
  EXPECT_THROW(feed.applyMessage({{"type", "quote"}, {"code", "005930"},
                                  {"price", -5}, {"timestamp_ms", kT0}}),
               std::invalid_argument);
  EXPECT_THROW(feed.applyMessage({{"type", "quote"}, {"code", "005930"},
                                  {"price", "high"}, {"timestamp_ms", kT0}}),
               json::exception);
  EXPECT_THROW(feed.applyMessage({{"type", "valuation"}, {"code", "005930"},
                                  {"fair_value", 0}, {"timestamp_ms", kT0}}),
               std::invalid_argument);

  EXPECT_THROW(feed.currentPrice("005930"), staged::Unavailable);
  EXPECT_THROW(feed.fairValueSignal("005930"), staged::Unavailable);
}

// -----------------------------------------------------------------------------
// 6. End to end through a PUB socket.
// -----------------------------------------------------------------------------
TEST(ZmqQuoteFeedLiveTest, PublishedQuoteReachesCache) {
  const std::string endpoint = "tcp://127.0.0.1:57612";
  staged::SimulationTimeProvider clock{kT0};

  zmq::context_t ctx(1);
  zmq::socket_t pub(ctx, zmq::socket_type::pub);
  pub.set(zmq::sockopt::linger, 0);
  pub.bind(endpoint);

  staged::ZmqQuoteFeed feed(endpoint, clock, 60);
  feed.start();

  const std::string quote =
      json{{"type", "quote"}, {"code", "035420"}, {"price", 201000},
           {"timestamp_ms", kT0}}
          .dump();

  // PUB drops messages until the subscription propagates.
  bool received = false;
  for (int attempt = 0; attempt < 40 && !received; ++attempt) {
    pub.send(zmq::buffer(quote), zmq::send_flags::none);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    try {
      received = feed.currentPrice("035420") == 201000.0;
    } catch (const staged::Unavailable&) {
    }
  }
  EXPECT_TRUE(received) << "quote never reached the feed cache";

  feed.stop();
}
