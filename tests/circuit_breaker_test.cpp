// =============================================================================
// circuit_breaker_test.cpp
// =============================================================================
// Unit tests for staged::risk::evaluateCircuitBreakers.
//
// Validates every trip condition on its own, reason reporting, and that a
// disabled breaker still honours the operator halt.
// =============================================================================

#include "staged/fees/fee_schedule.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/risk/circuit_breaker.hpp"
#include "staged/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>

namespace ledger = staged::ledger;
using staged::risk::BreakerInputs;
using staged::risk::evaluateCircuitBreakers;

namespace {

// 2023-11-14 12:00:00 UTC
constexpr std::int64_t kNoon = 1'699'963'200'000;

// One ledger per stop-loss timestamp, each with a single stopped-out stage.
staged::domain::LedgerMap stopLossesAt(std::initializer_list<std::int64_t> ts) {
  staged::domain::LedgerMap out;
  int n = 0;
  for (std::int64_t t : ts) {
    const std::string code = "C" + std::to_string(n++);
    auto l = ledger::emptyLedger({code, "", ""});
    l = ledger::openStage(l, 100.0, 10, t - 1000);
    l = ledger::closeStagePartial(l, 1, 10, 79.0, t,
                                  staged::domain::kReasonStopLoss,
                                  staged::zeroFees())
            .ledger;
    out.emplace(code, l);
  }
  return out;
}

BreakerInputs calm() {
  BreakerInputs in;
  staged::domain::MarketConditionSnapshot m;
  m.trend = staged::domain::MarketTrend::Neutral;
  m.index_change = 0.002;
  in.market = m;
  in.now_ms = kNoon;
  return in;
}

}  // namespace

TEST(CircuitBreakerTest, CalmConditionsDoNotTrip) {
  const auto status =
      evaluateCircuitBreakers({}, calm(), staged::config::CircuitBreakerConfig{});
  EXPECT_FALSE(status.tripped);
  EXPECT_TRUE(status.reasons.empty());
}

TEST(CircuitBreakerTest, MarketDeclineTrips) {
  auto in = calm();
  in.market->index_change = -0.035;
  const auto status =
      evaluateCircuitBreakers({}, in, staged::config::CircuitBreakerConfig{});
  EXPECT_TRUE(status.tripped);
  ASSERT_EQ(status.reasons.size(), 1u);
}

TEST(CircuitBreakerTest, PortfolioLossTrips) {
  auto in = calm();
  in.trailing_performance = -0.31;
  EXPECT_TRUE(
      evaluateCircuitBreakers({}, in, staged::config::CircuitBreakerConfig{})
          .tripped);
}

// -----------------------------------------------------------------------------
// Two stop-losses since UTC midnight reach the daily limit; yesterday's do
// not count toward it.
// -----------------------------------------------------------------------------
TEST(CircuitBreakerTest, DailyStopLossLimitCountsFromUtcMidnight) {
  staged::config::CircuitBreakerConfig cfg;
  cfg.daily_stop_loss_limit = 2;
  cfg.recent_stop_loss_limit = 10;

  const std::int64_t midnight = staged::utc_day_start_ms(kNoon);
  auto yesterday_and_today = stopLossesAt({midnight - 60'000, midnight + 60'000});
  EXPECT_FALSE(evaluateCircuitBreakers(yesterday_and_today, calm(), cfg).tripped);

  auto twice_today = stopLossesAt({midnight + 60'000, midnight + 120'000});
  EXPECT_TRUE(evaluateCircuitBreakers(twice_today, calm(), cfg).tripped);
}

TEST(CircuitBreakerTest, RecentWindowStopLossLimit) {
  staged::config::CircuitBreakerConfig cfg;
  cfg.daily_stop_loss_limit = 10;
  cfg.recent_stop_loss_limit = 3;
  cfg.recent_window_days = 7.0;

  const std::int64_t day = staged::days_to_ms(1);
  auto three_this_week = stopLossesAt({kNoon - 2 * day, kNoon - 3 * day,
                                       kNoon - 4 * day});
  EXPECT_TRUE(evaluateCircuitBreakers(three_this_week, calm(), cfg).tripped);

  auto one_too_old = stopLossesAt({kNoon - 2 * day, kNoon - 3 * day,
                                   kNoon - 9 * day});
  EXPECT_FALSE(evaluateCircuitBreakers(one_too_old, calm(), cfg).tripped);
}

// -----------------------------------------------------------------------------
// Operator halt always applies, even when the breaker is disabled; other
// conditions are ignored when disabled.
// -----------------------------------------------------------------------------
TEST(CircuitBreakerTest, DisabledBreakerStillHonoursOperatorHalt) {
  staged::config::CircuitBreakerConfig cfg;
  cfg.enable = false;

  auto in = calm();
  in.market->index_change = -0.10;
  EXPECT_FALSE(evaluateCircuitBreakers({}, in, cfg).tripped);

  in.operator_halt = true;
  const auto status = evaluateCircuitBreakers({}, in, cfg);
  EXPECT_TRUE(status.tripped);
  ASSERT_EQ(status.reasons.size(), 1u);
  EXPECT_EQ(status.reasons[0], "operator halt");
}

TEST(CircuitBreakerTest, EveryTrippedConditionIsReported) {
  auto in = calm();
  in.market->index_change = -0.05;
  in.trailing_performance = -0.40;
  in.operator_halt = true;
  const auto status =
      evaluateCircuitBreakers({}, in, staged::config::CircuitBreakerConfig{});
  EXPECT_EQ(status.reasons.size(), 3u);
}
