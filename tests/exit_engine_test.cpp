// =============================================================================
// exit_engine_test.cpp
// =============================================================================
// Unit tests for staged::risk::ExitEngine.
//
// Validates:
//   - 10000 → 7900 with a 20% stop is a STOP_LOSS of the whole stage
//   - Rule precedence: overvalued > stop-loss > profit target > hold
//   - Partial sell quantity: floored ratio, at least one share
//   - Strong-uptrend dampening only for flagged instruments
// =============================================================================

#include "staged/ledger/position_ledger.hpp"
#include "staged/risk/exit_engine.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>

namespace ledger = staged::ledger;
using staged::domain::ExitAction;
using staged::domain::InstrumentLedger;
using staged::domain::MarketConditionSnapshot;
using staged::domain::MarketTrend;

namespace {

InstrumentLedger ledgerWith(std::initializer_list<std::pair<double, int>> stages) {
  auto l = ledger::emptyLedger({"035420", "NAVER", "internet"});
  std::int64_t ts = 1'700'000'000'000;
  for (const auto& [price, qty] : stages) {
    l = ledger::openStage(l, price, qty, ts++);
  }
  return l;
}

MarketConditionSnapshot neutral() {
  MarketConditionSnapshot m;
  m.trend = MarketTrend::Neutral;
  return m;
}

}  // namespace

class ExitEngineTest : public ::testing::Test {
 protected:
  staged::risk::ExitEngine engine{staged::config::ExitConfig{}};
};

// -----------------------------------------------------------------------------
// 1. Entry 10000, price 7900: -21% breaches the 20% stop.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, TwentyOnePercentLossIsStopLoss) {
  const auto l = ledgerWith({{10000.0, 12}});
  const auto d = engine.decide(l, 7900.0, 10000.0, neutral(), false);

  EXPECT_EQ(d.action, ExitAction::StopLoss);
  EXPECT_EQ(d.stage_number, 1);
  EXPECT_EQ(d.quantity, 12);
  EXPECT_EQ(d.reason, staged::domain::kReasonStopLoss);
  EXPECT_STREQ(staged::domain::exitActionToString(d.action), "STOP_LOSS");
}

// -----------------------------------------------------------------------------
// 2. Overvaluation wins over a simultaneous stop-loss.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, OvervaluedTakesPrecedenceOverStopLoss) {
  const auto l = ledgerWith({{10000.0, 12}});
  const auto d = engine.decide(l, 7900.0, 7000.0, neutral(), false);

  EXPECT_EQ(d.action, ExitAction::FullSell);
  EXPECT_EQ(d.quantity, 12);
  EXPECT_EQ(d.reason, staged::domain::kReasonOvervalued);
}

// -----------------------------------------------------------------------------
// 3. A stop-loss on any stage beats a profit target on another.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, StopLossOnAnyStageBeatsProfitTarget) {
  const auto l = ledgerWith({{100.0, 10}, {70.0, 10}});
  const auto d = engine.decide(l, 79.0, 200.0, neutral(), false);

  EXPECT_EQ(d.action, ExitAction::StopLoss);
  EXPECT_EQ(d.stage_number, 1);
}

// -----------------------------------------------------------------------------
// 4. Profit target: the cheapest stage is visited first; 40% of 10 = 4.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, ProfitTargetSellsRatioOfCheapestStage) {
  const auto l = ledgerWith({{100.0, 10}, {90.0, 10}});
  const auto d = engine.decide(l, 96.0, 200.0, neutral(), false);

  EXPECT_EQ(d.action, ExitAction::PartialSell);
  EXPECT_EQ(d.stage_number, 2);
  EXPECT_EQ(d.quantity, 4);
  EXPECT_EQ(d.reason, staged::domain::kReasonProfitTarget);
}

TEST_F(ExitEngineTest, PartialSellSellsAtLeastOneShare) {
  const auto l = ledgerWith({{100.0, 1}});
  const auto d = engine.decide(l, 110.0, 200.0, neutral(), false);
  EXPECT_EQ(d.action, ExitAction::PartialSell);
  EXPECT_EQ(d.quantity, 1);
}

// -----------------------------------------------------------------------------
// 5. Strong uptrend dampens the ratio only when the instrument opts in.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, StrongUptrendDampensFlaggedInstruments) {
  const auto l = ledgerWith({{100.0, 10}});
  MarketConditionSnapshot up;
  up.trend = MarketTrend::StrongUptrend;

  EXPECT_EQ(engine.decide(l, 110.0, 200.0, up, false).quantity, 4);
  EXPECT_EQ(engine.decide(l, 110.0, 200.0, up, true).quantity, 2);
}

// -----------------------------------------------------------------------------
// 6. Nothing to do: inside every threshold, or no open stage.
// -----------------------------------------------------------------------------
TEST_F(ExitEngineTest, HoldsInsideThresholds) {
  const auto l = ledgerWith({{100.0, 10}});
  EXPECT_EQ(engine.decide(l, 103.0, 120.0, neutral(), false).action,
            ExitAction::Hold);

  const auto empty = ledger::emptyLedger({"035420", "", ""});
  EXPECT_EQ(engine.decide(empty, 10.0, 5.0, neutral(), false).action,
            ExitAction::Hold);
}

// -----------------------------------------------------------------------------
// 7. Per-stage profit targets; later stages reuse the last one.
// -----------------------------------------------------------------------------
TEST(ExitEngineTargetsTest, PerStageTargets) {
  staged::config::ExitConfig cfg;
  cfg.profit_targets = {0.05, 0.10};
  const staged::risk::ExitEngine engine(cfg);

  EXPECT_DOUBLE_EQ(engine.profitTarget(1), 0.05);
  EXPECT_DOUBLE_EQ(engine.profitTarget(2), 0.10);
  EXPECT_DOUBLE_EQ(engine.profitTarget(5), 0.10);

  // Stage 2 at +7% holds under a 10% target.
  auto l = ledgerWith({{110.0, 10}, {100.0, 10}});
  EXPECT_EQ(engine.decide(l, 107.0, 300.0, neutral(), false).action,
            ExitAction::Hold);
}
