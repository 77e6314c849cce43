// =============================================================================
// ledger_store_test.cpp
// =============================================================================
// Unit tests for staged::store::LedgerStore.
//
// Validates:
//   - A saved ledger set loads back equal, including sell history
//   - Leftovers of crashed saves are ignored on load and removed on save
//   - A corrupt or missing current document is recovered from an older
//     generation; with no valid backup the load fails with CorruptState
//   - Instruments absent from a save are carried forward
//   - Retention keeps at most retention_count generations, and only
//     prunes after a save lands
//   - Budget state round trip and recovery from its backup
//   - Invalid ledgers are refused and leave CURRENT untouched
// =============================================================================

#include "staged/domain/errors.hpp"
#include "staged/fees/fee_schedule.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/store/ledger_store.hpp"
#include "staged/time/simulation_time_provider.hpp"
#include "staged/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace ledger = staged::ledger;
using staged::domain::Instrument;
using staged::domain::InstrumentLedger;
using staged::domain::LedgerMap;

namespace {

const Instrument kSamsung{"005930", "Samsung Electronics", "tech"};
const Instrument kHynix{"000660", "SK Hynix", "tech"};

void overwrite(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

// Five stages, one of them partially sold, one fully closed.
InstrumentLedger busyLedger(std::int64_t t0) {
  auto l = ledger::emptyLedger(kSamsung);
  l = ledger::openStage(l, 80000.0, 10, t0);
  l = ledger::openStage(l, 76000.0, 12, t0 + 1000);
  l = ledger::openStage(l, 72000.0, 14, t0 + 2000);
  l = ledger::openStage(l, 69000.0, 16, t0 + 3000);
  l = ledger::openStage(l, 65000.0, 20, t0 + 4000);
  l = ledger::closeStagePartial(l, 2, 5, 84000.0, t0 + 5000,
                                staged::domain::kReasonProfitTarget,
                                staged::zeroFees())
          .ledger;
  l = ledger::closeStagePartial(l, 5, 20, 71500.0, t0 + 6000,
                                staged::domain::kReasonProfitTarget,
                                staged::zeroFees())
          .ledger;
  l.drop_requirements[2] = 0.04;
  return l;
}

InstrumentLedger oneStage(const Instrument& instrument, double price,
                          std::int64_t ts) {
  return ledger::openStage(ledger::emptyLedger(instrument), price, 10, ts);
}

}  // namespace

class LedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("staged_ledger_store_" +
             std::string(::testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()));
    fs::remove_all(root_);
    config_.root = root_.string();
    config_.retention_count = 3;
    config_.retention_hours = 72.0;
  }

  void TearDown() override { fs::remove_all(root_); }

  staged::store::LedgerStore makeStore() {
    return staged::store::LedgerStore(config_, clock_);
  }

  // Saves and moves the clock on so generation names differ.
  void saveAndTick(staged::store::LedgerStore& store, const LedgerMap& map) {
    store.save(map);
    clock_.advance_by(1000);
  }

  fs::path root_;
  staged::config::StoreConfig config_;
  staged::SimulationTimeProvider clock_{1'700'000'000'000};
};

// -----------------------------------------------------------------------------
// 1. Round trip and a fresh store.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, MissingStoreYieldsEmptyLedgers) {
  auto store = makeStore();
  const auto loaded = store.load({kSamsung, kHynix});
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_TRUE(loaded.at("005930").stages.empty());
  EXPECT_TRUE(loaded.at("000660").stages.empty());
  EXPECT_FALSE(store.currentGeneration().has_value());
}

TEST_F(LedgerStoreTest, SavedLedgersLoadBackEqual) {
  const auto busy = busyLedger(clock_.now_ms());
  ASSERT_FALSE(ledger::checkInvariants(busy).has_value());

  auto store = makeStore();
  saveAndTick(store, {{"005930", busy}});

  auto reopened = makeStore();
  const auto loaded = reopened.load({kSamsung, kHynix});
  EXPECT_EQ(loaded.at("005930"), busy);
  EXPECT_TRUE(loaded.at("000660").stages.empty());
}

TEST_F(LedgerStoreTest, SavingUnchangedLedgersIsIdempotent) {
  const LedgerMap map{{"005930", busyLedger(clock_.now_ms())}};
  auto store = makeStore();
  saveAndTick(store, map);
  const auto first = store.currentGeneration();
  saveAndTick(store, map);

  EXPECT_NE(store.currentGeneration(), first);
  EXPECT_EQ(store.load({kSamsung}), map);
}

// -----------------------------------------------------------------------------
// 2. Crashed saves: staging directories and uncommitted generations.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, CrashedSaveLeftoversAreIgnoredAndPruned) {
  const LedgerMap v1{{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}};
  auto store = makeStore();
  saveAndTick(store, v1);

  // A staging directory and a renamed-but-never-committed generation.
  const fs::path staging = root_ / "staging-gen-1800000000000-0";
  const fs::path uncommitted = root_ / "gen-1800000000000-1";
  fs::create_directories(staging);
  fs::create_directories(uncommitted);
  overwrite(staging / "005930.json", "{ not json");
  overwrite(uncommitted / "005930.json", "{ not json");
  overwrite(uncommitted / "MANIFEST.json", R"({"documents": ["005930"]})");

  EXPECT_EQ(makeStore().load({kSamsung}), v1);

  const LedgerMap v2{{"005930", oneStage(kSamsung, 90.0, clock_.now_ms())}};
  saveAndTick(store, v2);
  EXPECT_FALSE(fs::exists(staging));
  EXPECT_FALSE(fs::exists(uncommitted));
  EXPECT_EQ(makeStore().load({kSamsung}), v2);
}

// -----------------------------------------------------------------------------
// 3. Recovery from older generations.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, CorruptDocumentRecoveredFromPreviousGeneration) {
  const LedgerMap v1{{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}};
  auto store = makeStore();
  saveAndTick(store, v1);
  LedgerMap v2 = v1;
  v2["005930"] = ledger::openStage(v2["005930"], 90.0, 5, clock_.now_ms());
  saveAndTick(store, v2);

  overwrite(root_ / *store.currentGeneration() / "005930.json",
            R"({"schema": 1, "code": "005930", "stages": "garbage"})");

  EXPECT_EQ(makeStore().load({kSamsung}), v1);
}

TEST_F(LedgerStoreTest, CorruptDocumentWithoutBackupIsFatal) {
  auto store = makeStore();
  saveAndTick(store, {{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}});

  overwrite(root_ / *store.currentGeneration() / "005930.json", "{ truncated");

  auto reopened = makeStore();
  EXPECT_THROW(reopened.load({kSamsung}), staged::CorruptState);
}

TEST_F(LedgerStoreTest, IncompleteCurrentGenerationFallsBack) {
  const LedgerMap v1{{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}};
  auto store = makeStore();
  saveAndTick(store, v1);
  saveAndTick(store, {{"005930", oneStage(kSamsung, 95.0, clock_.now_ms())}});

  fs::remove(root_ / *store.currentGeneration() / "MANIFEST.json");

  EXPECT_EQ(makeStore().load({kSamsung}), v1);
}

// -----------------------------------------------------------------------------
// 4. Instruments missing from a save keep their last document.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, AbsentInstrumentsAreCarriedForward) {
  const auto samsung = oneStage(kSamsung, 100.0, clock_.now_ms());
  const auto hynix = oneStage(kHynix, 200.0, clock_.now_ms());

  auto store = makeStore();
  saveAndTick(store, {{"005930", samsung}, {"000660", hynix}});
  const auto updated = ledger::openStage(samsung, 92.0, 3, clock_.now_ms());
  saveAndTick(store, {{"005930", updated}});

  const auto loaded = makeStore().load({kSamsung, kHynix});
  EXPECT_EQ(loaded.at("005930"), updated);
  EXPECT_EQ(loaded.at("000660"), hynix);
}

// -----------------------------------------------------------------------------
// 5. Retention.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, RetentionCountBoundsGenerations) {
  auto store = makeStore();
  for (int i = 0; i < 5; ++i) {
    saveAndTick(store,
                {{"005930", oneStage(kSamsung, 100.0 + i, clock_.now_ms())}});
  }
  const auto generations = store.listGenerations();
  ASSERT_EQ(generations.size(), 3u);
  EXPECT_EQ(generations.back(), *store.currentGeneration());
}

TEST_F(LedgerStoreTest, RetentionAgeDropsOldBackups) {
  auto store = makeStore();
  saveAndTick(store, {{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}});
  clock_.advance_by(staged::hours_to_ms(100.0));
  saveAndTick(store, {{"005930", oneStage(kSamsung, 101.0, clock_.now_ms())}});

  EXPECT_EQ(store.listGenerations().size(), 1u);
}

// Backups are only pruned once a new generation is durable: a save that
// fails long after the last one leaves every backup in place.
TEST_F(LedgerStoreTest, FailedSaveKeepsAgedBackups) {
  auto store = makeStore();
  for (int i = 0; i < 3; ++i) {
    saveAndTick(store,
                {{"005930", oneStage(kSamsung, 100.0 + i, clock_.now_ms())}});
  }
  const auto before = store.currentGeneration();
  ASSERT_EQ(store.listGenerations().size(), 3u);

  clock_.advance_by(staged::hours_to_ms(100.0));
  const Instrument unwritable{"x/y", "Unwritable", "none"};
  EXPECT_THROW(
      store.save({{"x/y", oneStage(unwritable, 10.0, clock_.now_ms())}}),
      staged::PersistenceError);

  EXPECT_EQ(store.listGenerations().size(), 3u);
  EXPECT_EQ(store.currentGeneration(), before);
  EXPECT_DOUBLE_EQ(
      makeStore().load({kSamsung}).at("005930").stages[0].entry_price, 102.0);

  // The next successful save applies the age limit.
  saveAndTick(store, {{"005930", oneStage(kSamsung, 103.0, clock_.now_ms())}});
  EXPECT_EQ(store.listGenerations().size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Budget state.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, BudgetStateRoundTripAndBackupRecovery) {
  auto store = makeStore();
  EXPECT_FALSE(store.loadBudgetState().has_value());

  staged::domain::BudgetState first;
  first.initial_budget = 1'000'000.0;
  first.effective_budget = 1'100'000.0;
  first.cumulative_realized_pnl = 25'000.0;
  first.performance_window = {{1'700'000'000'000, 1'000'000.0},
                              {1'700'000'060'000, 1'025'000.0}};
  store.saveBudgetState(first);

  auto loaded = store.loadBudgetState();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_DOUBLE_EQ(loaded->effective_budget, 1'100'000.0);
  EXPECT_DOUBLE_EQ(loaded->cumulative_realized_pnl, 25'000.0);
  ASSERT_EQ(loaded->performance_window.size(), 2u);
  EXPECT_DOUBLE_EQ(loaded->performance_window[1].equity, 1'025'000.0);

  staged::domain::BudgetState second = first;
  second.effective_budget = 900'000.0;
  store.saveBudgetState(second);

  overwrite(root_ / "budget_state.json", "{ torn write");
  loaded = store.loadBudgetState();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_DOUBLE_EQ(loaded->effective_budget, 1'100'000.0);

  overwrite(root_ / "budget_state.json.bak", "[]");
  EXPECT_THROW(store.loadBudgetState(), staged::CorruptState);
}

// -----------------------------------------------------------------------------
// 7. Refused saves.
// -----------------------------------------------------------------------------
TEST_F(LedgerStoreTest, InvalidLedgerIsNotPersisted) {
  auto store = makeStore();
  saveAndTick(store, {{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}});
  const auto before = store.currentGeneration();

  auto broken = oneStage(kSamsung, 100.0, clock_.now_ms());
  broken.stages[0].remaining_quantity = 50;  // more than was bought
  EXPECT_THROW(store.save({{"005930", broken}}), staged::PersistenceError);

  auto miskeyed = oneStage(kHynix, 100.0, clock_.now_ms());
  EXPECT_THROW(store.save({{"005930", miskeyed}}), staged::PersistenceError);

  EXPECT_EQ(store.currentGeneration(), before);
}

TEST_F(LedgerStoreTest, UnwritableRootIsPersistenceError) {
  overwrite(root_, "a file where the store directory should be");
  auto store = makeStore();
  EXPECT_THROW(
      store.save({{"005930", oneStage(kSamsung, 100.0, clock_.now_ms())}}),
      staged::PersistenceError);
  fs::remove(root_);
}
