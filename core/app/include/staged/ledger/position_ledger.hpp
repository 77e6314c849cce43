#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/domain/market_condition.hpp"
#include "staged/fees/fee_schedule.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace staged {
namespace ledger {

// -----------------------------------------------------------------------------
// Position Ledger — stage lifecycle transitions
// -----------------------------------------------------------------------------
//
// @brief  Pure state transitions over domain::InstrumentLedger.
//
// @details
// Every mutating operation takes the ledger by const reference and returns
// the updated copy. On failure the function throws before producing a new
// ledger, so the caller's copy is untouched by construction; the
// orchestrator relies on this to isolate a failing instrument without
// rolling anything back.
//
// Stage slots:
//   Slots are numbered 1..max_stages (max_stages <= kMaxStageSlots). A slot
//   holds at most one open entry. openStage() always takes the lowest slot
//   without an open entry, so while earlier stages stay open new stages are
//   appended in order; sequencing rules beyond that (no skipping, drop
//   requirement) belong to the sizing engine.
//
// Thread model:
//   Stateless free functions; safe from any thread.
// -----------------------------------------------------------------------------

/// Result of closeStagePartial(): the updated ledger and the PnL realized by
/// this sale (already net of fees).
struct CloseResult {
  domain::InstrumentLedger ledger;
  double realized_pnl{0.0};
};

/// Fresh ledger with no stages for `instrument`.
domain::InstrumentLedger emptyLedger(const domain::Instrument& instrument);

// -----------------------------------------------------------------------------
// openStage(ledger, price, quantity, timestamp_ms, max_stages)
// -----------------------------------------------------------------------------
//
// @brief  Records a confirmed buy as a new open stage.
//
// @return Updated ledger with the new stage open at `price` x `quantity`.
//
// @throws CapacityExceeded       every slot 1..max_stages holds an open stage.
// @throws std::invalid_argument  price <= 0 or quantity <= 0.
// -----------------------------------------------------------------------------
domain::InstrumentLedger openStage(const domain::InstrumentLedger& ledger,
                                   double price, std::int64_t quantity,
                                   std::int64_t timestamp_ms,
                                   int max_stages = domain::kMaxStageSlots);

// -----------------------------------------------------------------------------
// closeStagePartial(ledger, stage, quantity, price, timestamp, reason, fees)
// -----------------------------------------------------------------------------
//
// @brief  Records a confirmed (partial) sale out of one open stage.
//
// @details
// realized = (price - entry_price) * quantity - fees(price, quantity, sell).
// The sale is appended to the stage's sell history and added to the
// ledger's cumulative realized PnL. When remaining quantity reaches zero
// the stage closes and the slot's cooldown starts from `timestamp_ms` at
// `price`, remembering `reason` so a stop-loss close can use the longer
// stop-loss cooldown.
//
// @throws UnknownStage           no open stage numbered `stage_number`.
// @throws InsufficientQuantity   quantity > remaining quantity.
// @throws std::invalid_argument  quantity <= 0 or price <= 0.
// -----------------------------------------------------------------------------
CloseResult closeStagePartial(const domain::InstrumentLedger& ledger,
                              int stage_number, std::int64_t quantity,
                              double price, std::int64_t timestamp_ms,
                              const std::string& reason,
                              const FeeFunction& fees);

// -----------------------------------------------------------------------------
// isReentryAllowed(ledger, stage, now, current_price, market, cooldown)
// -----------------------------------------------------------------------------
//
// @brief  Whether the slot `stage_number` may be entered again now.
//
// @return false while the slot holds an open stage; false within
//         reentryCooldownHours() of the slot's last close; false while the
//         price has not pulled back from the close price by at least
//         min_pullback. A slot that never closed is always allowed.
// -----------------------------------------------------------------------------
bool isReentryAllowed(const domain::InstrumentLedger& ledger,
                      int stage_number, std::int64_t now_ms,
                      double current_price,
                      const domain::MarketConditionSnapshot& market,
                      const config::CooldownConfig& cooldown);

/// Hours a closed slot waits before re-entry: stop_loss_cooldown_hours after
/// a stop-loss, cooldown_hours otherwise, extended by the adaptive cooldown
/// when that is longer.
double reentryCooldownHours(const domain::StageEntry& stage,
                            const domain::MarketConditionSnapshot& market,
                            const config::CooldownConfig& cooldown);

/// Slot entry for `stage_number`, open or closed, or nullptr.
const domain::StageEntry* findStage(const domain::InstrumentLedger& ledger,
                                    int stage_number);

/// Lowest slot in 1..max_stages without an open stage, or 0 when full.
int nextStageNumber(const domain::InstrumentLedger& ledger, int max_stages);

int openStageCount(const domain::InstrumentLedger& ledger);

/// Sum of remaining quantity across open stages.
std::int64_t openQuantity(const domain::InstrumentLedger& ledger);

/// Sum of entry_price * remaining_quantity across open stages.
double costBasis(const domain::InstrumentLedger& ledger);

/// Market value of the open quantity at `price`.
double openExposure(const domain::InstrumentLedger& ledger, double price);

/// Stop-loss sales recorded at or after `since_ms`.
int stopLossCountSince(const domain::InstrumentLedger& ledger,
                       std::int64_t since_ms);

/// Stages whose current entry was opened at or after `since_ms`.
int entriesSince(const domain::InstrumentLedger& ledger,
                 std::int64_t since_ms);

/// Returns a description of the first violated ledger invariant, or
/// std::nullopt when the ledger is structurally valid.
std::optional<std::string> checkInvariants(
    const domain::InstrumentLedger& ledger);

}  // namespace ledger
}  // namespace staged
