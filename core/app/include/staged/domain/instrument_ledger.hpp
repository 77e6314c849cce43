#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace staged {
namespace domain {

/// Hard upper bound on stage slots per instrument. Configuration may lower
/// the working limit (SizingConfig::max_stages) but never raise it.
constexpr int kMaxStageSlots = 5;

/// Close reasons written into SellRecord::reason and
/// StageEntry::last_close_reason.
constexpr const char* kReasonOvervalued = "OVERVALUED_SELL";
constexpr const char* kReasonStopLoss = "STOP_LOSS";
constexpr const char* kReasonProfitTarget = "PROFIT_TARGET";

// -----------------------------------------------------------------------------
// Instrument — identity of one tracked instrument
// -----------------------------------------------------------------------------
struct Instrument {
  std::string code;    // Exchange code, also the persistence key (e.g. "005930")
  std::string name;    // Display name
  std::string sector;  // Free-form sector tag
};

// -----------------------------------------------------------------------------
// SellRecord — one executed (partial) sale out of a stage
// -----------------------------------------------------------------------------
struct SellRecord {
  std::int64_t timestamp_ms{0};
  std::int64_t quantity{0};
  double price{0.0};
  double realized_pnl{0.0};  // (price - entry) * quantity - fees
  std::string reason;
};

// -----------------------------------------------------------------------------
// StageEntry — one stage slot of an instrument ledger
// -----------------------------------------------------------------------------
//
// @brief  A single staged entry ("split") and the bookkeeping of its slot.
//
// @details
// Quantities are whole tradable units. A stage is open while
// remaining_quantity > 0; once it reaches zero the stage is closed and the
// slot's last_close_* fields start the re-entry cooldown. Re-opening a slot
// resets the entry_* and remaining fields but keeps the sell history and the
// last close, so the slot's trading record survives re-entries.
//
// Invariants (checked by checkInvariants):
//   0 <= remaining_quantity <= entry_quantity
//   is_open == (remaining_quantity > 0)
//   1 <= stage_number <= kMaxStageSlots
// -----------------------------------------------------------------------------
struct StageEntry {
  int stage_number{0};
  double entry_price{0.0};
  std::int64_t entry_quantity{0};
  std::int64_t remaining_quantity{0};
  std::int64_t entry_timestamp_ms{0};
  bool is_open{false};

  std::vector<SellRecord> sell_history;

  std::int64_t last_close_timestamp_ms{0};  // 0 = slot never closed
  double last_close_price{0.0};
  std::string last_close_reason;
};

// -----------------------------------------------------------------------------
// InstrumentLedger — the per-instrument staged position document
// -----------------------------------------------------------------------------
//
// @brief  Ordered stage slots, cumulative realized PnL, and the last computed
//         drop requirement per stage for one instrument.
//
// @details
// This is a plain value type. The orchestrator holds the authoritative
// working copy of every ledger during a cycle; PositionLedger functions take
// a ledger by const reference and return the updated copy, so a failed
// transition can never leave a half-mutated ledger behind.
//
// stages is kept sorted by stage_number. Slots appear lazily: a slot that
// has never been opened has no StageEntry.
//
// drop_requirements is recomputed every cycle from the market snapshot. It
// is persisted so operators can see what gated the last cycle, but is never
// read back as an input to a decision.
// -----------------------------------------------------------------------------
struct InstrumentLedger {
  Instrument instrument;
  std::vector<StageEntry> stages;
  double realized_pnl{0.0};
  std::map<int, double> drop_requirements;
};

using LedgerMap = std::map<std::string, InstrumentLedger>;

bool operator==(const Instrument& a, const Instrument& b);
bool operator==(const SellRecord& a, const SellRecord& b);
bool operator==(const StageEntry& a, const StageEntry& b);
bool operator==(const InstrumentLedger& a, const InstrumentLedger& b);

inline bool operator!=(const InstrumentLedger& a, const InstrumentLedger& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace staged
