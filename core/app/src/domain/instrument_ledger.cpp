#include "staged/domain/instrument_ledger.hpp"

namespace staged {
namespace domain {

bool operator==(const Instrument& a, const Instrument& b) {
  return a.code == b.code && a.name == b.name && a.sector == b.sector;
}

bool operator==(const SellRecord& a, const SellRecord& b) {
  return a.timestamp_ms == b.timestamp_ms && a.quantity == b.quantity &&
         a.price == b.price && a.realized_pnl == b.realized_pnl &&
         a.reason == b.reason;
}

bool operator==(const StageEntry& a, const StageEntry& b) {
  return a.stage_number == b.stage_number &&
         a.entry_price == b.entry_price &&
         a.entry_quantity == b.entry_quantity &&
         a.remaining_quantity == b.remaining_quantity &&
         a.entry_timestamp_ms == b.entry_timestamp_ms &&
         a.is_open == b.is_open && a.sell_history == b.sell_history &&
         a.last_close_timestamp_ms == b.last_close_timestamp_ms &&
         a.last_close_price == b.last_close_price &&
         a.last_close_reason == b.last_close_reason;
}

bool operator==(const InstrumentLedger& a, const InstrumentLedger& b) {
  return a.instrument == b.instrument && a.stages == b.stages &&
         a.realized_pnl == b.realized_pnl &&
         a.drop_requirements == b.drop_requirements;
}

}  // namespace domain
}  // namespace staged
