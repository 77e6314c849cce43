#pragma once

#include "staged/domain/budget_state.hpp"
#include "staged/domain/instrument_ledger.hpp"

#include <nlohmann/json.hpp>

namespace staged {
namespace store {

/// Version written into every persisted document. Readers reject others.
constexpr int kDocumentSchemaVersion = 1;

// -----------------------------------------------------------------------------
// Ledger document codec
// -----------------------------------------------------------------------------
//
// @brief  Maps InstrumentLedger and BudgetState to and from their persisted
//         JSON documents.
//
// @details
// Decoding is strict: a missing required key, a wrong JSON type, an unknown
// schema version, or a ledger that violates the stage invariants all raise
// CorruptState. Unlike configuration, persisted state never falls back to
// defaults; a document that does not decode exactly is treated as damaged
// so the store can go to a backup generation instead.
//
// Doubles are written with nlohmann's round-trip precision, so
// decode(encode(x)) == x field for field.
// -----------------------------------------------------------------------------

nlohmann::json ledgerToJson(const domain::InstrumentLedger& ledger);

/// @throws CorruptState on any structural problem.
domain::InstrumentLedger ledgerFromJson(const nlohmann::json& doc);

/// Throws CorruptState naming the first violated invariant.
void validateLedger(const domain::InstrumentLedger& ledger);

nlohmann::json budgetStateToJson(const domain::BudgetState& state);

/// @throws CorruptState on any structural problem.
domain::BudgetState budgetStateFromJson(const nlohmann::json& doc);

}  // namespace store
}  // namespace staged
