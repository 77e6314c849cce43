#pragma once

#include "staged/config/engine_config.hpp"
#include "staged/domain/budget_state.hpp"
#include "staged/domain/instrument_ledger.hpp"
#include "staged/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace staged {
namespace store {

// -----------------------------------------------------------------------------
// LedgerStore — crash-safe persistence of the ledger set
// -----------------------------------------------------------------------------
//
// @brief  Owns the durable bytes of every instrument ledger and of the
//         budget state under one root directory.
//
// @details
// On-disk layout:
//
//   <root>/
//     CURRENT                      name of the durable generation
//     gen-<ts_ms>-<seq>/           one immutable generation
//       <code>.json                one ledger document per instrument
//       MANIFEST.json              written last; lists the documents
//     staging-gen-<ts_ms>-<seq>/   a save in progress (or a crashed one)
//     budget_state.json            budget document (+ .bak of the previous)
//
// A save builds a complete new generation in a staging directory, re-reads
// and verifies every document, renames the directory into place and only
// then swaps CURRENT (write temp + fsync + rename). A crash before the
// CURRENT rename leaves the previous generation durable; a crash after it
// leaves the new one. The two are never mixed.
//
// Older generations are the backups. When a document of the current
// generation fails to decode, load() takes that instrument's document from
// the newest older generation that decodes, and logs the recovery.
//
// Thread model:
//   Not thread-safe. The trading cycle is the only caller and never runs
//   concurrently with itself.
// -----------------------------------------------------------------------------
class LedgerStore {
 public:
  LedgerStore(config::StoreConfig config, const ITimeProvider& clock);

  // -------------------------------------------------------------------------
  // load(instruments)
  // -------------------------------------------------------------------------
  // @brief  Returns one ledger per requested instrument, keyed by code.
  //
  // @details
  // Missing root, missing CURRENT, or no document for an instrument yields
  // an empty ledger for it. A document that fails to decode is replaced by
  // the newest valid copy from an older generation. Name and sector are
  // refreshed from `instruments`; the code is the identity.
  //
  // @throws CorruptState when a document is damaged and no older generation
  //         holds a valid copy.
  // -------------------------------------------------------------------------
  domain::LedgerMap load(const std::vector<domain::Instrument>& instruments);

  // -------------------------------------------------------------------------
  // save(ledgers)
  // -------------------------------------------------------------------------
  // @brief  Atomically replaces the durable ledger set.
  //
  // @details
  // Documents of the current generation whose code is not in `ledgers` are
  // carried into the new generation unchanged. After the CURRENT swap,
  // stale generations and orphan staging directories are pruned; pruning
  // problems are logged and never thrown.
  //
  // @throws PersistenceError if validation, writing or verification fails.
  //         Durable state is then exactly what it was before the call.
  // -------------------------------------------------------------------------
  void save(const domain::LedgerMap& ledgers);

  /// Budget document, or std::nullopt when none was ever saved. Falls back
  /// to the previous copy when the document is damaged; throws CorruptState
  /// if neither decodes.
  std::optional<domain::BudgetState> loadBudgetState();

  /// Writes the budget document with the same temp + verify + rename
  /// protocol. Throws PersistenceError.
  void saveBudgetState(const domain::BudgetState& state);

  /// Name of the durable generation, if any.
  std::optional<std::string> currentGeneration() const;

  /// Complete generation directory names, oldest first.
  std::vector<std::string> listGenerations() const;

  const std::filesystem::path& root() const { return root_; }

 private:
  struct GenerationId {
    std::int64_t timestamp_ms{0};
    std::int64_t seq{0};
  };

  static std::optional<GenerationId> parseGenerationName(
      const std::string& name);
  static std::string generationName(const GenerationId& id);
  static bool olderThan(const GenerationId& a, const GenerationId& b);

  GenerationId nextGenerationId() const;
  /// Document codes listed by the generation's MANIFEST.json, or
  /// std::nullopt when the manifest is missing or unreadable (an incomplete
  /// generation).
  std::optional<std::vector<std::string>> readManifest(
      const std::string& generation) const;

  std::optional<domain::InstrumentLedger> readLedger(
      const std::filesystem::path& doc, const std::string& code) const;
  domain::InstrumentLedger recoverFromBackups(
      const std::string& code, const std::string& current_generation) const;

  void writeGeneration(const std::filesystem::path& staging,
                       const std::string& generation,
                       const domain::LedgerMap& ledgers,
                       const std::optional<std::string>& current) const;
  void swapCurrent(const std::string& generation);
  /// Removes staging directories and generations newer than `current`.
  void discardUncommitted(const std::string& current);
  /// discardUncommitted() plus retention by count and age.
  void prune(const std::string& current);

  config::StoreConfig config_;
  const ITimeProvider& clock_;
  std::filesystem::path root_;
};

}  // namespace store
}  // namespace staged
