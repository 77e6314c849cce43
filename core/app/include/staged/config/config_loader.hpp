#pragma once

#include "staged/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace staged {
namespace config {

// -----------------------------------------------------------------------------
// parseEngineConfig(json)
// -----------------------------------------------------------------------------
//
// @brief  Builds a validated EngineConfig from a parsed JSON document.
//
// @param  doc  Root object. Missing sections and keys keep their defaults.
//
// @return The validated configuration.
//
// @throws ConfigError on wrong JSON types, non-monotone sizing or budget
//         bands, fractions outside [0, 1], max_stages outside
//         [1, kMaxStageSlots], duplicate instrument codes, or any other
//         value that would break a component invariant at runtime.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& doc);

/// Reads and parses the file at `path`. Throws ConfigError when the file is
/// missing, is not valid JSON, or fails validation.
EngineConfig loadEngineConfig(const std::filesystem::path& path);

/// Throws ConfigError unless bands are ordered by strictly decreasing
/// min_discount with non-increasing fractions in [0, 1].
void validateSizingBands(const std::vector<SizingBand>& bands);

/// Throws ConfigError unless bands are ordered by strictly decreasing
/// min_performance with non-increasing, positive multipliers.
void validateBudgetBands(const std::vector<BudgetBand>& bands);

const char* budgetStrategyToString(BudgetStrategy s);

// -----------------------------------------------------------------------------
// ConfigSource — live configuration with change detection
// -----------------------------------------------------------------------------
//
// @brief  Holds the last good EngineConfig for a file and reloads it when
//         the file's modification time changes.
//
// @details
// The trading engine calls reloadIfChanged() once before every cycle and
// then takes a copy with current(). A reload that fails validation is
// logged and discarded; the previous configuration stays in force, so an
// operator's bad edit can never stop the loop.
//
// Thread model:
//   current() may be called from the IPC thread while the cycle thread
//   reloads; both take mutex_.
// -----------------------------------------------------------------------------
class ConfigSource {
 public:
  /// Loads `path` immediately; throws ConfigError if the initial load fails.
  explicit ConfigSource(std::filesystem::path path);

  /// Wraps a fixed configuration with no backing file (tests, embedding).
  explicit ConfigSource(EngineConfig fixed);

  EngineConfig current() const;

  /// Returns true when a changed file was loaded successfully.
  bool reloadIfChanged();

 private:
  std::optional<std::filesystem::path> path_;
  std::filesystem::file_time_type last_write_{};

  mutable std::mutex mutex_;
  EngineConfig config_;
};

}  // namespace config
}  // namespace staged
