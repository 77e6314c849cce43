#pragma once

#include "staged/domain/instrument_ledger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace staged {
namespace config {

// -----------------------------------------------------------------------------
// EngineConfig — validated, immutable tuning for one cycle
// -----------------------------------------------------------------------------
//
// @brief  Plain value structs grouped by the component that reads them.
//
// @details
// Every field carries the default used when the JSON document omits it, so
// a default-constructed EngineConfig is a valid configuration (with no
// instruments). parseEngineConfig() is the only producer of non-default
// values and rejects anything that would break a component invariant
// (e.g. non-monotone bands) with ConfigError.
//
// Fractions are plain ratios (0.05 == 5%). Durations are stated in the unit
// of the field name.
//
// Thread model:
//   Value type. The engine copies the current config at the start of each
//   cycle and passes it down by const reference; nothing reads a global.
// -----------------------------------------------------------------------------

/// One step of the discount-rate allocation function. A rate at or above
/// min_discount (and above zero) allocates `fraction` of available budget.
struct SizingBand {
  double min_discount{0.0};
  double fraction{0.0};
};

struct SizingConfig {
  /// Ordered by strictly decreasing min_discount; fractions non-increasing.
  std::vector<SizingBand> bands{
      {0.50, 0.40}, {0.30, 0.25}, {0.10, 0.15}, {0.00, 0.05}};
  int max_stages{domain::kMaxStageSlots};
  std::int64_t lot_size{1};
  /// Signals below this confidence never open a stage.
  double min_signal_confidence{0.0};
};

struct DropRequirementConfig {
  bool enable{true};
  /// Base drop below the previous stage's entry price, indexed by stage
  /// number - 2 (stage 2 first). Stages past the end reuse the last value.
  std::vector<double> base_drops{0.05, 0.06, 0.07, 0.08};
  double downtrend_bonus{-0.015};
  double uptrend_penalty{0.01};
  double high_volatility_bonus{-0.005};
  double high_volatility_threshold{0.05};
  double min_factor{0.3};
  double max_factor{2.0};
};

/// Multiplier applied to cooldown_hours when a slot closed at a return of
/// at least min_return.
struct CooldownBand {
  double min_return{0.0};
  double multiplier{1.0};
};

// Adaptive cooldown: cooldown_hours scaled by the last close's outcome, the
// market's volatility and its trend, then clamped to [min_hours, max_hours].
// The fixed cooldown (cooldown_hours or stop_loss_cooldown_hours) still has
// to elapse; the adaptive value can only extend it.
struct CooldownConfig {
  double cooldown_hours{6.0};
  double stop_loss_cooldown_hours{24.0};
  /// Required fall from the slot's last close price before re-entry.
  double min_pullback{0.0};

  bool adaptive{true};
  /// Sorted by descending min_return. Profitable closes below the last band
  /// use a multiplier of 1.
  std::vector<CooldownBand> profit_bands{
      {0.20, 2.0}, {0.15, 1.8}, {0.10, 1.5}, {0.05, 1.2}};
  double stop_loss_multiplier{0.6};
  double loss_multiplier{0.8};

  double high_volatility_threshold{0.06};
  double high_volatility_multiplier{0.7};
  double medium_volatility_threshold{0.035};
  double medium_volatility_multiplier{0.8};
  double low_volatility_multiplier{0.9};
  double unknown_volatility_multiplier{0.8};

  double downtrend_multiplier{0.6};
  double uptrend_multiplier{1.1};
  double neutral_multiplier{0.9};

  double min_hours{1.0};
  double max_hours{48.0};
};

struct ExitConfig {
  double overvalued_threshold{0.10};
  double stop_loss_threshold{0.20};
  /// Profit target per stage, indexed by stage number - 1. Stages past the
  /// end reuse the last value.
  std::vector<double> profit_targets{0.06};
  double partial_sell_ratio{0.40};
  double uptrend_sell_ratio_multiplier{0.6};
};

enum class BudgetStrategy {
  Proportional,
  Adaptive,
  Strict,
};

/// One step of the performance rescale function.
struct BudgetBand {
  double min_performance{0.0};
  double multiplier{1.0};
};

struct BudgetConfig {
  BudgetStrategy strategy{BudgetStrategy::Proportional};
  double initial_budget{10'000'000.0};
  std::vector<BudgetBand> bands{
      {0.15, 1.40}, {0.10, 1.20}, {0.05, 1.10}, {-0.05, 1.00},
      {-0.10, 0.95}, {-0.15, 0.90}, {-0.20, 0.85}};
  double floor_multiplier{0.70};
  double ceiling_multiplier{1.40};
  double performance_horizon_days{30.0};
  double loss_tolerance{0.20};
};

struct ExposureConfig {
  double max_exposure_fraction{0.90};
  double min_cash_fraction{0.10};
};

struct CircuitBreakerConfig {
  bool enable{true};
  /// Broad index change at or below this suppresses new entries.
  double market_decline_threshold{-0.03};
  /// Trailing portfolio performance at or below this suppresses entries.
  double portfolio_loss_threshold{-0.30};
  int daily_stop_loss_limit{2};
  int recent_stop_loss_limit{4};
  double recent_window_days{7.0};
};

struct FeeConfig {
  double commission_rate{0.00015};
  double tax_rate{0.0023};
  double special_tax_rate{0.0015};
};

struct StoreConfig {
  std::string root{"data/ledgers"};
  int retention_count{10};
  double retention_hours{72.0};
};

struct CycleConfig {
  int interval_seconds{60};
  int order_timeout_seconds{60};
  int max_daily_buys_per_instrument{2};
};

struct EndpointConfig {
  std::string feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  /// Quotes older than this are reported Unavailable.
  int max_quote_age_seconds{120};
};

struct InstrumentConfig {
  domain::Instrument instrument;
  bool high_profit_sell_reduction{false};
};

struct EngineConfig {
  SizingConfig sizing;
  DropRequirementConfig drop_requirement;
  CooldownConfig cooldown;
  ExitConfig exit;
  BudgetConfig budget;
  ExposureConfig exposure;
  CircuitBreakerConfig circuit_breaker;
  FeeConfig fees;
  StoreConfig store;
  CycleConfig cycle;
  EndpointConfig endpoints;
  std::vector<InstrumentConfig> instruments;
};

}  // namespace config
}  // namespace staged
