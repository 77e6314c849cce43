#include "staged/config/config_loader.hpp"
#include "staged/domain/errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace staged {
namespace config {

namespace {

// Reads `key` from `obj` when present, leaving `out` at its default
// otherwise. Type mismatches surface as nlohmann::json::type_error and are
// converted to ConfigError by parseEngineConfig().
template <typename T>
void read(const nlohmann::json& obj, const char* key, T& out) {
  auto it = obj.find(key);
  if (it != obj.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

const nlohmann::json& section(const nlohmann::json& doc, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + key + "' must be an object");
  }
  return *it;
}

void requireFraction(double value, const char* name) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    std::ostringstream os;
    os << name << " must be within [0, 1], got " << value;
    throw ConfigError(os.str());
  }
}

void requirePositive(double value, const char* name) {
  if (!std::isfinite(value) || value <= 0.0) {
    std::ostringstream os;
    os << name << " must be positive, got " << value;
    throw ConfigError(os.str());
  }
}

BudgetStrategy strategyFromString(const std::string& s) {
  if (s == "proportional") return BudgetStrategy::Proportional;
  if (s == "adaptive") return BudgetStrategy::Adaptive;
  if (s == "strict") return BudgetStrategy::Strict;
  throw ConfigError("unknown budget strategy '" + s + "'");
}

SizingConfig parseSizing(const nlohmann::json& j) {
  SizingConfig c;
  if (auto it = j.find("bands"); it != j.end()) {
    c.bands.clear();
    for (const auto& b : *it) {
      SizingBand band;
      band.min_discount = b.at("min_discount").get<double>();
      band.fraction = b.at("fraction").get<double>();
      c.bands.push_back(band);
    }
  }
  read(j, "max_stages", c.max_stages);
  read(j, "lot_size", c.lot_size);
  read(j, "min_signal_confidence", c.min_signal_confidence);

  validateSizingBands(c.bands);
  if (c.max_stages < 1 || c.max_stages > domain::kMaxStageSlots) {
    throw ConfigError("sizing.max_stages must be within [1, " +
                      std::to_string(domain::kMaxStageSlots) + "]");
  }
  if (c.lot_size < 1) {
    throw ConfigError("sizing.lot_size must be at least 1");
  }
  requireFraction(c.min_signal_confidence, "sizing.min_signal_confidence");
  return c;
}

DropRequirementConfig parseDrop(const nlohmann::json& j) {
  DropRequirementConfig c;
  read(j, "enable", c.enable);
  read(j, "base_drops", c.base_drops);
  read(j, "downtrend_bonus", c.downtrend_bonus);
  read(j, "uptrend_penalty", c.uptrend_penalty);
  read(j, "high_volatility_bonus", c.high_volatility_bonus);
  read(j, "high_volatility_threshold", c.high_volatility_threshold);
  read(j, "min_factor", c.min_factor);
  read(j, "max_factor", c.max_factor);

  if (c.base_drops.empty()) {
    throw ConfigError("drop_requirement.base_drops must not be empty");
  }
  for (double d : c.base_drops) {
    requireFraction(d, "drop_requirement.base_drops[]");
  }
  if (c.min_factor < 0.0 || c.max_factor < c.min_factor) {
    throw ConfigError(
        "drop_requirement needs 0 <= min_factor <= max_factor");
  }
  return c;
}

CooldownConfig parseCooldown(const nlohmann::json& j) {
  CooldownConfig c;
  read(j, "hours", c.cooldown_hours);
  read(j, "stop_loss_hours", c.stop_loss_cooldown_hours);
  read(j, "min_pullback", c.min_pullback);
  if (c.cooldown_hours < 0.0 || c.stop_loss_cooldown_hours < 0.0) {
    throw ConfigError("cooldown hours must not be negative");
  }
  requireFraction(c.min_pullback, "cooldown.min_pullback");

  read(j, "adaptive", c.adaptive);
  if (auto it = j.find("profit_bands"); it != j.end()) {
    c.profit_bands.clear();
    for (const auto& b : *it) {
      CooldownBand band;
      band.min_return = b.at("min_return").get<double>();
      band.multiplier = b.at("multiplier").get<double>();
      c.profit_bands.push_back(band);
    }
  }
  read(j, "stop_loss_multiplier", c.stop_loss_multiplier);
  read(j, "loss_multiplier", c.loss_multiplier);
  read(j, "high_volatility_threshold", c.high_volatility_threshold);
  read(j, "high_volatility_multiplier", c.high_volatility_multiplier);
  read(j, "medium_volatility_threshold", c.medium_volatility_threshold);
  read(j, "medium_volatility_multiplier", c.medium_volatility_multiplier);
  read(j, "low_volatility_multiplier", c.low_volatility_multiplier);
  read(j, "unknown_volatility_multiplier", c.unknown_volatility_multiplier);
  read(j, "downtrend_multiplier", c.downtrend_multiplier);
  read(j, "uptrend_multiplier", c.uptrend_multiplier);
  read(j, "neutral_multiplier", c.neutral_multiplier);
  read(j, "min_hours", c.min_hours);
  read(j, "max_hours", c.max_hours);

  for (std::size_t i = 0; i < c.profit_bands.size(); ++i) {
    requirePositive(c.profit_bands[i].multiplier,
                    "cooldown.profit_bands[].multiplier");
    if (i > 0 &&
        c.profit_bands[i].min_return >= c.profit_bands[i - 1].min_return) {
      throw ConfigError(
          "cooldown.profit_bands must be sorted by descending min_return");
    }
  }
  requirePositive(c.stop_loss_multiplier, "cooldown.stop_loss_multiplier");
  requirePositive(c.loss_multiplier, "cooldown.loss_multiplier");
  requirePositive(c.high_volatility_multiplier,
                  "cooldown.high_volatility_multiplier");
  requirePositive(c.medium_volatility_multiplier,
                  "cooldown.medium_volatility_multiplier");
  requirePositive(c.low_volatility_multiplier,
                  "cooldown.low_volatility_multiplier");
  requirePositive(c.unknown_volatility_multiplier,
                  "cooldown.unknown_volatility_multiplier");
  requirePositive(c.downtrend_multiplier, "cooldown.downtrend_multiplier");
  requirePositive(c.uptrend_multiplier, "cooldown.uptrend_multiplier");
  requirePositive(c.neutral_multiplier, "cooldown.neutral_multiplier");
  if (c.medium_volatility_threshold > c.high_volatility_threshold) {
    throw ConfigError(
        "cooldown needs medium_volatility_threshold <= "
        "high_volatility_threshold");
  }
  if (c.min_hours < 0.0 || c.max_hours < c.min_hours) {
    throw ConfigError("cooldown needs 0 <= min_hours <= max_hours");
  }
  return c;
}

ExitConfig parseExit(const nlohmann::json& j) {
  ExitConfig c;
  read(j, "overvalued_threshold", c.overvalued_threshold);
  read(j, "stop_loss_threshold", c.stop_loss_threshold);
  read(j, "profit_targets", c.profit_targets);
  read(j, "partial_sell_ratio", c.partial_sell_ratio);
  read(j, "uptrend_sell_ratio_multiplier", c.uptrend_sell_ratio_multiplier);

  requirePositive(c.overvalued_threshold, "exit.overvalued_threshold");
  requirePositive(c.stop_loss_threshold, "exit.stop_loss_threshold");
  if (c.stop_loss_threshold >= 1.0) {
    throw ConfigError("exit.stop_loss_threshold must be below 1");
  }
  if (c.profit_targets.empty()) {
    throw ConfigError("exit.profit_targets must not be empty");
  }
  for (double t : c.profit_targets) {
    requirePositive(t, "exit.profit_targets[]");
  }
  requirePositive(c.partial_sell_ratio, "exit.partial_sell_ratio");
  requireFraction(c.partial_sell_ratio, "exit.partial_sell_ratio");
  requireFraction(c.uptrend_sell_ratio_multiplier,
                  "exit.uptrend_sell_ratio_multiplier");
  return c;
}

BudgetConfig parseBudget(const nlohmann::json& j) {
  BudgetConfig c;
  if (auto it = j.find("strategy"); it != j.end()) {
    c.strategy = strategyFromString(it->get<std::string>());
  }
  read(j, "initial_budget", c.initial_budget);
  if (auto it = j.find("bands"); it != j.end()) {
    c.bands.clear();
    for (const auto& b : *it) {
      BudgetBand band;
      band.min_performance = b.at("min_performance").get<double>();
      band.multiplier = b.at("multiplier").get<double>();
      c.bands.push_back(band);
    }
  }
  read(j, "floor_multiplier", c.floor_multiplier);
  read(j, "ceiling_multiplier", c.ceiling_multiplier);
  read(j, "performance_horizon_days", c.performance_horizon_days);
  read(j, "loss_tolerance", c.loss_tolerance);

  requirePositive(c.initial_budget, "budget.initial_budget");
  validateBudgetBands(c.bands);
  requirePositive(c.floor_multiplier, "budget.floor_multiplier");
  if (c.ceiling_multiplier < c.floor_multiplier) {
    throw ConfigError("budget.ceiling_multiplier must be >= floor_multiplier");
  }
  requirePositive(c.performance_horizon_days,
                  "budget.performance_horizon_days");
  requireFraction(c.loss_tolerance, "budget.loss_tolerance");
  return c;
}

ExposureConfig parseExposure(const nlohmann::json& j) {
  ExposureConfig c;
  read(j, "max_exposure_fraction", c.max_exposure_fraction);
  read(j, "min_cash_fraction", c.min_cash_fraction);
  requireFraction(c.max_exposure_fraction, "exposure.max_exposure_fraction");
  requireFraction(c.min_cash_fraction, "exposure.min_cash_fraction");
  return c;
}

CircuitBreakerConfig parseBreaker(const nlohmann::json& j) {
  CircuitBreakerConfig c;
  read(j, "enable", c.enable);
  read(j, "market_decline_threshold", c.market_decline_threshold);
  read(j, "portfolio_loss_threshold", c.portfolio_loss_threshold);
  read(j, "daily_stop_loss_limit", c.daily_stop_loss_limit);
  read(j, "recent_stop_loss_limit", c.recent_stop_loss_limit);
  read(j, "recent_window_days", c.recent_window_days);
  if (c.market_decline_threshold > 0.0 || c.portfolio_loss_threshold > 0.0) {
    throw ConfigError("circuit_breaker thresholds must be <= 0");
  }
  if (c.daily_stop_loss_limit < 1 || c.recent_stop_loss_limit < 1) {
    throw ConfigError("circuit_breaker stop-loss limits must be >= 1");
  }
  return c;
}

FeeConfig parseFees(const nlohmann::json& j) {
  FeeConfig c;
  read(j, "commission_rate", c.commission_rate);
  read(j, "tax_rate", c.tax_rate);
  read(j, "special_tax_rate", c.special_tax_rate);
  requireFraction(c.commission_rate, "fees.commission_rate");
  requireFraction(c.tax_rate, "fees.tax_rate");
  requireFraction(c.special_tax_rate, "fees.special_tax_rate");
  return c;
}

StoreConfig parseStore(const nlohmann::json& j) {
  StoreConfig c;
  read(j, "root", c.root);
  read(j, "retention_count", c.retention_count);
  read(j, "retention_hours", c.retention_hours);
  if (c.root.empty()) {
    throw ConfigError("store.root must not be empty");
  }
  if (c.retention_count < 1) {
    throw ConfigError("store.retention_count must be at least 1");
  }
  return c;
}

CycleConfig parseCycle(const nlohmann::json& j) {
  CycleConfig c;
  read(j, "interval_seconds", c.interval_seconds);
  read(j, "order_timeout_seconds", c.order_timeout_seconds);
  read(j, "max_daily_buys_per_instrument", c.max_daily_buys_per_instrument);
  if (c.interval_seconds < 1 || c.order_timeout_seconds < 1) {
    throw ConfigError("cycle intervals must be at least one second");
  }
  if (c.max_daily_buys_per_instrument < 1) {
    throw ConfigError("cycle.max_daily_buys_per_instrument must be >= 1");
  }
  return c;
}

EndpointConfig parseEndpoints(const nlohmann::json& j) {
  EndpointConfig c;
  read(j, "feed", c.feed_endpoint);
  read(j, "ipc_cmd", c.ipc_cmd_endpoint);
  read(j, "ipc_pub", c.ipc_pub_endpoint);
  read(j, "max_quote_age_seconds", c.max_quote_age_seconds);
  return c;
}

std::vector<InstrumentConfig> parseInstruments(const nlohmann::json& doc) {
  std::vector<InstrumentConfig> out;
  auto it = doc.find("instruments");
  if (it == doc.end()) {
    return out;
  }
  if (!it->is_array()) {
    throw ConfigError("instruments must be an array");
  }

  std::set<std::string> seen;
  for (const auto& item : *it) {
    InstrumentConfig ic;
    ic.instrument.code = item.at("code").get<std::string>();
    read(item, "name", ic.instrument.name);
    read(item, "sector", ic.instrument.sector);
    read(item, "high_profit_sell_reduction", ic.high_profit_sell_reduction);

    if (ic.instrument.code.empty() ||
        ic.instrument.code.find_first_of("/\\.") != std::string::npos) {
      throw ConfigError("invalid instrument code '" + ic.instrument.code +
                        "'");
    }
    if (!seen.insert(ic.instrument.code).second) {
      throw ConfigError("duplicate instrument code '" + ic.instrument.code +
                        "'");
    }
    out.push_back(std::move(ic));
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateSizingBands
// -----------------------------------------------------------------------------
void validateSizingBands(const std::vector<SizingBand>& bands) {
  if (bands.empty()) {
    throw ConfigError("sizing.bands must not be empty");
  }
  for (std::size_t i = 0; i < bands.size(); ++i) {
    requireFraction(bands[i].fraction, "sizing.bands[].fraction");
    if (!std::isfinite(bands[i].min_discount) || bands[i].min_discount < 0.0) {
      throw ConfigError("sizing.bands[].min_discount must be >= 0");
    }
    if (i == 0) {
      continue;
    }
    if (bands[i].min_discount >= bands[i - 1].min_discount) {
      throw ConfigError(
          "sizing.bands must be ordered by strictly decreasing min_discount");
    }
    if (bands[i].fraction > bands[i - 1].fraction) {
      throw ConfigError(
          "sizing.bands fractions must not increase as discount decreases");
    }
  }
}

// -----------------------------------------------------------------------------
// validateBudgetBands
// -----------------------------------------------------------------------------
void validateBudgetBands(const std::vector<BudgetBand>& bands) {
  for (std::size_t i = 0; i < bands.size(); ++i) {
    requirePositive(bands[i].multiplier, "budget.bands[].multiplier");
    if (i == 0) {
      continue;
    }
    if (bands[i].min_performance >= bands[i - 1].min_performance) {
      throw ConfigError(
          "budget.bands must be ordered by strictly decreasing "
          "min_performance");
    }
    if (bands[i].multiplier > bands[i - 1].multiplier) {
      throw ConfigError(
          "budget.bands multipliers must not increase as performance "
          "decreases");
    }
  }
}

const char* budgetStrategyToString(BudgetStrategy s) {
  switch (s) {
    case BudgetStrategy::Proportional: return "proportional";
    case BudgetStrategy::Adaptive:     return "adaptive";
    case BudgetStrategy::Strict:       return "strict";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  try {
    EngineConfig c;
    c.sizing = parseSizing(section(doc, "sizing"));
    c.drop_requirement = parseDrop(section(doc, "drop_requirement"));
    c.cooldown = parseCooldown(section(doc, "cooldown"));
    c.exit = parseExit(section(doc, "exit"));
    c.budget = parseBudget(section(doc, "budget"));
    c.exposure = parseExposure(section(doc, "exposure"));
    c.circuit_breaker = parseBreaker(section(doc, "circuit_breaker"));
    c.fees = parseFees(section(doc, "fees"));
    c.store = parseStore(section(doc, "store"));
    c.cycle = parseCycle(section(doc, "cycle"));
    c.endpoints = parseEndpoints(section(doc, "endpoints"));
    c.instruments = parseInstruments(doc);
    return c;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.good()) {
    throw ConfigError("cannot open configuration file " + path.string());
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("configuration " + path.string() +
                      " is not valid JSON: " + e.what());
  }
  return parseEngineConfig(doc);
}

// -----------------------------------------------------------------------------
// ConfigSource
// -----------------------------------------------------------------------------
ConfigSource::ConfigSource(std::filesystem::path path)
    : path_(std::move(path)) {
  config_ = loadEngineConfig(*path_);
  std::error_code ec;
  last_write_ = std::filesystem::last_write_time(*path_, ec);
}

ConfigSource::ConfigSource(EngineConfig fixed) : config_(std::move(fixed)) {}

EngineConfig ConfigSource::current() const {
  std::lock_guard lock(mutex_);
  return config_;
}

bool ConfigSource::reloadIfChanged() {
  if (!path_) {
    return false;
  }

  std::error_code ec;
  auto stamp = std::filesystem::last_write_time(*path_, ec);
  if (ec) {
    std::cerr << "[ConfigSource] cannot stat " << path_->string() << ": "
              << ec.message() << ". Keeping current configuration.\n";
    return false;
  }
  if (stamp == last_write_) {
    return false;
  }
  last_write_ = stamp;

  try {
    EngineConfig fresh = loadEngineConfig(*path_);
    std::lock_guard lock(mutex_);
    config_ = std::move(fresh);
  } catch (const ConfigError& e) {
    std::cerr << "[ConfigSource] reload rejected: " << e.what()
              << ". Keeping previous configuration.\n";
    return false;
  }

  std::cout << "[ConfigSource] reloaded " << path_->string() << "\n";
  return true;
}

}  // namespace config
}  // namespace staged
