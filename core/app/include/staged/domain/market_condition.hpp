#pragma once

#include <cstdint>
#include <string>

namespace staged {
namespace domain {

enum class MarketTrend {
  StrongUptrend,
  Uptrend,
  Neutral,
  Downtrend,
  StrongDowntrend,
  Unknown,  // No snapshot this cycle; new entries are suppressed.
};

// -----------------------------------------------------------------------------
// MarketConditionSnapshot — broad market state as of this cycle
// -----------------------------------------------------------------------------
//
// @brief  Produced fresh every cycle by an IMarketConditionSource and read
//         by the sizing and exit engines. Never persisted.
//
// index_change is the broad index's change for the session as a fraction
// (-0.03 == down 3%). volatility is the index's daily return standard
// deviation as a fraction.
// -----------------------------------------------------------------------------
struct MarketConditionSnapshot {
  MarketTrend trend{MarketTrend::Unknown};
  double index_change{0.0};
  double volatility{0.0};
  std::int64_t as_of_ms{0};
};

const char* trendToString(MarketTrend trend);

/// Parses the snake_case names used on the feed and in configuration
/// ("strong_uptrend", ...). Unrecognised names map to Unknown.
MarketTrend trendFromString(const std::string& name);

inline bool isUptrend(MarketTrend t) {
  return t == MarketTrend::StrongUptrend || t == MarketTrend::Uptrend;
}

inline bool isDowntrend(MarketTrend t) {
  return t == MarketTrend::StrongDowntrend || t == MarketTrend::Downtrend;
}

}  // namespace domain
}  // namespace staged
