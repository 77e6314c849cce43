#include "staged/domain/market_condition.hpp"

namespace staged {
namespace domain {

const char* trendToString(MarketTrend trend) {
  switch (trend) {
    case MarketTrend::StrongUptrend:   return "strong_uptrend";
    case MarketTrend::Uptrend:         return "uptrend";
    case MarketTrend::Neutral:         return "neutral";
    case MarketTrend::Downtrend:       return "downtrend";
    case MarketTrend::StrongDowntrend: return "strong_downtrend";
    case MarketTrend::Unknown:         return "unknown";
  }
  return "unknown";
}

MarketTrend trendFromString(const std::string& name) {
  if (name == "strong_uptrend") return MarketTrend::StrongUptrend;
  if (name == "uptrend") return MarketTrend::Uptrend;
  if (name == "neutral") return MarketTrend::Neutral;
  if (name == "downtrend") return MarketTrend::Downtrend;
  if (name == "strong_downtrend") return MarketTrend::StrongDowntrend;
  return MarketTrend::Unknown;
}

}  // namespace domain
}  // namespace staged
