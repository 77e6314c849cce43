#pragma once

#include "staged/domain/market_condition.hpp"

namespace staged {

class IMarketConditionSource {
 public:
  virtual ~IMarketConditionSource() = default;

  /// Snapshot for this cycle. @throws Unavailable
  virtual domain::MarketConditionSnapshot marketCondition() = 0;
};

}  // namespace staged
