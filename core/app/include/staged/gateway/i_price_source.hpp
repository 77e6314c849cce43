#pragma once

#include <cstdint>
#include <string>

namespace staged {

// -----------------------------------------------------------------------------
// IPriceSource — price and holdings feed
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of the latest tradable price, the broker-reported
//         holding, and the trading session state.
//
// @details
// The orchestrator calls currentPrice() and ownedQuantity() for several
// instruments in parallel, so implementations must be safe for concurrent
// calls. A price that cannot be produced (no quote yet, stale quote, broker
// down) is reported by throwing Unavailable; the instrument then gets no
// decision this cycle.
// -----------------------------------------------------------------------------
class IPriceSource {
 public:
  virtual ~IPriceSource() = default;

  /// @throws Unavailable
  virtual double currentPrice(const std::string& code) = 0;

  /// Quantity the broker reports as held. Sells are clamped to it.
  /// @throws Unavailable
  virtual std::int64_t ownedQuantity(const std::string& code) = 0;

  virtual bool isMarketOpen() = 0;
};

}  // namespace staged
