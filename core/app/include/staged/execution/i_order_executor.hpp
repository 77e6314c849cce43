#pragma once

#include "staged/domain/order_fill.hpp"

#include <cstdint>
#include <string>

namespace staged {

// -----------------------------------------------------------------------------
// IOrderExecutor — order placement seam
// -----------------------------------------------------------------------------
//
// @brief  Places one order and returns only once the broker has confirmed
//         it, with the executed price and quantity.
//
// @details
// The ledger is mutated from the returned OrderFill, never from the
// request, so a partial or price-improved fill is recorded as it happened.
// Implementations bound their own wait (the configured order timeout) and
// report an expired wait as OrderTimeout; a broker refusal is
// OrderRejected. Neither may leave a half-placed order unreported.
//
// Thread model:
//   The orchestrator places orders for different instruments concurrently;
//   implementations must be safe for concurrent calls.
// -----------------------------------------------------------------------------
class IOrderExecutor {
 public:
  virtual ~IOrderExecutor() = default;

  /// @throws OrderRejected, OrderTimeout
  virtual domain::OrderFill placeBuy(const std::string& code, double price,
                                     std::int64_t quantity) = 0;

  /// @throws OrderRejected, OrderTimeout
  virtual domain::OrderFill placeSell(const std::string& code, double price,
                                      std::int64_t quantity) = 0;
};

}  // namespace staged
