#pragma once

#include "staged/config/engine_config.hpp"

#include <cstdint>
#include <functional>

namespace staged {

/// Deterministic fee function: fees(price, quantity, is_buy) -> amount.
using FeeFunction = std::function<double(double, std::int64_t, bool)>;

// -----------------------------------------------------------------------------
// tradingFee
// -----------------------------------------------------------------------------
// @brief  Commission on both sides plus transaction and special tax on
//         sells, as a pure function of the configured rates.
// -----------------------------------------------------------------------------
double tradingFee(const config::FeeConfig& fees, double price,
                  std::int64_t quantity, bool is_buy);

/// Binds a FeeConfig into a FeeFunction (copied by value).
FeeFunction makeFeeFunction(const config::FeeConfig& fees);

/// A FeeFunction that always returns 0. Used where fees are irrelevant.
FeeFunction zeroFees();

}  // namespace staged
