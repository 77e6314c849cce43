#pragma once

#include <cstdint>
#include <string>

namespace staged {
namespace domain {

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderFill — broker confirmation of a placed order
// -----------------------------------------------------------------------------
// Returned by IOrderExecutor only once the order is confirmed. The ledger is
// mutated from the fill's price and quantity, never from the request.
// -----------------------------------------------------------------------------
struct OrderFill {
  std::string order_id;
  std::string code;
  Side side{Side::Buy};
  double price{0.0};
  std::int64_t quantity{0};
  std::int64_t timestamp_ms{0};
};

inline const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace staged
