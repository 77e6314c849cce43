#include "staged/fees/fee_schedule.hpp"

namespace staged {

double tradingFee(const config::FeeConfig& fees, double price,
                  std::int64_t quantity, bool is_buy) {
  const double notional = price * static_cast<double>(quantity);
  double fee = notional * fees.commission_rate;
  if (!is_buy) {
    fee += notional * (fees.tax_rate + fees.special_tax_rate);
  }
  return fee;
}

FeeFunction makeFeeFunction(const config::FeeConfig& fees) {
  return [fees](double price, std::int64_t quantity, bool is_buy) {
    return tradingFee(fees, price, quantity, is_buy);
  };
}

FeeFunction zeroFees() {
  return [](double, std::int64_t, bool) { return 0.0; };
}

}  // namespace staged
