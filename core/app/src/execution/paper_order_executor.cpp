#include "staged/execution/paper_order_executor.hpp"
#include "staged/domain/errors.hpp"

#include <iostream>

namespace staged {

PaperOrderExecutor::PaperOrderExecutor(const ITimeProvider& time_provider,
                                       int order_timeout_seconds)
    : time_provider_(time_provider),
      order_timeout_seconds_(order_timeout_seconds) {}

domain::OrderFill PaperOrderExecutor::placeBuy(const std::string& code,
                                               double price,
                                               std::int64_t quantity) {
  return place(code, domain::Side::Buy, price, quantity);
}

domain::OrderFill PaperOrderExecutor::placeSell(const std::string& code,
                                                double price,
                                                std::int64_t quantity) {
  return place(code, domain::Side::Sell, price, quantity);
}

void PaperOrderExecutor::script(const std::string& code, PaperOutcome outcome) {
  std::lock_guard lock(mutex_);
  scripted_[code].push_back(outcome);
}

std::vector<domain::OrderFill> PaperOrderExecutor::fills() const {
  std::lock_guard lock(mutex_);
  return fills_;
}

std::int64_t PaperOrderExecutor::holding(const std::string& code) const {
  std::lock_guard lock(mutex_);
  auto it = holdings_.find(code);
  return it == holdings_.end() ? 0 : it->second;
}

void PaperOrderExecutor::setHolding(const std::string& code,
                                    std::int64_t quantity) {
  std::lock_guard lock(mutex_);
  holdings_[code] = quantity;
}

// -----------------------------------------------------------------------------
// place: consume the scripted outcome (if any), then confirm at the
// requested price and quantity
// -----------------------------------------------------------------------------
domain::OrderFill PaperOrderExecutor::place(const std::string& code,
                                            domain::Side side, double price,
                                            std::int64_t quantity) {
  if (quantity <= 0 || !(price > 0.0)) {
    throw OrderRejected(code + ": invalid order " + std::to_string(quantity) +
                        " @ " + std::to_string(price));
  }

  PaperOutcome outcome = PaperOutcome::Fill;
  {
    std::lock_guard lock(mutex_);
    if (side == domain::Side::Sell && quantity > holdings_[code]) {
      throw OrderRejected(code + ": cannot sell " + std::to_string(quantity) +
                          ", paper holding is " +
                          std::to_string(holdings_[code]));
    }
    auto it = scripted_.find(code);
    if (it != scripted_.end() && !it->second.empty()) {
      outcome = it->second.front();
      it->second.pop_front();
    }
  }

  switch (outcome) {
    case PaperOutcome::Reject:
      throw OrderRejected(code + ": " + domain::sideToString(side) +
                          " rejected by paper broker");
    case PaperOutcome::Timeout:
      throw OrderTimeout(code + ": " + domain::sideToString(side) +
                         " not confirmed within " +
                         std::to_string(order_timeout_seconds_) + "s");
    case PaperOutcome::Fill:
      break;
  }

  domain::OrderFill fill;
  fill.order_id = "PAPER-" + std::to_string(next_id_.fetch_add(1));
  fill.code = code;
  fill.side = side;
  fill.price = price;
  fill.quantity = quantity;
  fill.timestamp_ms = time_provider_.now_ms();

  std::cout << "[PaperOrderExecutor] " << fill.order_id << " "
            << domain::sideToString(side) << " " << code << " " << quantity
            << " @ " << price << "\n";

  std::lock_guard lock(mutex_);
  fills_.push_back(fill);
  holdings_[code] += side == domain::Side::Buy ? quantity : -quantity;
  return fill;
}

}  // namespace staged
