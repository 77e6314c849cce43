// =============================================================================
// fee_schedule_test.cpp
// =============================================================================
// Commission applies to both sides; transaction and special tax only to
// sells.
// =============================================================================

#include "staged/fees/fee_schedule.hpp"

#include <gtest/gtest.h>

TEST(FeeScheduleTest, BuyPaysCommissionOnly) {
  staged::config::FeeConfig fees;
  fees.commission_rate = 0.001;
  fees.tax_rate = 0.002;
  fees.special_tax_rate = 0.003;

  EXPECT_NEAR(staged::tradingFee(fees, 10000.0, 10, true), 100.0, 1e-9);
}

TEST(FeeScheduleTest, SellAddsTaxes) {
  staged::config::FeeConfig fees;
  fees.commission_rate = 0.001;
  fees.tax_rate = 0.002;
  fees.special_tax_rate = 0.003;

  EXPECT_NEAR(staged::tradingFee(fees, 10000.0, 10, false), 600.0, 1e-9);

  const auto fn = staged::makeFeeFunction(fees);
  EXPECT_NEAR(fn(10000.0, 10, false), 600.0, 1e-9);
  EXPECT_DOUBLE_EQ(staged::zeroFees()(10000.0, 10, false), 0.0);
}
