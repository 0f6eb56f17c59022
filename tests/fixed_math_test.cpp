#include <gtest/gtest.h>

#include "screen/fixed_math.hpp"

namespace fixed = screen::fixed;

TEST(FixedMathTest, IsqrtFloors) {
  EXPECT_EQ(fixed::isqrt(0U), 0U);
  EXPECT_EQ(fixed::isqrt(1U), 1U);
  EXPECT_EQ(fixed::isqrt(15U), 3U);
  EXPECT_EQ(fixed::isqrt(16U), 4U);
  EXPECT_EQ(fixed::isqrt(2496U), 49U);
  EXPECT_EQ(fixed::isqrt(4096U), 64U);
  EXPECT_EQ(fixed::isqrt(0xFFFFFFFFU), 65535U);
}

TEST(FixedMathTest, IsqrtWideInputs) {
  EXPECT_EQ(fixed::isqrt(10000000000ULL), 100000U);
  EXPECT_EQ(fixed::isqrt(10000000000ULL - 1U), 99999U);
  EXPECT_EQ(fixed::isqrt(0xFFFFFFFFFFFFFFFFULL), 0xFFFFFFFFU);
}

TEST(FixedMathTest, SineAtQuadrantBoundaries) {
  EXPECT_EQ(fixed::sin_q14(0), 0);
  EXPECT_EQ(fixed::sin_q14(900), fixed::kOne);
  EXPECT_EQ(fixed::sin_q14(1800), 0);
  EXPECT_EQ(fixed::sin_q14(2700), -fixed::kOne);
  EXPECT_EQ(fixed::sin_q14(3600), 0);
  EXPECT_EQ(fixed::cos_q14(0), fixed::kOne);
  EXPECT_EQ(fixed::cos_q14(900), 0);
  EXPECT_EQ(fixed::cos_q14(1800), -fixed::kOne);
}

TEST(FixedMathTest, SineHandlesNegativeAndWrappedAngles) {
  EXPECT_EQ(fixed::sin_q14(-900), -fixed::kOne);
  EXPECT_EQ(fixed::sin_q14(4500), fixed::kOne);
  EXPECT_EQ(fixed::sin_q14(300), 8192);
  EXPECT_EQ(fixed::sin_q14(1500), 8192);
  EXPECT_EQ(fixed::sin_q14(2100), -8192);
}

TEST(FixedMathTest, SineIsMonotonicInFirstQuadrant) {
  int32_t prev = fixed::sin_q14(0);
  for (int32_t d = 1; d <= 900; ++d) {
    const int32_t cur = fixed::sin_q14(d);
    EXPECT_GE(cur, prev) << "decideg " << d;
    prev = cur;
  }
}

TEST(FixedMathTest, RoundingHelpers) {
  EXPECT_EQ(fixed::round_div(5, 2), 3);
  EXPECT_EQ(fixed::round_div(-5, 2), -3);
  EXPECT_EQ(fixed::round_div(4, 3), 1);
  EXPECT_EQ(fixed::floor_div(7, 2), 3);
  EXPECT_EQ(fixed::floor_div(-7, 2), -4);
  EXPECT_EQ(fixed::floor_div(-6, 2), -3);
  EXPECT_EQ(fixed::scale_q14(49, fixed::kOne), 49);
  EXPECT_EQ(fixed::scale_q14(49, -fixed::kOne), -49);
  EXPECT_EQ(fixed::scale_q14(10, 8192), 5);
  EXPECT_EQ(fixed::clamp(12, 0, 10), 10);
  EXPECT_EQ(fixed::clamp(-1, 0, 10), 0);
}
