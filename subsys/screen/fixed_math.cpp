/**
 * @file fixed_math.cpp
 * @brief 定点数学实现：四分之一周期正弦表 + 线性插值。
 */

#include "screen/fixed_math.hpp"

namespace screen::fixed {

namespace {

/** @brief sin(0°..90°) * 16384，步长 1 度。 */
constexpr uint16_t kQuarterSine[91] = {
    0U,     286U,   572U,   857U,   1143U,  1428U,  1713U,  1997U,  2280U,  2563U,
    2845U,  3126U,  3406U,  3686U,  3964U,  4240U,  4516U,  4790U,  5063U,  5334U,
    5604U,  5872U,  6138U,  6402U,  6664U,  6924U,  7182U,  7438U,  7692U,  7943U,
    8192U,  8438U,  8682U,  8923U,  9162U,  9397U,  9630U,  9860U,  10087U, 10311U,
    10531U, 10749U, 10963U, 11174U, 11381U, 11585U, 11786U, 11982U, 12176U, 12365U,
    12551U, 12733U, 12911U, 13085U, 13255U, 13421U, 13583U, 13741U, 13894U, 14044U,
    14189U, 14330U, 14466U, 14598U, 14726U, 14849U, 14968U, 15082U, 15191U, 15296U,
    15396U, 15491U, 15582U, 15668U, 15749U, 15826U, 15897U, 15964U, 16026U, 16083U,
    16135U, 16182U, 16225U, 16262U, 16294U, 16322U, 16344U, 16362U, 16374U, 16382U,
    16384U,
};

/**
 * @brief 第一象限正弦（0~900 十分度），表间线性插值。
 * @param decideg 角度，范围 [0, 900]。
 * @return Q14 正弦值。
 */
int32_t quarter_sine(int32_t decideg) noexcept {
  const int32_t deg = decideg / 10;
  const int32_t frac = decideg % 10;
  if (frac == 0) {
    return kQuarterSine[deg];
  }
  const int32_t lo = kQuarterSine[deg];
  const int32_t hi = kQuarterSine[deg + 1];
  return lo + round_div(static_cast<int64_t>(hi - lo) * frac, 10);
}

}  // namespace

uint32_t isqrt(uint64_t v) noexcept {
  uint64_t result = 0U;
  uint64_t bit = 1ULL << 62;

  while (bit > v) {
    bit >>= 2;
  }

  /* 逐位试商法，不依赖浮点。 */
  while (bit != 0U) {
    if (v >= result + bit) {
      v -= result + bit;
      result = (result >> 1) + bit;
    } else {
      result >>= 1;
    }
    bit >>= 2;
  }
  return static_cast<uint32_t>(result);
}

int32_t sin_q14(int32_t decideg) noexcept {
  int32_t a = decideg % 3600;
  if (a < 0) {
    a += 3600;
  }

  if (a <= 900) {
    return quarter_sine(a);
  }
  if (a <= 1800) {
    return quarter_sine(1800 - a);
  }
  if (a <= 2700) {
    return -quarter_sine(a - 1800);
  }
  return -quarter_sine(3600 - a);
}

int32_t cos_q14(int32_t decideg) noexcept { return sin_q14(decideg + 900); }

}  // namespace screen::fixed
