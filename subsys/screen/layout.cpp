/**
 * @file layout.cpp
 * @brief 方位布局解析实现。
 */

#include "screen/layout.hpp"

#include <ctype.h>
#include <errno.h>

#include "screen/fixed_math.hpp"

namespace screen {

namespace {

/** @brief 方位名称表，顺序与 Cardinal 枚举一致。 */
constexpr const char* kCardinalNames[] = {
    "N", "NE", "E", "SE", "S", "SW", "W", "NW", "CENTER",
};

/**
 * @brief 大小写不敏感的字符串比较。
 */
bool equals_ignore_case(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (toupper(static_cast<unsigned char>(*a)) != toupper(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == '\0' && *b == '\0';
}

}  // namespace

int parse_cardinal(const char* name, Cardinal& out) noexcept {
  if (name == nullptr) {
    return -EINVAL;
  }

  for (size_t i = 0U; i < sizeof(kCardinalNames) / sizeof(kCardinalNames[0]); ++i) {
    if (equals_ignore_case(name, kCardinalNames[i])) {
      out = static_cast<Cardinal>(i);
      return 0;
    }
  }
  if (equals_ignore_case(name, "C")) {
    out = Cardinal::kCenter;
    return 0;
  }
  return -EINVAL;
}

const char* cardinal_name(Cardinal at) noexcept {
  const size_t idx = static_cast<size_t>(at);
  if (idx >= sizeof(kCardinalNames) / sizeof(kCardinalNames[0])) {
    return "CENTER";
  }
  return kCardinalNames[idx];
}

int32_t Layout::margin_ns(int32_t text_w, int32_t from_edge) const noexcept {
  const int32_t r = vp_.radius();
  const int32_t half_tw = text_w / 2;
  if (half_tw >= r) {
    /* 文本比内切圆还宽，只能推向垂直中心。 */
    return r;
  }

  /* 距圆心 d 处可用宽度为 2*sqrt(r^2 - d^2)，取可容纳 text_w 的最大 d。 */
  const uint32_t max_d = fixed::isqrt(static_cast<uint32_t>(r * r - half_tw * half_tw));
  const int32_t min_margin = r - static_cast<int32_t>(max_d);
  const int32_t padded = min_margin + kNsPadding;
  return padded > from_edge ? padded : from_edge;
}

Point Layout::resolve(Cardinal at, size_t text_len, uint8_t scale) const noexcept {
  if (scale == 0U) {
    scale = 1U;
  }

  const Point c = vp_.center();
  const int32_t w = static_cast<int32_t>(vp_.width);
  const int32_t h = static_cast<int32_t>(vp_.height);
  const int32_t ch = 8 * static_cast<int32_t>(scale);
  const int32_t tw = static_cast<int32_t>(text_len) * 8 * static_cast<int32_t>(scale);

  const int32_t mns = margin_ns(tw, ch);
  const int32_t mew = margin_ew(scale);

  switch (at) {
    case Cardinal::kN:
      return Point{c.x - tw / 2, mns};
    case Cardinal::kNE:
      return Point{w - mew - tw, mns};
    case Cardinal::kE:
      return Point{w - mew - tw, c.y - ch / 2};
    case Cardinal::kSE:
      return Point{w - mew - tw, h - mns - ch};
    case Cardinal::kS:
      return Point{c.x - tw / 2, h - mns - ch};
    case Cardinal::kSW:
      return Point{mew, h - mns - ch};
    case Cardinal::kW:
      return Point{mew, c.y - ch / 2};
    case Cardinal::kNW:
      return Point{mew, mns};
    case Cardinal::kCenter:
    default:
      break;
  }
  return Point{c.x - tw / 2, c.y - ch / 2};
}

}  // namespace screen
