/**
 * @file draw_list.cpp
 * @brief 记录型后端实现。
 */

#include "screen/draw_list.hpp"

#include <errno.h>
#include <string.h>

namespace screen {

int DrawList::push(const DrawCommand& cmd) noexcept {
  if (size_ >= capacity_) {
    ++dropped_;
    return -ENOMEM;
  }
  cmds_[size_++] = cmd;
  return 0;
}

int DrawList::push_text(DrawOp op, const char* str, int32_t x, int32_t y, Color color,
                        uint8_t param) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }

  DrawCommand cmd;
  cmd.op = op;
  cmd.color = color;
  cmd.x = x;
  cmd.y = y;
  cmd.param = param;
  strncpy(cmd.text, str, DrawCommand::kMaxText);
  cmd.text[DrawCommand::kMaxText] = '\0';
  return push(cmd);
}

int DrawList::fill(Color color) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kFill;
  cmd.color = color;
  return push(cmd);
}

int DrawList::pixel(int32_t x, int32_t y, Color color) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kPixel;
  cmd.color = color;
  cmd.x = x;
  cmd.y = y;
  return push(cmd);
}

int DrawList::line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kLine;
  cmd.color = color;
  cmd.x = x1;
  cmd.y = y1;
  cmd.x2 = x2;
  cmd.y2 = y2;
  return push(cmd);
}

int DrawList::text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  return push_text(DrawOp::kText, str, x, y, color, 1U);
}

int DrawList::show() noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kShow;
  return push(cmd);
}

int DrawList::fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kFillRect;
  cmd.color = color;
  cmd.x = x;
  cmd.y = y;
  cmd.w = w;
  cmd.h = h;
  return push(cmd);
}

int DrawList::rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kRect;
  cmd.color = color;
  cmd.x = x;
  cmd.y = y;
  cmd.w = w;
  cmd.h = h;
  return push(cmd);
}

int DrawList::draw_scaled_text(const char* str, int32_t x, int32_t y, Color color,
                               uint8_t scale) noexcept {
  return push_text(DrawOp::kScaledText, str, x, y, color, scale);
}

int DrawList::draw_small_text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  return push_text(DrawOp::kSmallText, str, x, y, color, 1U);
}

int DrawList::draw_medium_text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  return push_text(DrawOp::kMediumText, str, x, y, color, 1U);
}

int DrawList::draw_arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg, int32_t sweep_deg,
                       Color color, uint8_t width) noexcept {
  DrawCommand cmd;
  cmd.op = DrawOp::kArc;
  cmd.color = color;
  cmd.x = cx;
  cmd.y = cy;
  cmd.r = r;
  cmd.start_deg = start_deg;
  cmd.sweep_deg = sweep_deg;
  cmd.param = width;
  return push(cmd);
}

size_t DrawList::count(DrawOp op) const noexcept {
  size_t n = 0U;
  for (const DrawCommand& c : *this) {
    if (c.op == op) {
      ++n;
    }
  }
  return n;
}

int DrawList::replay(IPixelBackend& target) const noexcept {
  for (const DrawCommand& c : *this) {
    int ret = 0;
    switch (c.op) {
      case DrawOp::kFill:
        ret = target.fill(c.color);
        break;
      case DrawOp::kPixel:
        ret = target.pixel(c.x, c.y, c.color);
        break;
      case DrawOp::kLine:
        ret = target.line(c.x, c.y, c.x2, c.y2, c.color);
        break;
      case DrawOp::kText:
        ret = target.text(c.text, c.x, c.y, c.color);
        break;
      case DrawOp::kShow:
        ret = target.show();
        break;
      case DrawOp::kFillRect:
        ret = target.fill_rect(c.x, c.y, c.w, c.h, c.color);
        break;
      case DrawOp::kRect:
        ret = target.rect(c.x, c.y, c.w, c.h, c.color);
        break;
      case DrawOp::kScaledText:
        ret = target.draw_scaled_text(c.text, c.x, c.y, c.color, c.param);
        break;
      case DrawOp::kSmallText:
        ret = target.draw_small_text(c.text, c.x, c.y, c.color);
        break;
      case DrawOp::kMediumText:
        ret = target.draw_medium_text(c.text, c.x, c.y, c.color);
        break;
      case DrawOp::kArc:
        ret = target.draw_arc(c.x, c.y, c.r, c.start_deg, c.sweep_deg, c.color, c.param);
        break;
    }
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

}  // namespace screen
