/**
 * @file gallery.cpp
 * @brief 参考界面实现。
 */

#include "screen/gallery.hpp"

#include <errno.h>
#include <stdio.h>

namespace screen::gallery {

namespace {

const char* const kMenuItems[] = {
    "Temperature", "Humidity", "Distance", "Light", "Battery", "Proximity",
};

/* 0.1 精度定点数格式化为 "23.5"。 */
void format_tenths(int32_t v, char* buf, size_t len) noexcept {
  const char* sign = v < 0 ? "-" : "";
  const int64_t mag = v < 0 ? -static_cast<int64_t>(v) : v;
  (void)snprintf(buf, len, "%s%ld.%ld", sign, static_cast<long>(mag / 10), static_cast<long>(mag % 10));
}

int draw_temperature(Screen& s, const Inputs& in) noexcept {
  char buf[16];
  format_tenths(in.temperature_dc, buf, sizeof(buf));

  int ret = s.title("Temperature");
  if (ret < 0) {
    return ret;
  }
  ValueOptions vo;
  vo.unit = "C";
  ret = s.value(buf, vo);
  if (ret < 0) {
    return ret;
  }
  return s.subtitle("HTS221 sensor");
}

int draw_battery(Screen& s, const Inputs& in) noexcept {
  char pct[8];
  char mv[16];
  (void)snprintf(pct, sizeof(pct), "%ld%%", static_cast<long>(in.battery_percent));
  (void)snprintf(mv, sizeof(mv), "%ld mV", static_cast<long>(in.battery_mv));

  int ret = s.title("Battery");
  if (ret < 0) {
    return ret;
  }
  ValueOptions vo;
  vo.y_offset = -15;
  ret = s.value(pct, vo);
  if (ret < 0) {
    return ret;
  }
  ret = s.bar(in.battery_percent, 100, -12, colors::kGreen);
  if (ret < 0) {
    return ret;
  }
  const char* const lines[] = {mv, "BQ27441"};
  return s.subtitle(lines, 2U);
}

int draw_comfort(Screen& s, const Inputs& in) noexcept {
  char temp[16];
  format_tenths(in.temperature_dc, temp, sizeof(temp));

  int ret = s.title("Comfort");
  if (ret < 0) {
    return ret;
  }

  const Point c = s.center();
  ret = s.line(c.x, c.y - 32, c.x, c.y + 32, colors::kDark);
  if (ret < 0) {
    return ret;
  }

  ValueOptions left;
  left.unit = "C";
  left.label = "TEMP";
  left.at = Cardinal::kW;
  ret = s.value(temp, left);
  if (ret < 0) {
    return ret;
  }

  ValueOptions right;
  right.unit = "%";
  right.label = "HUM";
  right.at = Cardinal::kE;
  ret = s.value(in.humidity_percent, right);
  if (ret < 0) {
    return ret;
  }

  const char* const lines[] = {"Comfortable", "HTS221"};
  return s.subtitle(lines, 2U, colors::kGreen);
}

int draw_gauge(Screen& s, const Inputs& in) noexcept {
  int ret = s.gauge(in.distance_mm, 0, 500, "mm");
  if (ret < 0) {
    return ret;
  }
  ret = s.title("Distance");
  if (ret < 0) {
    return ret;
  }
  return s.subtitle("VL53L1X ToF");
}

int draw_graph(Screen& s, const Inputs& in) noexcept {
  int ret = s.title("Light (lux)");
  if (ret < 0) {
    return ret;
  }
  const size_t n = in.light_count > kGraphSamples ? kGraphSamples : in.light_count;
  ret = s.graph(in.light, n, 0, 1000);
  if (ret < 0) {
    return ret;
  }
  const char* const lines[] = {"APDS9960", "20s window"};
  return s.subtitle(lines, 2U);
}

int draw_menu(Screen& s, const Inputs& in) noexcept {
  int ret = s.title("Menu");
  if (ret < 0) {
    return ret;
  }
  return s.menu(kMenuItems, sizeof(kMenuItems) / sizeof(kMenuItems[0]), in.menu_selected);
}

}  // namespace

const char* page_name(Page page) noexcept {
  switch (page) {
    case Page::kTemperature:
      return "temperature";
    case Page::kBattery:
      return "battery";
    case Page::kComfort:
      return "comfort";
    case Page::kGauge:
      return "gauge";
    case Page::kGraph:
      return "graph";
    case Page::kMenu:
      return "menu";
    case Page::kCompass:
      return "compass";
    case Page::kFace:
      return "face";
    case Page::kWatch:
      return "watch";
  }
  return "?";
}

int draw(Screen& screen, Page page, const Inputs& inputs) noexcept {
  if (static_cast<size_t>(page) >= kPageCount) {
    return -EINVAL;
  }

  int ret = screen.clear();
  if (ret < 0) {
    return ret;
  }

  switch (page) {
    case Page::kTemperature:
      ret = draw_temperature(screen, inputs);
      break;
    case Page::kBattery:
      ret = draw_battery(screen, inputs);
      break;
    case Page::kComfort:
      ret = draw_comfort(screen, inputs);
      break;
    case Page::kGauge:
      ret = draw_gauge(screen, inputs);
      break;
    case Page::kGraph:
      ret = draw_graph(screen, inputs);
      break;
    case Page::kMenu:
      ret = draw_menu(screen, inputs);
      break;
    case Page::kCompass:
      ret = screen.compass(inputs.heading_deg);
      break;
    case Page::kFace:
      ret = screen.face(inputs.face);
      break;
    case Page::kWatch:
      ret = screen.watch(inputs.hours, inputs.minutes, inputs.seconds);
      break;
  }
  if (ret < 0) {
    return ret;
  }
  return screen.show();
}

}  // namespace screen::gallery
