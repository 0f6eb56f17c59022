/**
 * @file screen.hpp
 * @brief 圆形屏幕高层绘制接口：控件（标题、数值、进度条、仪表、曲线、菜单、罗盘、表盘、表情）
 *        + 方位文本 + 基本图形。
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "platform/ilogger.hpp"
#include "screen/color.hpp"
#include "screen/faces.hpp"
#include "screen/ipixel_backend.hpp"
#include "screen/layout.hpp"

namespace screen {

/**
 * @brief value() 控件参数。
 */
struct ValueOptions {
  /** @brief 单位文本（显示在数值下方），nullptr 表示无。 */
  const char* unit = nullptr;
  /** @brief 标签文本（显示在数值上方），nullptr 表示无。 */
  const char* label = nullptr;
  /** @brief 水平预设：CENTER / W（左四分之一）/ E（右四分之一）；其他方位走布局解析。 */
  Cardinal at = Cardinal::kCenter;
  /** @brief 数值颜色。 */
  Color color = colors::kWhite;
  /** @brief 数值字体缩放倍数。 */
  uint8_t scale = 2U;
  /** @brief 垂直偏移（像素，正值向下）。 */
  int32_t y_offset = 0;
};

/**
 * @brief face() 控件参数。
 */
struct FaceOptions {
  /** @brief 点亮格颜色。 */
  Color color = colors::kWhite;
  /** @brief 紧凑模式：缩小并上移，给标题/副标题留出空间。 */
  bool compact = false;
};

/**
 * @brief 罗盘指针几何（供绘制与测试使用）。
 */
struct NeedleGeometry {
  /** @brief 指向航向的针尖。 */
  Point tip;
  /** @brief 反向针尾。 */
  Point tail;
  /** @brief 垂直底边一端。 */
  Point base_a;
  /** @brief 垂直底边另一端。 */
  Point base_b;
};

/**
 * @brief 表盘三针角度，单位 0.1 度，12 点方向为 0，顺时针。
 */
struct HandAngles {
  int32_t hour = 0;
  int32_t minute = 0;
  int32_t second = 0;
};

/**
 * @brief 计算钳位后的比例（千分比）。
 * @return clamp((value-min)/(max-min), 0, 1) * 1000；max == min 视为单位跨度。
 */
int32_t ratio_permille(int32_t value, int32_t min, int32_t max) noexcept;

/**
 * @brief 仪表前景弧扫过角度（整度，截断）。
 * @return 0 ~ 270。
 */
int32_t gauge_sweep(int32_t value, int32_t min, int32_t max) noexcept;

/**
 * @brief 进度条填充宽度。
 * @param track_w 轨道宽度。
 * @return floor(track_w * clamp(value,0,max) / max)；max <= 0 时为 0。
 */
int32_t bar_fill_width(int32_t track_w, int32_t value, int32_t max) noexcept;

/**
 * @brief 计算菜单可见窗口起点。
 * @return clamp(selected - visible/2, 0, count - visible)。
 */
size_t menu_window_start(size_t count, size_t selected, size_t visible) noexcept;

/**
 * @brief 坐标轴标签格式化，>= 1000 时使用 "k" 后缀（整千 "2k"，否则 "1.5k"）。
 * @param[out] buf 输出缓冲。
 * @param len 缓冲长度。
 * @return snprintf 返回值；负值表示格式化失败。
 */
int format_axis_label(int32_t value, char* buf, size_t len) noexcept;

/**
 * @brief 计算罗盘指针几何。
 * @param center 旋转中心。
 * @param length 针长（像素）。
 * @param heading_deg 航向（度，正北为 0，顺时针）。
 * @param half_width 底边半宽（像素）。
 */
NeedleGeometry compass_needle(Point center, int32_t length, int32_t heading_deg,
                              int32_t half_width) noexcept;

/**
 * @brief 计算表盘三针角度。
 * @return hour=(h%12)*300+m*5, minute=m*60+s, second=s*60（0.1 度）。
 */
HandAngles hand_angles(int32_t hours, int32_t minutes, int32_t seconds) noexcept;

/**
 * @brief 圆形屏幕绘制器。
 * @note 立即模式、无状态：每次调用完整光栅化后返回，不在调用间保留任何绘制状态。
 *       同一 Screen/后端组合不可被多个线程并发调用。
 *       控件之间存在绘制顺序依赖（例如 gauge/face 应先于 title/subtitle 绘制），由调用方保证。
 *       所有接口在首次调用时惰性 init()；返回 0 表示成功，负值为后端或几何错误码。
 */
class Screen {
 public:
  /** @brief 菜单/副标题单行最大字符数。 */
  static constexpr size_t kMaxLineChars = 40U;
  /** @brief 副标题最大行数。 */
  static constexpr size_t kMaxSubtitleLines = 4U;

  /**
   * @brief 绑定后端与日志接口。
   * @param backend 像素后端，生命周期必须覆盖 Screen 的使用期。
   * @param log 日志接口。
   */
  Screen(IPixelBackend& backend, platform::ILogger& log) : be_(backend), log_(log) {}

  /**
   * @brief 校验后端几何并缓存视口（幂等）。
   * @return 0 表示成功；-EINVAL 表示后端宽高为 0（配置错误）。
   */
  int init() noexcept;

  /** @brief 是否已初始化。 */
  bool ready() const noexcept { return initialized_; }

  /** @brief 当前视口。 */
  const Viewport& viewport() const noexcept { return layout_.viewport(); }

  /** @brief 布局解析器。 */
  const Layout& layout() const noexcept { return layout_; }

  /** @brief 屏幕中心。 */
  Point center() const noexcept { return viewport().center(); }

  /** @brief 内切圆半径。 */
  int32_t radius() const noexcept { return viewport().radius(); }

  /** @brief 一行可容纳的 1 倍字符数。 */
  int32_t max_chars() const noexcept { return viewport().max_chars(); }

  /* ---------------- 控件 ---------------- */

  /**
   * @brief 顶部（N）标题。
   */
  int title(const char* text, Color color = colors::kGray) noexcept;

  /**
   * @brief 底部（S）单行副标题。
   */
  int subtitle(const char* text, Color color = colors::kDark) noexcept;

  /**
   * @brief 底部多行副标题，整体以 S 锚点为中心垂直居中，行距 10 像素。
   * @param lines 行数组。
   * @param count 行数，超过 kMaxSubtitleLines 的部分忽略。
   */
  int subtitle(const char* const* lines, size_t count, Color color = colors::kDark) noexcept;

  /**
   * @brief 大号数值读数，可带上方标签、下方单位。
   * @note 标签 + 数值 + 单位作为一个整体垂直居中。
   */
  int value(const char* text, const ValueOptions& opts = ValueOptions{}) noexcept;

  /**
   * @brief 整数读数重载。
   */
  int value(int32_t v, const ValueOptions& opts = ValueOptions{}) noexcept;

  /**
   * @brief 中心下方的水平进度条。
   * @param value 当前值。
   * @param max 满量程；<= 0 时不填充。
   * @param y_offset 垂直偏移。
   */
  int bar(int32_t value, int32_t max = 100, int32_t y_offset = 0,
          Color color = colors::kLight) noexcept;

  /**
   * @brief 270 度圆弧仪表（底部缺口），中心显示数值与单位，两端显示量程。
   * @note 应先于 title/subtitle 绘制。
   */
  int gauge(int32_t value, int32_t min, int32_t max, const char* unit = nullptr,
            Color color = colors::kLight) noexcept;

  /**
   * @brief 下半屏折线图：坐标轴、虚线中线、三个 Y 轴标签、折线，最新值显示在上方。
   * @param samples 样本数组，count 为 0 时可为 nullptr。
   * @param count 样本数，少于 2 个时只画坐标轴。
   */
  int graph(const int32_t* samples, size_t count, int32_t min, int32_t max,
            Color color = colors::kLight) noexcept;

  /**
   * @brief 垂直滚动菜单，选中行高亮并带 ">" 前缀。
   */
  int menu(const char* const* items, size_t count, size_t selected,
           Color color = colors::kWhite) noexcept;

  /**
   * @brief 罗盘：刻度圈、8 个刻度、4 个方位字母、双色指针。
   * @param heading_deg 航向（度，正北为 0，顺时针）。
   */
  int compass(int32_t heading_deg, Color color = colors::kLight) noexcept;

  /**
   * @brief 指针式表盘。
   */
  int watch(int32_t hours, int32_t minutes, int32_t seconds,
            Color color = colors::kWhite) noexcept;

  /**
   * @brief 命名表情。未知名称不绘制，返回 0。
   * @note 应先于 title/subtitle 绘制。
   */
  int face(const char* expression, const FaceOptions& opts = FaceOptions{}) noexcept;

  /**
   * @brief 自定义 8x8 位图表情。
   */
  int face(const FaceBitmap& bitmap, const FaceOptions& opts = FaceOptions{}) noexcept;

  /* ---------------- 方位文本与图形 ---------------- */

  /**
   * @brief 在方位锚点绘制文本。
   */
  int text(const char* str, Cardinal at = Cardinal::kCenter, Color color = colors::kWhite,
           uint8_t scale = 1U) noexcept;

  /**
   * @brief 在绝对坐标绘制文本。
   */
  int text_at(const char* str, int32_t x, int32_t y, Color color = colors::kWhite,
              uint8_t scale = 1U) noexcept;

  int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2,
           Color color = colors::kWhite) noexcept;

  int circle(int32_t cx, int32_t cy, int32_t r, Color color = colors::kWhite,
             bool fill = false) noexcept;

  int rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color = colors::kWhite,
           bool fill = false) noexcept;

  int arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg, int32_t sweep_deg,
          Color color = colors::kWhite, uint8_t width = 3U) noexcept;

  int triangle(Point a, Point b, Point c, Color color = colors::kWhite) noexcept;

  int pixel(int32_t x, int32_t y, Color color = colors::kWhite) noexcept;

  /* ---------------- 控制 ---------------- */

  /** @brief 全屏清除。 */
  int clear(Color color = colors::kBlack) noexcept;

  /** @brief 提交（后端定义）。 */
  int show() noexcept;

 private:
  /** @brief 以指定缩放绘制文本（1 倍直接 text，其余走 draw_scaled_text）。 */
  int scaled_text(const char* str, int32_t x, int32_t y, Color color, uint8_t scale) noexcept;

  /** @brief 以 x 为中心水平居中绘制 1 倍文本。 */
  int centered_text(const char* str, int32_t cx, int32_t y, Color color) noexcept;

  /** @brief 绘制罗盘/表盘的径向刻度。 */
  int radial_tick(int32_t decideg, int32_t inner, int32_t outer, Color color,
                  bool bold) noexcept;

  /** @brief 绘制从中心出发的三角形指针。 */
  int triangle_hand(int32_t decideg, int32_t length, int32_t half_width, Color color) noexcept;

  IPixelBackend& be_;
  platform::ILogger& log_;
  Layout layout_{Viewport{}};
  bool initialized_ = false;
  bool geometry_error_reported_ = false;
};

}  // namespace screen
