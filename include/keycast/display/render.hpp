#pragma once
/**
 * @file display/render.hpp
 * @brief Draw primitives, per-category templates and the surface interface.
 *
 * The overlay core never talks to a windowing system directly. Each frame it
 * produces a DrawList of positioned primitives and hands it to a
 * RenderSurface.
 */

#include <keycast/core.hpp>
#include <keycast/display/style.hpp>
#include <keycast/input/category.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace keycast {
namespace display {

struct Point {
  float x{0};
  float y{0};

  bool operator==(const Point &) const = default;
};

struct Rect {
  float x{0};
  float y{0};
  float width{0};
  float height{0};

  [[nodiscard]] float left() const { return x; }
  [[nodiscard]] float top() const { return y; }
  [[nodiscard]] float right() const { return x + width; }
  [[nodiscard]] float bottom() const { return y + height; }
  [[nodiscard]] Point center() const {
    return {x + width / 2.0f, y + height / 2.0f};
  }

  bool operator==(const Rect &) const = default;
};

/// Which point of the text's extent is placed at the anchor position.
enum class TextAnchor : uint8_t {
  CenterCenter,
  RightTop,
  RightBottom,
};

struct FillRect {
  Rect rect;
  float cornerRadius{0};
  Color color;
};

struct DrawText {
  Point position;
  TextAnchor anchor{TextAnchor::CenterCenter};
  std::string text;
  float fontSize{0};
  Color color;
};

using DrawCommand = std::variant<FillRect, DrawText>;
using DrawList = std::vector<DrawCommand>;

/**
 * @enum RenderTemplate
 * @brief Placement of icon and label inside a key box.
 *
 * - Centered: label centred, icon not drawn.
 * - Corner: icon top-right, label bottom-right.
 * - Stacked: icon above label, both left of the right edge.
 * - Generic: icon above label, horizontally centred.
 */
enum class RenderTemplate : uint8_t {
  Centered,
  Corner,
  Stacked,
  Generic,
};

inline constexpr float kBoxCornerRadius = 8.0f;

/// Template used for @p category. Total over KeyCategory.
KEYCAST_API RenderTemplate templateFor(input::KeyCategory category);

/**
 * @brief Append the primitives of one key box to @p out.
 *
 * Emits the background box followed by the icon (only when non-empty and the
 * template draws icons) and the label.
 */
KEYCAST_API void appendKeyBox(DrawList &out, const Rect &box,
                              const Style &style, RenderTemplate tmpl,
                              const std::string &icon,
                              const std::string &text);

/**
 * @struct WindowGeometry
 * @brief Placement of the overlay window on screen.
 */
struct WindowGeometry {
  int monitor{0};
  float x{500.0f};
  float y{500.0f};
  float width{800.0f};
  float height{120.0f};

  bool operator==(const WindowGeometry &) const = default;
};

/**
 * @class RenderSurface
 * @brief Destination of the per-frame draw list.
 */
class KEYCAST_API RenderSurface {
public:
  virtual ~RenderSurface() = default;

  /// Drawable area in surface coordinates.
  [[nodiscard]] virtual Rect bounds() const = 0;

  /// Move/resize the surface to @p geometry.
  virtual void applyGeometry(const WindowGeometry &geometry) = 0;

  /**
   * @brief Process pending windowing events.
   * @return false once the surface has been closed.
   */
  virtual bool pumpEvents() = 0;

  /// Replace the surface contents with @p commands.
  virtual void present(const DrawList &commands) = 0;
};

} // namespace display
} // namespace keycast
