#pragma once
/**
 * @file display/style.hpp
 * @brief Per-category visual styles.
 */

#include <keycast/core.hpp>
#include <keycast/input/category.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace keycast {
namespace display {

/**
 * @struct Color
 * @brief 8-bit RGBA color.
 */
struct Color {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
  uint8_t a{255};

  bool operator==(const Color &) const = default;
};

/**
 * @brief Parse `#RRGGBB` or `RRGGBB` (hex digits in either case).
 * @return std::nullopt for any other shape.
 */
KEYCAST_API std::optional<Color> parseHexColor(const std::string &text);

/// Format as lowercase `#rrggbb` (alpha is not written).
KEYCAST_API std::string toHexString(const Color &color);

/**
 * @struct Style
 * @brief Visual parameters of one category's key box.
 */
struct Style {
  float width{90.0f};
  float height{90.0f};
  float iconSize{0.0f};
  float textSize{24.0f};
  Color background{0x3c, 0x3c, 0x3c, 0xff};
  Color foreground{0xff, 0xff, 0xff, 0xff};

  bool operator==(const Style &) const = default;
};

/// Style used for a category the sheet has no entry for.
KEYCAST_API Style fallbackStyle();

/// Built-in default style of @p category.
KEYCAST_API Style defaultStyle(input::KeyCategory category);

/**
 * @class StyleSheet
 * @brief Mapping KeyCategory -> Style with fallback lookup.
 *
 * A default-constructed sheet is empty (every lookup yields the fallback
 * style); `StyleSheet::defaults()` holds the built-in style of every
 * category.
 */
class KEYCAST_API StyleSheet {
public:
  StyleSheet() = default;

  static StyleSheet defaults();

  void set(input::KeyCategory category, const Style &style);
  void erase(input::KeyCategory category);
  [[nodiscard]] bool has(input::KeyCategory category) const;

  /// Style for @p category, or fallbackStyle() when unset.
  [[nodiscard]] const Style &get(input::KeyCategory category) const;

  bool operator==(const StyleSheet &) const = default;

private:
  std::array<std::optional<Style>, input::kKeyCategoryCount> m_styles{};
};

} // namespace display
} // namespace keycast
