#pragma once
/**
 * @file input/category.hpp
 * @brief Style categories and the label classifier.
 */

#include <keycast/core.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace keycast {
namespace input {

/**
 * @enum KeyCategory
 * @brief Style grouping assigned to a normalized label.
 *
 * Closed set. Switches over this enum deliberately carry no `default` so the
 * compiler reports every switch that misses a newly added value.
 */
enum class KeyCategory : uint8_t {
  Escape,
  Normal,
  Numeric,
  Modifier,
  Editor,
  Navigation,
  Scrollable,
  Space,
  Symbol,
  Unknown,
  Function,
  AltFunction,
  Mouse,
};

inline constexpr std::size_t kKeyCategoryCount = 13;

/// Every category, in declaration order.
KEYCAST_API const std::array<KeyCategory, kKeyCategoryCount> &allCategories();

/**
 * @brief Classify a normalized label.
 *
 * Matching is ASCII case-insensitive and strictly priority ordered:
 * Mouse, Escape, Modifier, Editor, Navigation, Scrollable, Space, Symbol,
 * Function (`f1`..`f24`), AltFunction (media keyword substring), Numeric
 * (all digits), Normal (all letters), then Unknown. The empty string is
 * Unknown.
 */
KEYCAST_API KeyCategory classify(const std::string &label);

/// Lowercase configuration key of a category ("altfunction").
KEYCAST_API const char *categoryName(KeyCategory category);

/// Parse a configuration key (case-insensitive) into a category.
KEYCAST_API std::optional<KeyCategory> parseCategory(const std::string &name);

} // namespace input
} // namespace keycast
