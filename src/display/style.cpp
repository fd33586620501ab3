/**
 * @file display/style.cpp
 * @brief Colors, built-in styles and the StyleSheet lookup.
 */

#include <keycast/display/style.hpp>

#include <cstdio>

namespace keycast::display {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

Style make(float w, float h, float icon, float text, uint32_t bg) {
  Style s;
  s.width = w;
  s.height = h;
  s.iconSize = icon;
  s.textSize = text;
  s.background = Color{static_cast<uint8_t>((bg >> 16) & 0xFF),
                       static_cast<uint8_t>((bg >> 8) & 0xFF),
                       static_cast<uint8_t>(bg & 0xFF), 0xFF};
  s.foreground = Color{0xFF, 0xFF, 0xFF, 0xFF};
  return s;
}

} // namespace

KEYCAST_API std::optional<Color> parseHexColor(const std::string &text) {
  std::string hex = text;
  if (!hex.empty() && hex.front() == '#')
    hex.erase(0, 1);
  if (hex.size() != 6)
    return std::nullopt;

  uint8_t channels[3];
  for (int i = 0; i < 3; ++i) {
    int hi = hexValue(hex[2 * i]);
    int lo = hexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    channels[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return Color{channels[0], channels[1], channels[2], 0xFF};
}

KEYCAST_API std::string toHexString(const Color &color) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
  return buf;
}

KEYCAST_API Style fallbackStyle() { return make(90, 90, 0, 24, 0x3c3c3c); }

KEYCAST_API Style defaultStyle(input::KeyCategory category) {
  using input::KeyCategory;
  switch (category) {
  case KeyCategory::Normal:
    return make(90, 90, 0, 20, 0x1e1e30);
  case KeyCategory::Modifier:
    return make(120, 90, 25, 18, 0x32283c);
  case KeyCategory::Editor:
    return make(90, 90, 18, 22, 0x3f2e2e);
  case KeyCategory::Navigation:
    return make(90, 90, 20, 22, 0x2e3f2e);
  case KeyCategory::Scrollable:
    return make(90, 90, 20, 22, 0x2e3f2e);
  case KeyCategory::Numeric:
    return make(90, 90, 0, 24, 0x2e2e2e);
  case KeyCategory::Symbol:
    return make(90, 90, 20, 24, 0x3c2e2e);
  case KeyCategory::Space:
    return make(260, 90, 20, 28, 0x888888);
  case KeyCategory::Escape:
    return make(90, 90, 20, 22, 0xaa1111);
  case KeyCategory::Unknown:
    return make(90, 90, 14, 22, 0x555555);
  case KeyCategory::Function:
    return make(90, 90, 14, 22, 0x001155);
  case KeyCategory::AltFunction:
    return make(90, 90, 14, 22, 0x004488);
  case KeyCategory::Mouse:
    return make(90, 90, 0, 24, 0x801155);
  }
  return fallbackStyle();
}

StyleSheet StyleSheet::defaults() {
  StyleSheet sheet;
  for (input::KeyCategory c : input::allCategories())
    sheet.set(c, defaultStyle(c));
  return sheet;
}

void StyleSheet::set(input::KeyCategory category, const Style &style) {
  m_styles[static_cast<std::size_t>(category)] = style;
}

void StyleSheet::erase(input::KeyCategory category) {
  m_styles[static_cast<std::size_t>(category)].reset();
}

bool StyleSheet::has(input::KeyCategory category) const {
  return m_styles[static_cast<std::size_t>(category)].has_value();
}

const Style &StyleSheet::get(input::KeyCategory category) const {
  static const Style kFallback = fallbackStyle();
  const auto &slot = m_styles[static_cast<std::size_t>(category)];
  return slot ? *slot : kFallback;
}

} // namespace keycast::display
