/**
 * @file input/layout.cpp
 * @brief Layout detection and US/UK shifted-label tables.
 */

#include <keycast/input/labels.hpp>
#include <keycast/input/layout.hpp>
#include <keycast/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace keycast::input {

namespace {

void trim(std::string &s) {
  const char *ws = " \t\r\n";
  size_t a = s.find_first_not_of(ws);
  if (a == std::string::npos) {
    s.clear();
    return;
  }
  size_t b = s.find_last_not_of(ws);
  s = s.substr(a, b - a + 1);
}

std::string toLower(std::string s) {
  std::ranges::transform(s, s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Read XKBLAYOUT from a shell-style `KEY="value"` file.
std::string layoutFromKeyboardFile(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    return {};
  std::string line;
  while (std::getline(f, line)) {
    size_t comment = line.find('#');
    if (comment != std::string::npos)
      line = line.substr(0, comment);
    trim(line);
    if (line.empty())
      continue;
    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string key = line.substr(0, eq);
    std::string val = line.substr(eq + 1);
    trim(key);
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\'')))
      val = val.substr(1, val.size() - 2);
    std::ranges::transform(key, key.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    if (key == "XKBLAYOUT" || key == "XKB_DEFAULT_LAYOUT")
      return val;
  }
  return {};
}

// en_GB.UTF-8 -> gb, en_US -> us, fr_FR -> fr.
std::string layoutFromLocale() {
  const char *localeEnv = std::getenv("LC_ALL");
  if (!localeEnv || !*localeEnv)
    localeEnv = std::getenv("LC_MESSAGES");
  if (!localeEnv || !*localeEnv)
    localeEnv = std::getenv("LANG");
  if (!localeEnv)
    return {};

  std::string locale(localeEnv);
  size_t dot = locale.find('.');
  if (dot != std::string::npos)
    locale.resize(dot);
  size_t at = locale.find('@');
  if (at != std::string::npos)
    locale.resize(at);

  std::string lang = locale;
  std::string region;
  size_t us = locale.find('_');
  if (us != std::string::npos) {
    lang = locale.substr(0, us);
    region = locale.substr(us + 1);
  }
  lang = toLower(lang);
  region = toLower(region);

  if (lang == "c" || lang == "posix")
    return {};
  if (lang == "en")
    return (region == "gb" || region == "uk") ? "gb" : "us";
  return lang;
}

// FNV-1a folded to 16 bits; never returns 0 for a non-empty name.
uint16_t layoutId(const std::string &name) {
  uint32_t h = 2166136261u;
  for (unsigned char c : name) {
    h ^= c;
    h *= 16777619u;
  }
  uint16_t id = static_cast<uint16_t>((h >> 16) ^ (h & 0xFFFFu));
  return id == 0 ? 1 : id;
}

} // namespace

KEYCAST_API std::string layoutToString(const KeyboardLayout &layout) {
  switch (layout.kind) {
  case KeyboardLayout::Kind::UnitedStates:
    return "us";
  case KeyboardLayout::Kind::UnitedKingdom:
    return "gb";
  case KeyboardLayout::Kind::Other:
    return "other(" + std::to_string(layout.id) + ")";
  }
  return "other";
}

KEYCAST_API KeyboardLayout layoutFromXkbName(const std::string &name) {
  std::string primary = name;
  size_t comma = primary.find(',');
  if (comma != std::string::npos)
    primary.resize(comma);
  trim(primary);
  primary = toLower(primary);

  if (primary.empty())
    return KeyboardLayout::other(0);
  if (primary == "gb" || primary == "uk")
    return KeyboardLayout::unitedKingdom();
  if (primary == "us")
    return KeyboardLayout::unitedStates();
  return KeyboardLayout::other(layoutId(primary));
}

KEYCAST_API std::string detectXkbLayoutName(const std::string &keyboardFile) {
  if (const char *env = std::getenv("XKB_DEFAULT_LAYOUT")) {
    std::string v(env);
    trim(v);
    if (!v.empty()) {
      KEYCAST_LOG_DEBUG("layout: XKB_DEFAULT_LAYOUT=%s", v.c_str());
      return v;
    }
  }

  std::string fromFile = layoutFromKeyboardFile(keyboardFile);
  if (!fromFile.empty()) {
    KEYCAST_LOG_DEBUG("layout: %s XKBLAYOUT=%s", keyboardFile.c_str(),
                      fromFile.c_str());
    return fromFile;
  }

  std::string guessed = layoutFromLocale();
  if (!guessed.empty())
    KEYCAST_LOG_DEBUG("layout: guessed from locale: %s", guessed.c_str());
  return guessed;
}

KEYCAST_API KeyboardLayout detectLayout(const std::string &keyboardFile) {
  std::string name = detectXkbLayoutName(keyboardFile);
  KeyboardLayout layout = layoutFromXkbName(name);
  KEYCAST_LOG_INFO("Detected keyboard layout: %s (xkb name '%s')",
                   layoutToString(layout).c_str(), name.c_str());
  return layout;
}

KEYCAST_API std::string physicalKeyLabel(Key key) {
  switch (key) {
  case Key::ShiftLeft:
  case Key::ShiftRight:
    return "⇧ shift";
  case Key::CtrlLeft:
  case Key::CtrlRight:
    return "⌃ control";
  case Key::AltLeft:
  case Key::AltRight:
    return "⌥ alt";
  case Key::SuperLeft:
  case Key::SuperRight:
    return "\uE62A Meta";
  case Key::CapsLock:
    return "⇪ Caps";

  case Key::Up:
    return "UpArrow";
  case Key::Down:
    return "DownArrow";
  case Key::Left:
    return "LeftArrow";
  case Key::Right:
    return "RightArrow";

  case Key::Numpad0:
  case Key::Numpad1:
  case Key::Numpad2:
  case Key::Numpad3:
  case Key::Numpad4:
  case Key::Numpad5:
  case Key::Numpad6:
  case Key::Numpad7:
  case Key::Numpad8:
  case Key::Numpad9:
    return std::to_string(static_cast<int>(key) -
                          static_cast<int>(Key::Numpad0));
  case Key::NumpadPlus:
    return "+";
  case Key::NumpadMinus:
    return "-";
  case Key::NumpadMultiply:
    return "*";
  case Key::NumpadDivide:
    return "/";
  case Key::NumpadEnter:
    return "Enter";
  case Key::NumpadDecimal:
    return "Dot";

  case Key::HomePage:
    return "\U000F02DC home";
  case Key::Mute:
    return "\U000F0581 mute";
  case Key::VolumeDown:
    return "\U000F075E vol-";
  case Key::VolumeUp:
    return "\U000F075D vol+";
  case Key::MediaNext:
    return "\U000F04AD next";
  case Key::MediaPrevious:
    return "\U000F04AE prev";
  case Key::MediaStop:
    return "\U0000F04D stop";
  case Key::MediaPlayPause:
    return "\U000F040E play";
  case Key::Mail:
    return "\uEB1C mail";
  case Key::MediaSelect:
    return "\U000F075A fn";
  case Key::Calculator:
    return "\U000F03CB App";

  case Key::Unknown:
    return "\U000F0633 Unknown";
  default:
    break;
  }
  return keyToString(key);
}

KEYCAST_API std::string resolveShiftedLabel(Key key,
                                            const KeyboardLayout &layout) {
  const bool uk = layout.kind == KeyboardLayout::Kind::UnitedKingdom;
  switch (key) {
  case Key::Num1:
    return "!";
  case Key::Num2:
    return uk ? "\"" : "@";
  case Key::Num3:
    return uk ? "£" : "#";
  case Key::Num4:
    return "$";
  case Key::Num5:
    return "%";
  case Key::Num6:
    return "^";
  case Key::Num7:
    return "&";
  case Key::Num8:
    return "*";
  case Key::Num9:
    return "(";
  case Key::Num0:
    return ")";
  case Key::Minus:
    return "_";
  case Key::Equal:
    return "+";
  case Key::Grave:
    return uk ? "¬" : "~";
  case Key::Apostrophe:
    return uk ? "@" : "\"";
  case Key::Backslash:
    return uk ? "~" : "|";
  case Key::IntlBackslash:
    return "|";
  default:
    break;
  }
  return normalizeKeyLabel(physicalKeyLabel(key));
}

KEYCAST_API std::string resolveLabel(Key key, const KeyboardLayout &layout,
                                     bool shifted) {
  if (shifted)
    return resolveShiftedLabel(key, layout);
  if (layout.kind == KeyboardLayout::Kind::UnitedKingdom &&
      key == Key::Backslash)
    return "#";
  return normalizeKeyLabel(physicalKeyLabel(key));
}

} // namespace keycast::input
