/**
 * @file input/category.cpp
 * @brief Priority-ordered label classifier.
 */

#include <keycast/input/category.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>

namespace keycast::input {

namespace {

std::string asciiLower(const std::string &s) {
  std::string out = s;
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool inSet(const std::unordered_set<std::string> &set, const std::string &s) {
  return set.find(s) != set.end();
}

const std::unordered_set<std::string> kMouse = {"\U000F037D", "left", "right",
                                                "middle"};
const std::unordered_set<std::string> kEscape = {"meta", "esc", "escape",
                                                 "\U000F0206 esc"};
const std::unordered_set<std::string> kModifier = {
    "ctrl",    "control", "⌃ control", "shift", "⇧ shift", "alt",
    "⌥ alt", "tab",     "num",         "numlock", "caps"};
const std::unordered_set<std::string> kEditor = {
    "\U000F0E51", "ps", "backspace", "delete", "del", "back", "ins", "insert"};
const std::unordered_set<std::string> kNavigation = {"↑", "↓", "←", "→"};
const std::unordered_set<std::string> kScrollable = {
    "home", "end", "pageup", "pagedown", "pgup", "pgdn", "scroll", "scrollock"};
const std::unordered_set<std::string> kSpace = {"space", "\U000F1050 space"};
const std::unordered_set<std::string> kSymbol = {
    "{", "}", "<", ">", "|",  "£", "$", "%", "^", "&", "_", "¬",
    "#", "`", "(", ")", "@",  "+", "-", "=", "*", "\\", "/", ",",
    ".", ";", ":", "!", "'", "[", "]", "?", "~", "\""};

const char *const kAltFunctionKeywords[] = {
    "vol", "mute", "play", "prev", "next", "stop",
    "fn",  "web",  "mail", "app",  "home"};

// "f" followed by an integer in 1..24.
bool isFunctionKey(const std::string &lower) {
  if (lower.size() < 2 || lower.size() > 4 || lower[0] != 'f')
    return false;
  int n = 0;
  for (size_t i = 1; i < lower.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(lower[i])))
      return false;
    n = n * 10 + (lower[i] - '0');
  }
  return n >= 1 && n <= 24;
}

bool isAltFunction(const std::string &lower) {
  return std::ranges::any_of(kAltFunctionKeywords, [&](const char *kw) {
    return lower.find(kw) != std::string::npos;
  });
}

bool allDigits(const std::string &s) {
  return std::ranges::all_of(
      s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool allAlpha(const std::string &s) {
  return std::ranges::all_of(
      s, [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // namespace

KEYCAST_API const std::array<KeyCategory, kKeyCategoryCount> &allCategories() {
  static const std::array<KeyCategory, kKeyCategoryCount> all = {
      KeyCategory::Escape,     KeyCategory::Normal,   KeyCategory::Numeric,
      KeyCategory::Modifier,   KeyCategory::Editor,   KeyCategory::Navigation,
      KeyCategory::Scrollable, KeyCategory::Space,    KeyCategory::Symbol,
      KeyCategory::Unknown,    KeyCategory::Function, KeyCategory::AltFunction,
      KeyCategory::Mouse,
  };
  return all;
}

KEYCAST_API KeyCategory classify(const std::string &label) {
  if (label.empty())
    return KeyCategory::Unknown;

  const std::string k = asciiLower(label);
  if (inSet(kMouse, k))
    return KeyCategory::Mouse;
  if (inSet(kEscape, k))
    return KeyCategory::Escape;
  if (inSet(kModifier, k))
    return KeyCategory::Modifier;
  if (inSet(kEditor, k))
    return KeyCategory::Editor;
  if (inSet(kNavigation, k))
    return KeyCategory::Navigation;
  if (inSet(kScrollable, k))
    return KeyCategory::Scrollable;
  if (inSet(kSpace, k))
    return KeyCategory::Space;
  if (inSet(kSymbol, k))
    return KeyCategory::Symbol;
  if (isFunctionKey(k))
    return KeyCategory::Function;
  if (isAltFunction(k))
    return KeyCategory::AltFunction;
  if (allDigits(k))
    return KeyCategory::Numeric;
  if (allAlpha(k))
    return KeyCategory::Normal;
  return KeyCategory::Unknown;
}

KEYCAST_API const char *categoryName(KeyCategory category) {
  switch (category) {
  case KeyCategory::Escape:
    return "escape";
  case KeyCategory::Normal:
    return "normal";
  case KeyCategory::Numeric:
    return "numeric";
  case KeyCategory::Modifier:
    return "modifier";
  case KeyCategory::Editor:
    return "editor";
  case KeyCategory::Navigation:
    return "navigation";
  case KeyCategory::Scrollable:
    return "scrollable";
  case KeyCategory::Space:
    return "space";
  case KeyCategory::Symbol:
    return "symbol";
  case KeyCategory::Unknown:
    return "unknown";
  case KeyCategory::Function:
    return "function";
  case KeyCategory::AltFunction:
    return "altfunction";
  case KeyCategory::Mouse:
    return "mouse";
  }
  return "unknown";
}

KEYCAST_API std::optional<KeyCategory> parseCategory(const std::string &name) {
  const std::string lower = asciiLower(name);
  for (KeyCategory c : allCategories()) {
    if (lower == categoryName(c))
      return c;
  }
  return std::nullopt;
}

} // namespace keycast::input
