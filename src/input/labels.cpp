/**
 * @file input/labels.cpp
 * @brief Keyboard and mouse label normalization tables.
 */

#include <keycast/input/labels.hpp>

#include <cctype>
#include <string>
#include <unordered_map>

namespace keycast::input {

namespace {

const std::unordered_map<std::string, std::string> &keyLabelTable() {
  static const std::unordered_map<std::string, std::string> table = {
      // Punctuation
      {"Comma", ","},
      {"Period", "."},
      {"Dot", "."},
      {"SemiColon", ";"},
      {"Colon", ":"},
      {"BackQuote", "'"},
      {"Apostrophe", "'"},
      {"Minus", "-"},
      {"Equal", "="},
      {"Slash", "/"},
      {"BackSlash", "\\"},
      {"IntlBackslash", "\\"},
      {"Grave", "`"},
      {"LeftBracket", "["},
      {"RightBracket", "]"},
      {"Quote", "#"},
      // Whitespace / editing
      {"Space", "\U000F1050 space"},
      {"Return", "\U000F0311 enter"},
      {"Enter", "\U000F0311 enter"},
      {"Backspace", "\U000F0B5C back"},
      {"Escape", "\U000F0206 esc"},
      {"Delete", "⌦ del"},
      {"Insert", "\U0000F090 ins"},
      {"PrintScreen", "\U000F0E51 ps"},
      // Modifiers
      {"ShiftLeft", "⇧ shift"},
      {"ShiftRight", "⇧ shift"},
      {"ControlLeft", "⌃ control"},
      {"ControlRight", "⌃ control"},
      {"Alt", "⌥ alt"},
      {"AltGr", "⌥ alt"},
      {"Meta", "\uE62A"},
      {"CapsLock", "⇪ Caps"},
      {"NumLock", "\U000F0341 numlock"},
      {"ScrollLock", "\U000F0E79 scroll"},
      // Navigation
      {"UpArrow", "↑"},
      {"DownArrow", "↓"},
      {"LeftArrow", "←"},
      {"RightArrow", "→"},
      {"Home", "\uEB06 home"},
      {"End", "\U0000F4F0 end"},
      {"PageUp", "\U000F0795 pgup"},
      {"PageDown", "\U000F0792 pgdn"},
  };
  return table;
}

const std::unordered_map<std::string, std::string> &mouseLabelTable() {
  static const std::unordered_map<std::string, std::string> table = {
      {"MouseLeft", "\U000F037D left"},
      {"MouseRight", "\U000F037D right"},
      {"MouseMiddle", "\U000F037D middle"},
  };
  return table;
}

} // namespace

KEYCAST_API std::string normalizeKeyLabel(const std::string &raw) {
  const auto &table = keyLabelTable();
  auto it = table.find(raw);
  return it != table.end() ? it->second : raw;
}

KEYCAST_API std::string normalizeMouseLabel(const std::string &raw) {
  const auto &table = mouseLabelTable();
  auto it = table.find(raw);
  return it != table.end() ? it->second : raw;
}

KEYCAST_API std::string normalize(const std::string &raw, bool isMouse) {
  return isMouse ? normalizeMouseLabel(raw) : normalizeKeyLabel(raw);
}

KEYCAST_API std::string stripInternalPrefix(const std::string &label) {
  if (label.size() == 4 && label.compare(0, 3, "Key") == 0 &&
      std::isalpha(static_cast<unsigned char>(label[3])))
    return label.substr(3);
  if (label.size() == 4 && label.compare(0, 3, "Num") == 0 &&
      std::isdigit(static_cast<unsigned char>(label[3])))
    return label.substr(3);
  return label;
}

} // namespace keycast::input
