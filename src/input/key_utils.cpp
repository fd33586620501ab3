/**
 * @file input/key_utils.cpp
 * @brief Canonical key names and mouse button names.
 */

#include <keycast/input/key.hpp>

#include <string>
#include <utility>
#include <vector>

namespace keycast::input {

namespace {

// Canonical names returned by `keyToString`. Punctuation keys use the
// enumerator-style names the label normalizer understands ("SemiColon",
// "BackSlash").
const std::vector<std::pair<Key, std::string>> &keyStringPairs() {
  static const std::vector<std::pair<Key, std::string>> pairs = {
      {Key::Unknown, "Unknown"},
      // Letters
      {Key::A, "A"},
      {Key::B, "B"},
      {Key::C, "C"},
      {Key::D, "D"},
      {Key::E, "E"},
      {Key::F, "F"},
      {Key::G, "G"},
      {Key::H, "H"},
      {Key::I, "I"},
      {Key::J, "J"},
      {Key::K, "K"},
      {Key::L, "L"},
      {Key::M, "M"},
      {Key::N, "N"},
      {Key::O, "O"},
      {Key::P, "P"},
      {Key::Q, "Q"},
      {Key::R, "R"},
      {Key::S, "S"},
      {Key::T, "T"},
      {Key::U, "U"},
      {Key::V, "V"},
      {Key::W, "W"},
      {Key::X, "X"},
      {Key::Y, "Y"},
      {Key::Z, "Z"},
      // Numbers (top row)
      {Key::Num0, "0"},
      {Key::Num1, "1"},
      {Key::Num2, "2"},
      {Key::Num3, "3"},
      {Key::Num4, "4"},
      {Key::Num5, "5"},
      {Key::Num6, "6"},
      {Key::Num7, "7"},
      {Key::Num8, "8"},
      {Key::Num9, "9"},
      // Function keys
      {Key::F1, "F1"},
      {Key::F2, "F2"},
      {Key::F3, "F3"},
      {Key::F4, "F4"},
      {Key::F5, "F5"},
      {Key::F6, "F6"},
      {Key::F7, "F7"},
      {Key::F8, "F8"},
      {Key::F9, "F9"},
      {Key::F10, "F10"},
      {Key::F11, "F11"},
      {Key::F12, "F12"},
      {Key::F13, "F13"},
      {Key::F14, "F14"},
      {Key::F15, "F15"},
      {Key::F16, "F16"},
      {Key::F17, "F17"},
      {Key::F18, "F18"},
      {Key::F19, "F19"},
      {Key::F20, "F20"},
      {Key::F21, "F21"},
      {Key::F22, "F22"},
      {Key::F23, "F23"},
      {Key::F24, "F24"},
      // Control keys
      {Key::Enter, "Enter"},
      {Key::Escape, "Escape"},
      {Key::Backspace, "Backspace"},
      {Key::Tab, "Tab"},
      {Key::Space, "Space"},
      // Navigation
      {Key::Left, "Left"},
      {Key::Right, "Right"},
      {Key::Up, "Up"},
      {Key::Down, "Down"},
      {Key::Home, "Home"},
      {Key::End, "End"},
      {Key::PageUp, "PageUp"},
      {Key::PageDown, "PageDown"},
      {Key::Delete, "Delete"},
      {Key::Insert, "Insert"},
      {Key::PrintScreen, "PrintScreen"},
      {Key::ScrollLock, "ScrollLock"},
      {Key::Pause, "Pause"},
      // Numpad
      {Key::NumpadDivide, "NumpadDivide"},
      {Key::NumpadMultiply, "NumpadMultiply"},
      {Key::NumpadMinus, "NumpadMinus"},
      {Key::NumpadPlus, "NumpadPlus"},
      {Key::NumpadEnter, "NumpadEnter"},
      {Key::NumpadDecimal, "NumpadDecimal"},
      {Key::Numpad0, "Numpad0"},
      {Key::Numpad1, "Numpad1"},
      {Key::Numpad2, "Numpad2"},
      {Key::Numpad3, "Numpad3"},
      {Key::Numpad4, "Numpad4"},
      {Key::Numpad5, "Numpad5"},
      {Key::Numpad6, "Numpad6"},
      {Key::Numpad7, "Numpad7"},
      {Key::Numpad8, "Numpad8"},
      {Key::Numpad9, "Numpad9"},
      // Modifiers
      {Key::ShiftLeft, "ShiftLeft"},
      {Key::ShiftRight, "ShiftRight"},
      {Key::CtrlLeft, "ControlLeft"},
      {Key::CtrlRight, "ControlRight"},
      {Key::AltLeft, "Alt"},
      {Key::AltRight, "AltGr"},
      {Key::SuperLeft, "MetaLeft"},
      {Key::SuperRight, "MetaRight"},
      {Key::CapsLock, "CapsLock"},
      {Key::NumLock, "NumLock"},
      // Misc
      {Key::Menu, "Menu"},
      {Key::Mute, "Mute"},
      {Key::VolumeDown, "VolumeDown"},
      {Key::VolumeUp, "VolumeUp"},
      {Key::MediaPlayPause, "MediaPlayPause"},
      {Key::MediaStop, "MediaStop"},
      {Key::MediaNext, "MediaNext"},
      {Key::MediaPrevious, "MediaPrevious"},
      {Key::HomePage, "HomePage"},
      {Key::Mail, "Mail"},
      {Key::MediaSelect, "MediaSelect"},
      {Key::Calculator, "Calculator"},
      // Punctuation / layout-dependent
      {Key::Grave, "Grave"},
      {Key::Minus, "Minus"},
      {Key::Equal, "Equal"},
      {Key::LeftBracket, "LeftBracket"},
      {Key::RightBracket, "RightBracket"},
      {Key::Backslash, "BackSlash"},
      {Key::Semicolon, "SemiColon"},
      {Key::Apostrophe, "Apostrophe"},
      {Key::Comma, "Comma"},
      {Key::Period, "Period"},
      {Key::Slash, "Slash"},
      {Key::IntlBackslash, "IntlBackslash"},
  };
  return pairs;
}

} // namespace

KEYCAST_API std::string keyToString(Key key) {
  for (const auto &pair : keyStringPairs()) {
    if (pair.first == key) {
      return pair.second;
    }
  }
  return {"Unknown"};
}

KEYCAST_API std::string mouseButtonName(MouseButton button, uint32_t code) {
  switch (button) {
  case MouseButton::Left:
    return "MouseLeft";
  case MouseButton::Right:
    return "MouseRight";
  case MouseButton::Middle:
    return "MouseMiddle";
  case MouseButton::Side:
    return "MouseSide";
  case MouseButton::Extra:
    return "MouseExtra";
  case MouseButton::Unknown:
    break;
  }
  return "MouseUnknown(" + std::to_string(code) + ")";
}

} // namespace keycast::input
