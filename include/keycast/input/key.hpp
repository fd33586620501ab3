#pragma once
/**
 * @file input/key.hpp
 * @brief Physical key and mouse button model for keycast::input.
 *
 * This header defines the closed set of physical keys the overlay knows how
 * to label, the mouse buttons it reports, and the helpers that convert them
 * to and from canonical names. Backends translate platform keycodes into
 * these values; everything downstream (layout resolution, labels,
 * classification) works on `Key` only.
 */

#include <keycast/core.hpp>

#include <cstdint>
#include <string>

namespace keycast {
namespace input {

/**
 * @enum Key
 * @brief Physical key identifiers (layout-agnostic).
 *
 * Stable numeric values are chosen to allow serialization and logging. These
 * values name physical key positions using their US-layout legend, not the
 * character a given layout produces.
 */
enum class Key : uint16_t {
  Unknown = 0,
  // Letters
  A = 1,
  B = 2,
  C = 3,
  D = 4,
  E = 5,
  F = 6,
  G = 7,
  H = 8,
  I = 9,
  J = 10,
  K = 11,
  L = 12,
  M = 13,
  N = 14,
  O = 15,
  P = 16,
  Q = 17,
  R = 18,
  S = 19,
  T = 20,
  U = 21,
  V = 22,
  W = 23,
  X = 24,
  Y = 25,
  Z = 26,

  // Numbers (main/top row)
  Num0 = 33,
  Num1 = 34,
  Num2 = 35,
  Num3 = 36,
  Num4 = 37,
  Num5 = 38,
  Num6 = 39,
  Num7 = 40,
  Num8 = 41,
  Num9 = 42,

  // Function keys
  F1 = 43,
  F2 = 44,
  F3 = 45,
  F4 = 46,
  F5 = 47,
  F6 = 48,
  F7 = 49,
  F8 = 50,
  F9 = 51,
  F10 = 52,
  F11 = 53,
  F12 = 54,
  F13 = 55,
  F14 = 56,
  F15 = 57,
  F16 = 58,
  F17 = 59,
  F18 = 60,
  F19 = 61,
  F20 = 62,

  // Control / editing
  Enter = 63,
  Escape = 64,
  Backspace = 65,
  Tab = 66,
  Space = 67,

  // Navigation
  Left = 68,
  Right = 69,
  Up = 70,
  Down = 71,
  Home = 72,
  End = 73,
  PageUp = 74,
  PageDown = 75,
  Delete = 76,
  Insert = 77,
  PrintScreen = 78,
  ScrollLock = 79,
  Pause = 80,

  // Numpad
  NumpadDivide = 83,
  NumpadMultiply = 84,
  NumpadMinus = 85,
  NumpadPlus = 86,
  NumpadEnter = 87,
  NumpadDecimal = 88,
  Numpad0 = 89,
  Numpad1 = 90,
  Numpad2 = 91,
  Numpad3 = 92,
  Numpad4 = 93,
  Numpad5 = 94,
  Numpad6 = 95,
  Numpad7 = 96,
  Numpad8 = 97,
  Numpad9 = 98,

  // Modifiers
  ShiftLeft = 99,
  ShiftRight = 100,
  CtrlLeft = 101,
  CtrlRight = 102,
  AltLeft = 103,
  AltRight = 104, ///< AltGr on ISO layouts
  SuperLeft = 105,
  SuperRight = 106,
  CapsLock = 107,
  NumLock = 108,

  // Misc
  Menu = 110,
  Mute = 114,
  VolumeDown = 115,
  VolumeUp = 116,
  MediaPlayPause = 117,
  MediaStop = 118,
  MediaNext = 119,
  MediaPrevious = 120,

  // Common punctuation (layout-dependent physical positions)
  Grave = 124,
  Minus = 125,
  Equal = 126,
  LeftBracket = 127,
  RightBracket = 128,
  Backslash = 129, ///< ANSI backslash; the '#' key on ISO layouts
  Semicolon = 130,
  Apostrophe = 131,
  Comma = 132,
  Period = 133,
  Slash = 134,
  IntlBackslash = 135, ///< The extra ISO key next to the left Shift

  // Extended function keys
  F21 = 140,
  F22 = 141,
  F23 = 142,
  F24 = 143,

  // Launch / browser keys
  HomePage = 150,
  Mail = 151,
  MediaSelect = 152,
  Calculator = 153,
};

/**
 * @enum MouseButton
 * @brief Mouse buttons the overlay reports. Wheel "buttons" are not buttons
 * and never reach this type.
 */
enum class MouseButton : uint8_t {
  Unknown = 0,
  Left = 1,
  Right = 2,
  Middle = 3,
  Side = 4,  ///< "back" thumb button
  Extra = 5, ///< "forward" thumb button
};

/**
 * @struct RawKey
 * @brief A key transition as observed by a backend, before labelling.
 *
 * `key` is Key::Unknown when the backend could not map the hardware code;
 * in that case `platformName` (for example an XKB keysym name such as
 * "XF86Calculator") is used as the generic label when non-empty.
 */
struct RawKey {
  Key key{Key::Unknown};
  uint32_t code{0};         ///< evdev keycode
  std::string platformName; ///< keysym name, may be empty
};

/**
 * @brief Return true for the left or right Shift key.
 * @param key Key to test.
 */
inline bool isShiftKey(Key key) {
  return key == Key::ShiftLeft || key == Key::ShiftRight;
}

/**
 * @brief Convert a Key to its canonical textual name.
 * @param key Logical key to convert.
 * @return std::string Canonical name for the key (e.g., "A", "Enter").
 */
KEYCAST_API std::string keyToString(Key key);

/**
 * @brief Platform-formatted name of a mouse button ("MouseLeft",
 * "MouseSide", "MouseUnknown(12)").
 * @param button Button to name.
 * @param code Raw platform button code, only used for Unknown.
 */
KEYCAST_API std::string mouseButtonName(MouseButton button, uint32_t code = 0);

/**
 * @brief Map a Linux evdev keycode (KEY_*) to a Key.
 * @return Key::Unknown when the code has no mapping.
 */
KEYCAST_API Key keyFromEvdev(uint32_t code);

/**
 * @brief Map a Linux evdev button code (BTN_*) to a MouseButton.
 * @return MouseButton::Unknown when the code is not a pointer button.
 */
KEYCAST_API MouseButton mouseButtonFromEvdev(uint32_t code);

} // namespace input
} // namespace keycast
