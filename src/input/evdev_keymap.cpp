/**
 * @file input/evdev_keymap.cpp
 * @brief Linux evdev keycode and button code translation.
 *
 * Both Linux backends observe physical keys as evdev keycodes (libinput
 * delivers them directly, XInput2 delivers X keycodes which are evdev + 8).
 * The table here is positional: it names the key cap at a physical position,
 * independent of the active layout.
 */

#include <keycast/input/key.hpp>

#include <linux/input-event-codes.h>
#include <unordered_map>

namespace keycast::input {

namespace {

const std::unordered_map<uint32_t, Key> &evdevTable() {
  static const std::unordered_map<uint32_t, Key> table = [] {
    std::unordered_map<uint32_t, Key> m;
    auto set = [&m](Key k, uint32_t v) { m.emplace(v, k); };

    // Letters
    set(Key::A, KEY_A);
    set(Key::B, KEY_B);
    set(Key::C, KEY_C);
    set(Key::D, KEY_D);
    set(Key::E, KEY_E);
    set(Key::F, KEY_F);
    set(Key::G, KEY_G);
    set(Key::H, KEY_H);
    set(Key::I, KEY_I);
    set(Key::J, KEY_J);
    set(Key::K, KEY_K);
    set(Key::L, KEY_L);
    set(Key::M, KEY_M);
    set(Key::N, KEY_N);
    set(Key::O, KEY_O);
    set(Key::P, KEY_P);
    set(Key::Q, KEY_Q);
    set(Key::R, KEY_R);
    set(Key::S, KEY_S);
    set(Key::T, KEY_T);
    set(Key::U, KEY_U);
    set(Key::V, KEY_V);
    set(Key::W, KEY_W);
    set(Key::X, KEY_X);
    set(Key::Y, KEY_Y);
    set(Key::Z, KEY_Z);

    // Digit row
    set(Key::Num1, KEY_1);
    set(Key::Num2, KEY_2);
    set(Key::Num3, KEY_3);
    set(Key::Num4, KEY_4);
    set(Key::Num5, KEY_5);
    set(Key::Num6, KEY_6);
    set(Key::Num7, KEY_7);
    set(Key::Num8, KEY_8);
    set(Key::Num9, KEY_9);
    set(Key::Num0, KEY_0);

    // Modifiers
    set(Key::ShiftLeft, KEY_LEFTSHIFT);
    set(Key::ShiftRight, KEY_RIGHTSHIFT);
    set(Key::CtrlLeft, KEY_LEFTCTRL);
    set(Key::CtrlRight, KEY_RIGHTCTRL);
    set(Key::AltLeft, KEY_LEFTALT);
    set(Key::AltRight, KEY_RIGHTALT);
    set(Key::SuperLeft, KEY_LEFTMETA);
    set(Key::SuperRight, KEY_RIGHTMETA);
    set(Key::CapsLock, KEY_CAPSLOCK);
    set(Key::NumLock, KEY_NUMLOCK);

    // Common
    set(Key::Space, KEY_SPACE);
    set(Key::Enter, KEY_ENTER);
    set(Key::Tab, KEY_TAB);
    set(Key::Backspace, KEY_BACKSPACE);
    set(Key::Delete, KEY_DELETE);
    set(Key::Escape, KEY_ESC);
    set(Key::Left, KEY_LEFT);
    set(Key::Right, KEY_RIGHT);
    set(Key::Up, KEY_UP);
    set(Key::Down, KEY_DOWN);
    set(Key::Home, KEY_HOME);
    set(Key::End, KEY_END);
    set(Key::PageUp, KEY_PAGEUP);
    set(Key::PageDown, KEY_PAGEDOWN);
    set(Key::Insert, KEY_INSERT);
    set(Key::PrintScreen, KEY_SYSRQ);
    set(Key::ScrollLock, KEY_SCROLLLOCK);
    set(Key::Pause, KEY_PAUSE);
    set(Key::Menu, KEY_COMPOSE);

    // Function keys
    set(Key::F1, KEY_F1);
    set(Key::F2, KEY_F2);
    set(Key::F3, KEY_F3);
    set(Key::F4, KEY_F4);
    set(Key::F5, KEY_F5);
    set(Key::F6, KEY_F6);
    set(Key::F7, KEY_F7);
    set(Key::F8, KEY_F8);
    set(Key::F9, KEY_F9);
    set(Key::F10, KEY_F10);
    set(Key::F11, KEY_F11);
    set(Key::F12, KEY_F12);
    set(Key::F13, KEY_F13);
    set(Key::F14, KEY_F14);
    set(Key::F15, KEY_F15);
    set(Key::F16, KEY_F16);
    set(Key::F17, KEY_F17);
    set(Key::F18, KEY_F18);
    set(Key::F19, KEY_F19);
    set(Key::F20, KEY_F20);
    set(Key::F21, KEY_F21);
    set(Key::F22, KEY_F22);
    set(Key::F23, KEY_F23);
    set(Key::F24, KEY_F24);

    // Numpad
    set(Key::Numpad0, KEY_KP0);
    set(Key::Numpad1, KEY_KP1);
    set(Key::Numpad2, KEY_KP2);
    set(Key::Numpad3, KEY_KP3);
    set(Key::Numpad4, KEY_KP4);
    set(Key::Numpad5, KEY_KP5);
    set(Key::Numpad6, KEY_KP6);
    set(Key::Numpad7, KEY_KP7);
    set(Key::Numpad8, KEY_KP8);
    set(Key::Numpad9, KEY_KP9);
    set(Key::NumpadDivide, KEY_KPSLASH);
    set(Key::NumpadMultiply, KEY_KPASTERISK);
    set(Key::NumpadMinus, KEY_KPMINUS);
    set(Key::NumpadPlus, KEY_KPPLUS);
    set(Key::NumpadEnter, KEY_KPENTER);
    set(Key::NumpadDecimal, KEY_KPDOT);

    // Punctuation (positions, named by US legend)
    set(Key::Grave, KEY_GRAVE);
    set(Key::Minus, KEY_MINUS);
    set(Key::Equal, KEY_EQUAL);
    set(Key::LeftBracket, KEY_LEFTBRACE);
    set(Key::RightBracket, KEY_RIGHTBRACE);
    set(Key::Backslash, KEY_BACKSLASH);
    set(Key::Semicolon, KEY_SEMICOLON);
    set(Key::Apostrophe, KEY_APOSTROPHE);
    set(Key::Comma, KEY_COMMA);
    set(Key::Period, KEY_DOT);
    set(Key::Slash, KEY_SLASH);
    set(Key::IntlBackslash, KEY_102ND);

    // Media / launch
    set(Key::Mute, KEY_MUTE);
    set(Key::VolumeDown, KEY_VOLUMEDOWN);
    set(Key::VolumeUp, KEY_VOLUMEUP);
    set(Key::MediaPlayPause, KEY_PLAYPAUSE);
    set(Key::MediaStop, KEY_STOPCD);
    set(Key::MediaNext, KEY_NEXTSONG);
    set(Key::MediaPrevious, KEY_PREVIOUSSONG);
    set(Key::HomePage, KEY_HOMEPAGE);
    set(Key::Mail, KEY_MAIL);
    set(Key::MediaSelect, KEY_MEDIA);
    set(Key::Calculator, KEY_CALC);
    return m;
  }();
  return table;
}

} // namespace

KEYCAST_API Key keyFromEvdev(uint32_t code) {
  const auto &table = evdevTable();
  auto it = table.find(code);
  return it != table.end() ? it->second : Key::Unknown;
}

KEYCAST_API MouseButton mouseButtonFromEvdev(uint32_t code) {
  switch (code) {
  case BTN_LEFT:
    return MouseButton::Left;
  case BTN_RIGHT:
    return MouseButton::Right;
  case BTN_MIDDLE:
    return MouseButton::Middle;
  case BTN_SIDE:
    return MouseButton::Side;
  case BTN_EXTRA:
    return MouseButton::Extra;
  default:
    return MouseButton::Unknown;
  }
}

} // namespace keycast::input
