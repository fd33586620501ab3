/**
 * @file input/input_translator.cpp
 * @brief Raw transition -> InputEvent translation shared by all backends.
 */

#include <keycast/input/event_source.hpp>
#include <keycast/input/labels.hpp>
#include <keycast/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace keycast::input {

namespace {

const char *const kShiftLabel = "⇧ shift";

} // namespace

InputTranslator::InputTranslator(KeyboardLayout layout,
                                 std::shared_ptr<std::atomic_bool> shiftDown,
                                 std::weak_ptr<EventChannel> channel)
    : m_layout(layout),
      m_shift(shiftDown ? std::move(shiftDown)
                        : std::make_shared<std::atomic_bool>(false)),
      m_channel(std::move(channel)) {}

std::string InputTranslator::labelFor(const RawKey &key) const {
  if (key.key != Key::Unknown)
    return resolveLabel(key.key, m_layout, m_shift->load());

  if (!key.platformName.empty())
    return normalizeKeyLabel(key.platformName);
  return "\U000F0633 Unknown(" + std::to_string(key.code) + ")";
}

void InputTranslator::onKey(const RawKey &key, bool pressed) {
  if (isShiftKey(key.key)) {
    m_shift->store(pressed);
    if (pressed)
      sendIfAlive(m_channel, InputEvent::keyPress(kShiftLabel));
    return;
  }
  if (!pressed)
    return;

  std::string label = labelFor(key);
  if (log::debugEnabled()) {
    KEYCAST_LOG_DEBUG("translate: code=%u key=%s shift=%u -> '%s'", key.code,
                      keyToString(key.key).c_str(),
                      static_cast<unsigned>(m_shift->load()), label.c_str());
  }
  sendIfAlive(m_channel, InputEvent::keyPress(std::move(label)));
}

void InputTranslator::onButton(MouseButton button, uint32_t code,
                               bool pressed) {
  if (!pressed)
    return;
  sendIfAlive(m_channel, InputEvent::mouseClick(mouseButtonName(button, code)));
}

KEYCAST_API const char *eventSourceKindName(EventSourceKind kind) {
  switch (kind) {
  case EventSourceKind::Auto:
    return "auto";
  case EventSourceKind::X11:
    return "x11";
  case EventSourceKind::Libinput:
    return "libinput";
  }
  return "auto";
}

KEYCAST_API std::optional<EventSourceKind>
parseEventSourceKind(const std::string &name) {
  std::string lower = name;
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "auto")
    return EventSourceKind::Auto;
  if (lower == "x11" || lower == "xinput" || lower == "xi2")
    return EventSourceKind::X11;
  if (lower == "libinput" || lower == "evdev")
    return EventSourceKind::Libinput;
  return std::nullopt;
}

KEYCAST_API EventSourceKind resolveEventSourceKind(EventSourceKind kind) {
  if (kind != EventSourceKind::Auto)
    return kind;
  const char *display = std::getenv("DISPLAY");
  return (display && *display) ? EventSourceKind::X11
                               : EventSourceKind::Libinput;
}

} // namespace keycast::input
