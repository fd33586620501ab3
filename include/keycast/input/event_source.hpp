#pragma once
/**
 * @file input/event_source.hpp
 * @brief Global keyboard/mouse capture interface and the shared translator.
 *
 * A KeyEventSource observes physical key and button transitions system-wide
 * on its own worker thread and publishes labelled InputEvents into an
 * EventChannel. Concrete sources exist for X11 (XInput2 raw events) and
 * libinput; `createEventSource` picks one at runtime.
 *
 * Example:
 *
 * @code{.cpp}
 * auto channel = std::make_shared<keycast::input::EventChannel>();
 * auto source = keycast::input::createEventSource(
 *     keycast::input::EventSourceKind::Auto);
 * if (!source || !source->start(channel)) {
 *   // no capture available; the overlay keeps running without input
 * }
 * @endcode
 */

#include <keycast/core.hpp>
#include <keycast/input/event_channel.hpp>
#include <keycast/input/key.hpp>
#include <keycast/input/layout.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace keycast {
namespace input {

/**
 * @class KeyEventSource
 * @brief Capability interface implemented by each capture backend.
 */
class KEYCAST_API KeyEventSource {
public:
  virtual ~KeyEventSource() = default;

  /**
   * @brief Start capturing and publishing into @p channel.
   *
   * The source only keeps a weak reference to the channel. Start fails (and
   * logs once) when the platform hook cannot be installed; a failed source
   * is not retried.
   *
   * @return true when the worker is running and ready.
   */
  virtual bool start(const std::shared_ptr<EventChannel> &channel) = 0;

  /**
   * @brief Stop capturing and release OS resources. Idempotent.
   */
  virtual void stop() = 0;

  [[nodiscard]] virtual bool isRunning() const = 0;

  /// Short backend name for logs ("x11", "libinput").
  [[nodiscard]] virtual const char *name() const = 0;
};

/**
 * @class InputTranslator
 * @brief Turns raw transitions into InputEvents.
 *
 * Shared by every backend. Tracks Shift in an atomic flag, resolves key
 * labels through the layout resolver, emits "⇧ shift" immediately on Shift
 * down and formats mouse buttons. Key releases (other than Shift) are
 * ignored.
 */
class KEYCAST_API InputTranslator {
public:
  InputTranslator(KeyboardLayout layout,
                  std::shared_ptr<std::atomic_bool> shiftDown,
                  std::weak_ptr<EventChannel> channel);

  /// Handle a key transition.
  void onKey(const RawKey &key, bool pressed);

  /// Handle a pointer button transition. Releases are ignored.
  void onButton(MouseButton button, uint32_t code, bool pressed);

  /**
   * @brief Label a key would produce with the current Shift state.
   *
   * Unmapped keys use the backend supplied keysym name when available and
   * otherwise "\U000F0633 Unknown(<code>)".
   */
  [[nodiscard]] std::string labelFor(const RawKey &key) const;

  [[nodiscard]] const KeyboardLayout &layout() const { return m_layout; }
  [[nodiscard]] bool shiftDown() const { return m_shift->load(); }

private:
  KeyboardLayout m_layout;
  std::shared_ptr<std::atomic_bool> m_shift;
  std::weak_ptr<EventChannel> m_channel;
};

/// Backend selection.
enum class EventSourceKind : uint8_t {
  Auto,
  X11,
  Libinput,
};

KEYCAST_API const char *eventSourceKindName(EventSourceKind kind);

/// Parse "auto", "x11" or "libinput" (case-insensitive).
KEYCAST_API std::optional<EventSourceKind>
parseEventSourceKind(const std::string &name);

/**
 * @brief Resolve Auto into a concrete backend.
 *
 * Auto selects X11 when `DISPLAY` is set and libinput otherwise.
 */
KEYCAST_API EventSourceKind resolveEventSourceKind(EventSourceKind kind);

/**
 * @brief Construct the event source for @p kind.
 * @return A stopped source; never nullptr for a valid kind.
 */
KEYCAST_API std::unique_ptr<KeyEventSource>
createEventSource(EventSourceKind kind);

} // namespace input
} // namespace keycast
