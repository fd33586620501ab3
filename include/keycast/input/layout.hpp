#pragma once
/**
 * @file input/layout.hpp
 * @brief Keyboard layout detection and layout/shift-aware label resolution.
 *
 * The layout is detected once when an event source starts and never changes
 * for the lifetime of that source. Resolution functions are pure and may be
 * called from any thread.
 */

#include <keycast/input/key.hpp>

#include <cstdint>
#include <string>

namespace keycast {
namespace input {

/**
 * @struct KeyboardLayout
 * @brief Active keyboard layout: one of the two reference layouts or an
 * opaque "other" layout identified by a stable id.
 *
 * `Other` layouts resolve shifted labels with the US table.
 */
struct KeyboardLayout {
  enum class Kind : uint8_t {
    UnitedStates,
    UnitedKingdom,
    Other,
  };

  Kind kind{Kind::UnitedStates};
  uint16_t id{0}; ///< Only meaningful for Kind::Other (0 when unknown)

  static KeyboardLayout unitedStates() { return {Kind::UnitedStates, 0}; }
  static KeyboardLayout unitedKingdom() { return {Kind::UnitedKingdom, 0}; }
  static KeyboardLayout other(uint16_t id) { return {Kind::Other, id}; }

  bool operator==(const KeyboardLayout &) const = default;
};

/**
 * @brief Human readable layout name for logging ("us", "gb", "other(42)").
 */
KEYCAST_API std::string layoutToString(const KeyboardLayout &layout);

/**
 * @brief Map an XKB layout name to a KeyboardLayout.
 *
 * Only the first entry of a comma separated list is considered ("gb,us" is
 * UnitedKingdom). `gb` and `uk` map to UnitedKingdom, `us` to UnitedStates;
 * any other non-empty name yields `Other` with an id hashed from the name.
 * An empty name yields `Other(0)`.
 */
KEYCAST_API KeyboardLayout layoutFromXkbName(const std::string &name);

/**
 * @brief Determine the XKB layout name of the running session.
 *
 * Consults `XKB_DEFAULT_LAYOUT`, then the `XKBLAYOUT` entry of
 * @p keyboardFile (Debian style `/etc/default/keyboard`), then guesses from
 * the locale (`LC_ALL`, `LC_MESSAGES`, `LANG`).
 *
 * @return The layout name, or an empty string when nothing is known.
 */
KEYCAST_API std::string
detectXkbLayoutName(const std::string &keyboardFile = "/etc/default/keyboard");

/**
 * @brief Detect the active keyboard layout.
 * @see detectXkbLayoutName, layoutFromXkbName
 */
KEYCAST_API KeyboardLayout
detectLayout(const std::string &keyboardFile = "/etc/default/keyboard");

/**
 * @brief Raw physical name of a key, before normalization.
 *
 * Letters and digits yield their legend ("A", "1"), modifiers and media keys
 * yield icon-augmented text ("⇧ shift", "\U000F0581 mute"), and everything else the
 * enumerator-style name the normalizer understands ("Escape", "SemiColon").
 */
KEYCAST_API std::string physicalKeyLabel(Key key);

/**
 * @brief Label a key produces with Shift held on @p layout.
 *
 * Covers the digit row and the layout-dependent punctuation keys; every
 * other key yields its normalized unshifted name.
 */
KEYCAST_API std::string resolveShiftedLabel(Key key,
                                            const KeyboardLayout &layout);

/**
 * @brief Full label resolution used by event sources.
 * @param key Physical key that went down.
 * @param layout Active layout.
 * @param shifted Whether Shift was held at the time.
 * @return A normalized, display-ready label.
 */
KEYCAST_API std::string resolveLabel(Key key, const KeyboardLayout &layout,
                                     bool shifted);

} // namespace input
} // namespace keycast
