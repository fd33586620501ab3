#pragma once
/**
 * @file input/labels.hpp
 * @brief Canonical display labels for keys and mouse buttons.
 *
 * Normalization maps verbose enumerator-style names ("SemiColon",
 * "ShiftLeft") onto the short glyphs or icon-augmented text shown in the
 * overlay (";", "⇧ shift"). Every function here is idempotent and passes
 * unrecognized input through unchanged.
 */

#include <keycast/core.hpp>

#include <string>

namespace keycast {
namespace input {

/// Normalize a keyboard label.
KEYCAST_API std::string normalizeKeyLabel(const std::string &raw);

/// Normalize a mouse button label ("MouseLeft" -> "\U000F037D left").
KEYCAST_API std::string normalizeMouseLabel(const std::string &raw);

/**
 * @brief Dispatch to normalizeMouseLabel or normalizeKeyLabel.
 */
KEYCAST_API std::string normalize(const std::string &raw, bool isMouse);

/**
 * @brief Strip internal enumerator prefixes: "KeyA" -> "A", "Num7" -> "7".
 *
 * Only the exact shapes `Key` + one letter and `Num` + one digit are
 * stripped, so "Keyboard" and "NumLock" are left alone.
 */
KEYCAST_API std::string stripInternalPrefix(const std::string &label);

} // namespace input
} // namespace keycast
