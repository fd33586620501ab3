#pragma once
/**
 * @file input/input_event.hpp
 * @brief Message carried from event sources to the overlay loop.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace keycast {
namespace input {

/**
 * @struct InputEvent
 * @brief A labelled key press or mouse click.
 *
 * Produced by an event source, moved through the EventChannel and consumed
 * exactly once by the overlay loop.
 */
struct InputEvent {
  enum class Kind : uint8_t {
    KeyPress,
    MouseClick,
  };

  Kind kind{Kind::KeyPress};
  std::string label;

  static InputEvent keyPress(std::string label) {
    return {Kind::KeyPress, std::move(label)};
  }
  static InputEvent mouseClick(std::string label) {
    return {Kind::MouseClick, std::move(label)};
  }

  [[nodiscard]] bool isMouse() const { return kind == Kind::MouseClick; }

  bool operator==(const InputEvent &) const = default;
};

} // namespace input
} // namespace keycast
