#pragma once
/**
 * @file display/key_buffer.hpp
 * @brief Timed display buffer: the strip of recently pressed keys.
 *
 * Entries are kept oldest first. Each entry lives for one second after its
 * last touch; pushing a label that is already visible refreshes it in place.
 * A render pass selects the newest entries that fit the available width,
 * advances their grow animation, emits their draw primitives right-aligned
 * and drops every entry that did not fit.
 */

#include <keycast/core.hpp>
#include <keycast/display/render.hpp>
#include <keycast/display/style.hpp>
#include <keycast/input/category.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace keycast {
namespace display {

/**
 * @struct KeyEntry
 * @brief One visible key.
 */
struct KeyEntry {
  std::string icon;  ///< Leading glyph, may be empty
  std::string text;  ///< Main label
  std::string label; ///< Canonical display label (icon + text), unique
  input::KeyCategory category{input::KeyCategory::Unknown};
  float animation{0.0f}; ///< Grow progress in [0, 1]
  std::chrono::steady_clock::time_point lastTouch;
};

class KEYCAST_API KeyBuffer {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr float kPadding = 8.0f;
  static constexpr float kInitialAnimation = 0.8f;
  static constexpr float kAnimationStep = 0.1f;
  static constexpr std::chrono::milliseconds kLifetime{1000};

  KeyBuffer() = default;

  /**
   * @brief Insert or refresh a label.
   *
   * The label is normalized (mouse or keyboard table), internal prefixes are
   * stripped and it is split into icon and text at the first space. When an
   * entry with the same canonical label exists its timestamp is refreshed
   * and its animation reset to 0.8 without moving it; otherwise a new entry
   * is appended.
   */
  void push(const std::string &label, bool isMouse, Clock::time_point now);
  void push(const std::string &label, bool isMouse) {
    push(label, isMouse, Clock::now());
  }

  /**
   * @brief Run one render pass against @p bounds.
   *
   * Evicts entries aged one second or more, fits the newest entries into
   * `bounds.width`, advances their animation and returns their primitives.
   * Entries that did not fit are removed.
   */
  DrawList tickAndRender(const Rect &bounds, const StyleSheet &styles,
                         Clock::time_point now);

  /// Render pass that presents the result on @p surface.
  void tickAndRender(RenderSurface &surface, const StyleSheet &styles,
                     Clock::time_point now);
  void tickAndRender(RenderSurface &surface, const StyleSheet &styles) {
    tickAndRender(surface, styles, Clock::now());
  }

  [[nodiscard]] const std::deque<KeyEntry> &entries() const {
    return m_entries;
  }
  [[nodiscard]] std::size_t size() const { return m_entries.size(); }
  [[nodiscard]] bool empty() const { return m_entries.empty(); }
  void clear() { m_entries.clear(); }

private:
  std::deque<KeyEntry> m_entries;
};

} // namespace display
} // namespace keycast
