#pragma once
/**
 * @file display/debounce_gate.hpp
 * @brief Coarse duplicate suppression in front of the display buffer.
 *
 * Labels are recorded in a single window that is cleared wholesale once more
 * than the window length has elapsed since the last clear. Labels do not age
 * individually: a repeat arriving just after a clear is admitted even if its
 * first occurrence was only a few milliseconds earlier.
 */

#include <keycast/core.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_set>

namespace keycast {
namespace display {

class KEYCAST_API DebounceGate {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::milliseconds kDefaultWindow{250};

  explicit DebounceGate(Clock::time_point start = Clock::now(),
                        Clock::duration window = kDefaultWindow);

  /**
   * @brief Record @p label.
   * @return true when the label was not yet seen in the current window.
   */
  bool admit(const std::string &label);

  /// Forget every recorded label.
  void tick();

  /**
   * @brief Clear the window when more than its length has elapsed since the
   * last clear.
   * @return true when the window was cleared.
   */
  bool update(Clock::time_point now);

  [[nodiscard]] bool contains(const std::string &label) const;
  [[nodiscard]] std::size_t size() const { return m_seen.size(); }

private:
  std::unordered_set<std::string> m_seen;
  Clock::time_point m_windowStart;
  Clock::duration m_window;
};

} // namespace display
} // namespace keycast
