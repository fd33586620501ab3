/**
 * @file display/debounce_gate.cpp
 */

#include <keycast/display/debounce_gate.hpp>

namespace keycast::display {

DebounceGate::DebounceGate(Clock::time_point start, Clock::duration window)
    : m_windowStart(start), m_window(window) {}

bool DebounceGate::admit(const std::string &label) {
  return m_seen.insert(label).second;
}

void DebounceGate::tick() { m_seen.clear(); }

bool DebounceGate::update(Clock::time_point now) {
  if (now - m_windowStart <= m_window)
    return false;
  tick();
  m_windowStart = now;
  return true;
}

bool DebounceGate::contains(const std::string &label) const {
  return m_seen.find(label) != m_seen.end();
}

} // namespace keycast::display
