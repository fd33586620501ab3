/**
 * @file display/key_buffer.cpp
 * @brief KeyBuffer insertion, expiry, fit pass and draw-list emission.
 */

#include <keycast/display/key_buffer.hpp>
#include <keycast/input/labels.hpp>
#include <keycast/log.hpp>

#include <algorithm>
#include <cctype>

namespace keycast::display {

namespace {

std::string trimmed(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t a = s.find_first_not_of(ws);
  if (a == std::string::npos)
    return {};
  size_t b = s.find_last_not_of(ws);
  return s.substr(a, b - a + 1);
}

// "f1".."f24" in any case.
bool looksLikeFunctionKey(const std::string &text) {
  return !text.empty() && (text[0] == 'f' || text[0] == 'F') &&
         input::classify(text) == input::KeyCategory::Function;
}

std::string upper(std::string s) {
  std::ranges::transform(s, s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

} // namespace

void KeyBuffer::push(const std::string &label, bool isMouse,
                     Clock::time_point now) {
  std::string canonical =
      input::stripInternalPrefix(trimmed(input::normalize(label, isMouse)));

  std::string icon;
  std::string text = canonical;
  size_t space = canonical.find(' ');
  if (space != std::string::npos) {
    icon = trimmed(canonical.substr(0, space));
    text = trimmed(canonical.substr(space + 1));
  }
  if (looksLikeFunctionKey(text))
    text = upper(text);
  canonical = icon.empty() ? text : icon + " " + text;

  auto it = std::ranges::find_if(
      m_entries, [&](const KeyEntry &e) { return e.label == canonical; });
  if (it != m_entries.end()) {
    it->lastTouch = now;
    it->animation = kInitialAnimation;
    return;
  }

  KeyEntry entry;
  entry.category = input::classify(text);
  entry.icon = std::move(icon);
  entry.text = std::move(text);
  entry.label = std::move(canonical);
  entry.animation = kInitialAnimation;
  entry.lastTouch = now;
  KEYCAST_LOG_DEBUG("KeyBuffer: new entry '%s' category=%s",
                    entry.label.c_str(), input::categoryName(entry.category));
  m_entries.push_back(std::move(entry));
}

DrawList KeyBuffer::tickAndRender(const Rect &bounds, const StyleSheet &styles,
                                  Clock::time_point now) {
  std::erase_if(m_entries, [&](const KeyEntry &e) {
    return now - e.lastTouch >= kLifetime;
  });

  // Newest first: take entries while they fit.
  float total = 0.0f;
  std::size_t fitted = 0;
  for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
    const float slot = styles.get(it->category).width + kPadding;
    if (total + slot > bounds.width)
      break;
    it->animation = std::min(1.0f, it->animation + kAnimationStep);
    total += slot;
    ++fitted;
  }

  // Only the fitting suffix survives the pass.
  while (m_entries.size() > fitted)
    m_entries.pop_front();

  DrawList out;
  out.reserve(m_entries.size() * 3);
  float x = bounds.right() - total;
  for (const KeyEntry &entry : m_entries) {
    const Style &style = styles.get(entry.category);
    const float scale = std::clamp(entry.animation, 0.0f, 1.0f);
    const float w = style.width * scale;
    const float h = style.height * scale;
    Rect box{x + (style.width - w) / 2.0f, bounds.y + (style.height - h) / 2.0f,
             w, h};
    appendKeyBox(out, box, style, templateFor(entry.category), entry.icon,
                 entry.text);
    x += style.width + kPadding;
  }
  return out;
}

void KeyBuffer::tickAndRender(RenderSurface &surface, const StyleSheet &styles,
                              Clock::time_point now) {
  surface.present(tickAndRender(surface.bounds(), styles, now));
}

} // namespace keycast::display
