/**
 * @file display/render.cpp
 * @brief Category templates and key box primitives.
 */

#include <keycast/display/render.hpp>

namespace keycast::display {

KEYCAST_API RenderTemplate templateFor(input::KeyCategory category) {
  using input::KeyCategory;
  switch (category) {
  case KeyCategory::Normal:
  case KeyCategory::Numeric:
  case KeyCategory::Symbol:
  case KeyCategory::Navigation:
  case KeyCategory::Function:
    return RenderTemplate::Centered;
  case KeyCategory::Modifier:
    return RenderTemplate::Corner;
  case KeyCategory::Scrollable:
  case KeyCategory::Editor:
  case KeyCategory::Escape:
  case KeyCategory::AltFunction:
  case KeyCategory::Mouse:
    return RenderTemplate::Stacked;
  case KeyCategory::Space:
  case KeyCategory::Unknown:
    return RenderTemplate::Generic;
  }
  return RenderTemplate::Generic;
}

KEYCAST_API void appendKeyBox(DrawList &out, const Rect &box,
                              const Style &style, RenderTemplate tmpl,
                              const std::string &icon,
                              const std::string &text) {
  out.emplace_back(FillRect{box, kBoxCornerRadius, style.background});

  auto textAt = [&](Point p, TextAnchor anchor, const std::string &s,
                    float size) {
    out.emplace_back(DrawText{p, anchor, s, size, style.foreground});
  };

  switch (tmpl) {
  case RenderTemplate::Centered:
    textAt(box.center(), TextAnchor::CenterCenter, text, style.textSize);
    break;
  case RenderTemplate::Corner:
    if (!icon.empty())
      textAt({box.right() - 10.0f, box.top() + 10.0f}, TextAnchor::RightTop,
             icon, style.iconSize);
    textAt({box.right() - 10.0f, box.bottom() - 10.0f},
           TextAnchor::RightBottom, text, style.textSize);
    break;
  case RenderTemplate::Stacked:
    if (!icon.empty())
      textAt({box.right() - 47.5f, box.top() + 20.0f},
             TextAnchor::CenterCenter, icon, style.iconSize);
    textAt({box.right() - 45.0f, box.bottom() - 20.0f},
           TextAnchor::CenterCenter, text, style.textSize);
    break;
  case RenderTemplate::Generic:
    if (!icon.empty())
      textAt({box.center().x, box.top() + 18.0f}, TextAnchor::CenterCenter,
             icon, style.iconSize);
    textAt({box.center().x, box.bottom() - 26.0f}, TextAnchor::CenterCenter,
           text, style.textSize);
    break;
  }
}

} // namespace keycast::display
