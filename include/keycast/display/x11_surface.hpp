#pragma once
/**
 * @file display/x11_surface.hpp
 * @brief Transparent, click-through X11 overlay window.
 *
 * The window is override-redirect (no decorations, not managed), stays on
 * top, uses a 32-bit ARGB visual when the server offers one and has an empty
 * input shape so pointer events fall through to the windows below. Text is
 * drawn with Xft so Nerd Font glyphs in key labels render when such a font
 * is installed.
 *
 * All calls must come from the thread that created the surface.
 */

#include <keycast/core.hpp>
#include <keycast/display/render.hpp>

#include <memory>

namespace keycast {
namespace display {

class KEYCAST_API X11Surface final : public RenderSurface {
public:
  /**
   * @brief Open the display and map the overlay window.
   * @return nullptr when the X display cannot be opened or the window cannot
   * be created (the reason is logged).
   */
  static std::unique_ptr<X11Surface> create(const WindowGeometry &geometry);

  ~X11Surface() override;

  X11Surface(const X11Surface &) = delete;
  X11Surface &operator=(const X11Surface &) = delete;

  [[nodiscard]] Rect bounds() const override;
  void applyGeometry(const WindowGeometry &geometry) override;
  bool pumpEvents() override;
  void present(const DrawList &commands) override;

  /// True when the window uses a translucent ARGB visual.
  [[nodiscard]] bool hasAlpha() const;

private:
  struct Impl;
  explicit X11Surface(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> m_impl;
};

} // namespace display
} // namespace keycast
