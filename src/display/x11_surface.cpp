/**
 * @file display/x11_surface.cpp
 * @brief Xlib + Xft implementation of keycast::display::RenderSurface.
 *
 * Frames are drawn into a Pixmap back buffer and copied to the window in one
 * XCopyArea, so partially drawn frames are never visible. Boxes use core
 * drawing (rectangles plus corner arcs); labels use Xft.
 *
 * Monitor selection maps `WindowGeometry::monitor` to an X screen; the
 * window position is relative to that screen's root.
 */

#include <keycast/display/x11_surface.hpp>
#include <keycast/log.hpp>

#include <X11/Xatom.h>
#include <X11/Xft/Xft.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/shape.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace keycast::display {

namespace {

// Nerd Font families first; fontconfig falls back to any sans font.
constexpr const char *kFontPattern =
    "JetBrainsMono Nerd Font,Symbols Nerd Font,Noto Sans,sans-serif";

int channelShift(unsigned long mask) {
  int shift = 0;
  if (mask == 0)
    return 0;
  while ((mask & 1UL) == 0) {
    mask >>= 1;
    ++shift;
  }
  return shift;
}

int clampToInt(float v) { return static_cast<int>(std::lround(v)); }

} // namespace

struct X11Surface::Impl {
  Display *dpy{nullptr};
  int screen{0};
  Window root{0};
  Window win{0};
  Visual *visual{nullptr};
  int depth{0};
  Colormap colormap{0};
  bool ownsColormap{false};
  bool argb{false};
  GC gc{nullptr};
  Pixmap back{0};
  XftDraw *xft{nullptr};
  Atom wmDelete{0};
  WindowGeometry geometry;
  bool closed{false};
  std::map<int, XftFont *> fonts;

  ~Impl() {
    if (!dpy)
      return;
    for (auto &entry : fonts) {
      if (entry.second)
        XftFontClose(dpy, entry.second);
    }
    fonts.clear();
    releaseBackBuffer();
    if (gc)
      XFreeGC(dpy, gc);
    if (win)
      XDestroyWindow(dpy, win);
    if (ownsColormap)
      XFreeColormap(dpy, colormap);
    XCloseDisplay(dpy);
    dpy = nullptr;
  }

  unsigned long pixelFor(const Color &c) const {
    if (argb) {
      // Premultiplied ARGB32.
      const unsigned a = c.a;
      auto pm = [a](uint8_t v) { return (static_cast<unsigned>(v) * a) / 255; };
      return (static_cast<unsigned long>(a) << 24) |
             (static_cast<unsigned long>(pm(c.r)) << 16) |
             (static_cast<unsigned long>(pm(c.g)) << 8) |
             static_cast<unsigned long>(pm(c.b));
    }
    return (static_cast<unsigned long>(c.r) << channelShift(visual->red_mask)) |
           (static_cast<unsigned long>(c.g)
            << channelShift(visual->green_mask)) |
           (static_cast<unsigned long>(c.b) << channelShift(visual->blue_mask));
  }

  int width() const { return std::max(1, clampToInt(geometry.width)); }
  int height() const { return std::max(1, clampToInt(geometry.height)); }

  void releaseBackBuffer() {
    if (xft) {
      XftDrawDestroy(xft);
      xft = nullptr;
    }
    if (back) {
      XFreePixmap(dpy, back);
      back = 0;
    }
  }

  bool createBackBuffer() {
    releaseBackBuffer();
    back = XCreatePixmap(dpy, win, static_cast<unsigned>(width()),
                         static_cast<unsigned>(height()),
                         static_cast<unsigned>(depth));
    xft = XftDrawCreate(dpy, back, visual, colormap);
    if (!xft) {
      KEYCAST_LOG_ERROR("X11Surface: XftDrawCreate failed");
      return false;
    }
    return true;
  }

  // Empty input region: clicks go to whatever is below the overlay.
  void makeClickThrough() {
    int eventBase = 0, errorBase = 0;
    if (!XShapeQueryExtension(dpy, &eventBase, &errorBase)) {
      KEYCAST_LOG_WARN("X11Surface: SHAPE extension missing; overlay will "
                       "intercept pointer input");
      return;
    }
    XShapeCombineRectangles(dpy, win, ShapeInput, 0, 0, nullptr, 0, ShapeSet,
                            Unsorted);
  }

  void setWindowHints() {
    XStoreName(dpy, win, "keycast");
    XClassHint hint;
    hint.res_name = const_cast<char *>("keycast");
    hint.res_class = const_cast<char *>("Keycast");
    XSetClassHint(dpy, win, &hint);

    wmDelete = XInternAtom(dpy, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(dpy, win, &wmDelete, 1);

    Atom state = XInternAtom(dpy, "_NET_WM_STATE", False);
    Atom above = XInternAtom(dpy, "_NET_WM_STATE_ABOVE", False);
    XChangeProperty(dpy, win, state, XA_ATOM, 32, PropModeReplace,
                    reinterpret_cast<unsigned char *>(&above), 1);
  }

  bool open(const WindowGeometry &g) {
    dpy = XOpenDisplay(nullptr);
    if (!dpy) {
      KEYCAST_LOG_ERROR("X11Surface: XOpenDisplay() failed (DISPLAY=%s)",
                        std::getenv("DISPLAY") ? std::getenv("DISPLAY")
                                               : "<unset>");
      return false;
    }

    geometry = g;
    screen = DefaultScreen(dpy);
    if (g.monitor >= 0 && g.monitor < ScreenCount(dpy)) {
      screen = g.monitor;
    } else if (g.monitor != 0) {
      KEYCAST_LOG_WARN("X11Surface: monitor %d not available; using screen %d",
                       g.monitor, screen);
    }
    root = RootWindow(dpy, screen);

    XVisualInfo vinfo;
    if (XMatchVisualInfo(dpy, screen, 32, TrueColor, &vinfo)) {
      visual = vinfo.visual;
      depth = vinfo.depth;
      colormap = XCreateColormap(dpy, root, visual, AllocNone);
      ownsColormap = true;
      argb = true;
    } else {
      KEYCAST_LOG_WARN("X11Surface: no 32-bit visual; overlay background "
                       "will be opaque");
      visual = DefaultVisual(dpy, screen);
      depth = DefaultDepth(dpy, screen);
      colormap = DefaultColormap(dpy, screen);
    }

    XSetWindowAttributes attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    attrs.override_redirect = True;
    attrs.colormap = colormap;
    attrs.background_pixel = 0;
    attrs.border_pixel = 0;
    attrs.event_mask = ExposureMask | StructureNotifyMask;
    win = XCreateWindow(dpy, root, clampToInt(g.x), clampToInt(g.y),
                        static_cast<unsigned>(width()),
                        static_cast<unsigned>(height()), 0, depth, InputOutput,
                        visual,
                        CWOverrideRedirect | CWColormap | CWBackPixel |
                            CWBorderPixel | CWEventMask,
                        &attrs);
    if (!win) {
      KEYCAST_LOG_ERROR("X11Surface: XCreateWindow failed");
      return false;
    }

    setWindowHints();
    makeClickThrough();
    gc = XCreateGC(dpy, win, 0, nullptr);
    if (!createBackBuffer())
      return false;

    XMapRaised(dpy, win);
    XFlush(dpy);
    KEYCAST_LOG_INFO("X11Surface: window %dx%d at %d,%d (screen %d, %s)",
                     width(), height(), clampToInt(g.x), clampToInt(g.y),
                     screen, argb ? "argb" : "opaque");
    return true;
  }

  XftFont *font(float size) {
    const int px = std::max(1, clampToInt(size));
    auto it = fonts.find(px);
    if (it != fonts.end())
      return it->second;

    std::string pattern =
        std::string(kFontPattern) + ":pixelsize=" + std::to_string(px);
    XftFont *f = XftFontOpenName(dpy, screen, pattern.c_str());
    if (!f) {
      std::string fallback = "sans:pixelsize=" + std::to_string(px);
      f = XftFontOpenName(dpy, screen, fallback.c_str());
    }
    if (!f)
      KEYCAST_LOG_WARN("X11Surface: no font for pixel size %d", px);
    fonts.emplace(px, f);
    return f;
  }

  void fillRoundedRect(const FillRect &cmd) {
    XSetForeground(dpy, gc, pixelFor(cmd.color));
    const int x = clampToInt(cmd.rect.x);
    const int y = clampToInt(cmd.rect.y);
    const int w = clampToInt(cmd.rect.width);
    const int h = clampToInt(cmd.rect.height);
    if (w <= 0 || h <= 0)
      return;
    int r = std::min({clampToInt(cmd.cornerRadius), w / 2, h / 2});
    if (r <= 0) {
      XFillRectangle(dpy, back, gc, x, y, static_cast<unsigned>(w),
                     static_cast<unsigned>(h));
      return;
    }
    const int d = 2 * r;
    XFillRectangle(dpy, back, gc, x + r, y, static_cast<unsigned>(w - d),
                   static_cast<unsigned>(h));
    XFillRectangle(dpy, back, gc, x, y + r, static_cast<unsigned>(w),
                   static_cast<unsigned>(h - d));
    const unsigned ud = static_cast<unsigned>(d);
    XFillArc(dpy, back, gc, x, y, ud, ud, 90 * 64, 90 * 64);
    XFillArc(dpy, back, gc, x + w - d, y, ud, ud, 0, 90 * 64);
    XFillArc(dpy, back, gc, x, y + h - d, ud, ud, 180 * 64, 90 * 64);
    XFillArc(dpy, back, gc, x + w - d, y + h - d, ud, ud, 270 * 64, 90 * 64);
  }

  void drawText(const DrawText &cmd) {
    if (cmd.text.empty())
      return;
    XftFont *f = font(cmd.fontSize);
    if (!f)
      return;

    const auto *bytes = reinterpret_cast<const FcChar8 *>(cmd.text.data());
    const int len = static_cast<int>(cmd.text.size());
    XGlyphInfo extents;
    XftTextExtentsUtf8(dpy, f, bytes, len, &extents);

    const int textW = extents.xOff;
    const int px = clampToInt(cmd.position.x);
    const int py = clampToInt(cmd.position.y);
    int x = px;
    int baseline = py;
    switch (cmd.anchor) {
    case TextAnchor::CenterCenter:
      x = px - textW / 2;
      baseline = py - (f->ascent + f->descent) / 2 + f->ascent;
      break;
    case TextAnchor::RightTop:
      x = px - textW;
      baseline = py + f->ascent;
      break;
    case TextAnchor::RightBottom:
      x = px - textW;
      baseline = py - f->descent;
      break;
    }

    XRenderColor rc;
    rc.red = static_cast<unsigned short>(cmd.color.r * 257);
    rc.green = static_cast<unsigned short>(cmd.color.g * 257);
    rc.blue = static_cast<unsigned short>(cmd.color.b * 257);
    rc.alpha = static_cast<unsigned short>(cmd.color.a * 257);
    XftColor color;
    if (!XftColorAllocValue(dpy, visual, colormap, &rc, &color)) {
      KEYCAST_LOG_WARN("X11Surface: XftColorAllocValue failed");
      return;
    }
    XftDrawStringUtf8(xft, &color, f, x, baseline, bytes, len);
    XftColorFree(dpy, visual, colormap, &color);
  }

  void flip() {
    XCopyArea(dpy, back, win, gc, 0, 0, static_cast<unsigned>(width()),
              static_cast<unsigned>(height()), 0, 0);
    XFlush(dpy);
  }
};

std::unique_ptr<X11Surface> X11Surface::create(const WindowGeometry &geometry) {
  auto impl = std::make_unique<Impl>();
  if (!impl->open(geometry))
    return nullptr;
  return std::unique_ptr<X11Surface>(new X11Surface(std::move(impl)));
}

X11Surface::X11Surface(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

X11Surface::~X11Surface() = default;

Rect X11Surface::bounds() const {
  return Rect{0.0f, 0.0f, static_cast<float>(m_impl->width()),
              static_cast<float>(m_impl->height())};
}

bool X11Surface::hasAlpha() const { return m_impl->argb; }

void X11Surface::applyGeometry(const WindowGeometry &geometry) {
  if (geometry.monitor != m_impl->geometry.monitor)
    KEYCAST_LOG_WARN("X11Surface: monitor changes apply after restart");
  m_impl->geometry = geometry;
  m_impl->geometry.monitor = m_impl->screen;
  XMoveResizeWindow(m_impl->dpy, m_impl->win, clampToInt(geometry.x),
                    clampToInt(geometry.y),
                    static_cast<unsigned>(m_impl->width()),
                    static_cast<unsigned>(m_impl->height()));
  m_impl->createBackBuffer();
  XFlush(m_impl->dpy);
  KEYCAST_LOG_INFO("X11Surface: geometry now %dx%d at %d,%d", m_impl->width(),
                   m_impl->height(), clampToInt(geometry.x),
                   clampToInt(geometry.y));
}

bool X11Surface::pumpEvents() {
  Impl &s = *m_impl;
  while (!s.closed && XPending(s.dpy) > 0) {
    XEvent ev;
    XNextEvent(s.dpy, &ev);
    switch (ev.type) {
    case ClientMessage:
      if (static_cast<Atom>(ev.xclient.data.l[0]) == s.wmDelete)
        s.closed = true;
      break;
    case DestroyNotify:
      s.closed = true;
      break;
    case Expose:
      if (ev.xexpose.count == 0)
        s.flip();
      break;
    default:
      break;
    }
  }
  return !s.closed;
}

void X11Surface::present(const DrawList &commands) {
  Impl &s = *m_impl;
  if (s.closed || !s.xft)
    return;

  // Transparent (or black on opaque visuals) clear.
  XSetForeground(s.dpy, s.gc, 0);
  XFillRectangle(s.dpy, s.back, s.gc, 0, 0, static_cast<unsigned>(s.width()),
                 static_cast<unsigned>(s.height()));

  for (const DrawCommand &cmd : commands) {
    std::visit(
        [&s](const auto &c) {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, FillRect>)
            s.fillRoundedRect(c);
          else
            s.drawText(c);
        },
        cmd);
  }
  s.flip();
}

} // namespace keycast::display
