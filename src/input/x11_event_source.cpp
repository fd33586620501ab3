/**
 * @file input/x11_event_source.cpp
 * @brief X11 implementation of keycast::input::KeyEventSource.
 *
 * Uses XInput2 raw events on the root window:
 * - XI_RawKeyPress / XI_RawKeyRelease for keys. X keycodes are evdev
 *   keycodes offset by 8, so the shared evdev table names the physical key.
 * - XI_RawButtonPress for pointer buttons. Buttons 4-7 are the scroll wheel
 *   and are ignored.
 *
 * The worker thread owns the Display connection for its whole lifetime.
 */
#if defined(__linux__)

#include <keycast/input/x11_event_source.hpp>
#include <keycast/log.hpp>

#include <X11/XKBlib.h>
#include <X11/Xlib.h>
#include <X11/extensions/XInput2.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <thread>

namespace keycast::input {

namespace {

// Upper bound on backend setup (display/udev connection, device scan).
constexpr std::chrono::seconds kStartupTimeout{2};

// X core button numbers.
std::optional<MouseButton> buttonFromX(int detail) {
  switch (detail) {
  case 1:
    return MouseButton::Left;
  case 2:
    return MouseButton::Middle;
  case 3:
    return MouseButton::Right;
  case 4:
  case 5:
  case 6:
  case 7:
    return std::nullopt; // wheel
  case 8:
    return MouseButton::Side;
  case 9:
    return MouseButton::Extra;
  default:
    return MouseButton::Unknown;
  }
}

} // namespace

struct X11EventSource::Impl {
  Impl() = default;
  ~Impl() { stop(); }

  bool start(const std::shared_ptr<EventChannel> &channel) {
    std::lock_guard<std::mutex> lk(stateMutex);
    if (running.load())
      return false;

    translator.emplace(detectLayout(), std::make_shared<std::atomic_bool>(false),
                       channel);
    running.store(true);
    ready.store(false);
    worker = std::thread(&Impl::threadMain, this);

    // The worker either reports ready or clears running on failure.
    bool ok = false;
    {
      std::unique_lock<std::mutex> readyLock(readyMutex);
      ok = readyCv.wait_for(readyLock, kStartupTimeout, [this] {
        return ready.load() || !running.load();
      }) && ready.load();
    }
    if (!ok) {
      if (running.load())
        KEYCAST_LOG_WARN("EventSource (X11): initialization timed out");
      running.store(false);
      if (worker.joinable())
        worker.join();
      ready.store(false);
    }
    KEYCAST_LOG_DEBUG("EventSource (X11): start result=%u",
                      static_cast<unsigned>(ok));
    return ok;
  }

  void stop() {
    std::lock_guard<std::mutex> lk(stateMutex);
    running.store(false);
    if (worker.joinable()) {
      worker.join();
      KEYCAST_LOG_INFO("EventSource (X11): stopped");
    }
    translator.reset();
  }

  bool isRunning() const { return running.load() && ready.load(); }

private:
  void fail(Display *dpy, const char *what) {
    KEYCAST_LOG_ERROR("EventSource (X11): %s", what);
    if (dpy)
      XCloseDisplay(dpy);
    running.store(false);
    ready.store(false);
    notifyStartup();
  }

  void notifyStartup() {
    { std::lock_guard<std::mutex> readyLock(readyMutex); }
    readyCv.notify_all();
  }

  void threadMain() {
    Display *dpy = XOpenDisplay(nullptr);
    if (!dpy) {
      fail(nullptr, "XOpenDisplay() failed; is DISPLAY set?");
      return;
    }

    int xiOpcode = -1;
    int eventBase = 0;
    int errorBase = 0;
    if (!XQueryExtension(dpy, "XInputExtension", &xiOpcode, &eventBase,
                         &errorBase)) {
      fail(dpy, "XInput extension not available");
      return;
    }

    int xiMajor = 2;
    int xiMinor = 0;
    if (XIQueryVersion(dpy, &xiMajor, &xiMinor) != Success) {
      fail(dpy, "XInput2 not available (XIQueryVersion failed)");
      return;
    }

    Window root = DefaultRootWindow(dpy);
    unsigned char mask[XIMaskLen(XI_LASTEVENT)];
    std::memset(mask, 0, sizeof(mask));
    XISetMask(mask, XI_RawKeyPress);
    XISetMask(mask, XI_RawKeyRelease);
    XISetMask(mask, XI_RawButtonPress);

    XIEventMask evmask;
    evmask.deviceid = XIAllMasterDevices;
    evmask.mask_len = sizeof(mask);
    evmask.mask = mask;
    XISelectEvents(dpy, root, &evmask, 1);
    XFlush(dpy);

    ready.store(true);
    notifyStartup();
    KEYCAST_LOG_INFO("EventSource (X11): registered for XI2 raw key/button "
                     "events (XI %d.%d)",
                     xiMajor, xiMinor);

    while (running.load()) {
      while (XPending(dpy) > 0 && running.load()) {
        XEvent ev;
        XNextEvent(dpy, &ev);
        XGenericEventCookie *cookie = &ev.xcookie;
        if (cookie->type != GenericEvent || cookie->extension != xiOpcode)
          continue;
        if (!XGetEventData(dpy, cookie))
          continue;
        handleRawEvent(dpy, cookie->evtype,
                       static_cast<XIRawEvent *>(cookie->data));
        XFreeEventData(dpy, cookie);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::memset(mask, 0, sizeof(mask));
    XISelectEvents(dpy, root, &evmask, 1);
    XFlush(dpy);
    XCloseDisplay(dpy);
    ready.store(false);
  }

  void handleRawEvent(Display *dpy, int evtype, XIRawEvent *rev) {
    if (!rev || !translator)
      return;

    switch (evtype) {
    case XI_RawKeyPress:
    case XI_RawKeyRelease: {
      const int xkc = rev->detail;
      const bool pressed = evtype == XI_RawKeyPress;
      RawKey raw;
      raw.code = xkc >= 8 ? static_cast<uint32_t>(xkc - 8) : 0;
      raw.key = keyFromEvdev(raw.code);
      if (raw.key == Key::Unknown && pressed) {
        KeySym ks = XkbKeycodeToKeysym(dpy, static_cast<KeyCode>(xkc), 0, 0);
        if (ks != NoSymbol) {
          if (const char *ksName = XKeysymToString(ks))
            raw.platformName = ksName;
        }
      }
      KEYCAST_LOG_DEBUG("EventSource (X11) %s: keycode=%d evdev=%u key=%s",
                        pressed ? "press" : "release", xkc, raw.code,
                        keyToString(raw.key).c_str());
      translator->onKey(raw, pressed);
      break;
    }
    case XI_RawButtonPress: {
      auto button = buttonFromX(rev->detail);
      if (!button)
        return;
      KEYCAST_LOG_DEBUG("EventSource (X11) button: %d", rev->detail);
      translator->onButton(*button, static_cast<uint32_t>(rev->detail), true);
      break;
    }
    default:
      break;
    }
  }

  std::thread worker;
  std::atomic_bool running{false};
  std::atomic_bool ready{false};
  std::mutex stateMutex;
  std::mutex readyMutex;
  std::condition_variable readyCv;
  std::optional<InputTranslator> translator;
};

X11EventSource::X11EventSource() : m_impl(std::make_unique<Impl>()) {}
X11EventSource::~X11EventSource() { stop(); }

bool X11EventSource::start(const std::shared_ptr<EventChannel> &channel) {
  return m_impl ? m_impl->start(channel) : false;
}

void X11EventSource::stop() {
  if (m_impl)
    m_impl->stop();
}

bool X11EventSource::isRunning() const {
  return m_impl ? m_impl->isRunning() : false;
}

} // namespace keycast::input

#endif // __linux__
