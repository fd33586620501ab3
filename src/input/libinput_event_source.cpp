/**
 * @file input/libinput_event_source.cpp
 * @brief libinput implementation of keycast::input::KeyEventSource.
 *
 * Device discovery goes through udev on `seat0`. Keyboard key events carry
 * evdev keycodes which the shared evdev table maps onto physical keys; an
 * xkbcommon keymap built from the detected layout supplies keysym names for
 * keys the table does not know. Pointer button events map through
 * mouseButtonFromEvdev.
 */
#if defined(__linux__)

#include <keycast/input/libinput_event_source.hpp>
#include <keycast/log.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <fcntl.h>
#include <libinput.h>
#include <libudev.h>
#include <mutex>
#include <optional>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <xkbcommon/xkbcommon.h>

namespace keycast::input {

namespace {

// Upper bound on backend setup (display/udev connection, device scan).
constexpr std::chrono::seconds kStartupTimeout{2};

int openRestricted(const char *path, int flags, void *) {
  int fd = ::open(path, flags);
  return fd < 0 ? -errno : fd;
}

void closeRestricted(int fd, void *) { ::close(fd); }

const struct libinput_interface kInterface = {
    .open_restricted = openRestricted,
    .close_restricted = closeRestricted,
};

} // namespace

struct LibinputEventSource::Impl {
  Impl() = default;
  ~Impl() { stop(); }

  bool start(const std::shared_ptr<EventChannel> &channel) {
    std::lock_guard<std::mutex> lk(stateMutex);
    if (running.load())
      return false;

    xkbLayoutName = detectXkbLayoutName();
    translator.emplace(layoutFromXkbName(xkbLayoutName),
                       std::make_shared<std::atomic_bool>(false), channel);
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
        KEYCAST_LOG_WARN("EventSource (libinput): initialization timed out");
      running.store(false);
      if (worker.joinable())
        worker.join();
      ready.store(false);
    }
    KEYCAST_LOG_DEBUG("EventSource (libinput): start result=%u",
                      static_cast<unsigned>(ok));
    return ok;
  }

  void stop() {
    std::lock_guard<std::mutex> lk(stateMutex);
    running.store(false);
    if (worker.joinable()) {
      worker.join();
      KEYCAST_LOG_INFO("EventSource (libinput): stopped");
    }
    translator.reset();
  }

  bool isRunning() const { return running.load() && ready.load(); }

private:
  void notifyStartup() {
    { std::lock_guard<std::mutex> readyLock(readyMutex); }
    readyCv.notify_all();
  }

  void threadMain() {
    struct udev *udev = udev_new();
    if (!udev) {
      KEYCAST_LOG_ERROR("EventSource (libinput): udev_new() failed");
      running.store(false);
      notifyStartup();
      return;
    }

    struct libinput *li = libinput_udev_create_context(&kInterface, nullptr, udev);
    if (!li) {
      KEYCAST_LOG_ERROR(
          "EventSource (libinput): libinput_udev_create_context() failed");
      udev_unref(udev);
      running.store(false);
      notifyStartup();
      return;
    }

    if (libinput_udev_assign_seat(li, "seat0") < 0) {
      KEYCAST_LOG_ERROR(
          "EventSource (libinput): libinput_udev_assign_seat() failed. "
          "Are you in the 'input' group or running with necessary privileges?");
      libinput_unref(li);
      udev_unref(udev);
      running.store(false);
      notifyStartup();
      return;
    }

    // The keymap is only used to name keys the evdev table does not cover;
    // capture works without it.
    struct xkb_context *xkbCtx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    struct xkb_keymap *xkbKeymap = nullptr;
    if (xkbCtx) {
      struct xkb_rule_names names = {nullptr, nullptr, nullptr, nullptr,
                                     nullptr};
      if (!xkbLayoutName.empty())
        names.layout = xkbLayoutName.c_str();
      xkbKeymap = xkb_keymap_new_from_names(xkbCtx, &names,
                                            XKB_KEYMAP_COMPILE_NO_FLAGS);
    }
    if (!xkbKeymap)
      KEYCAST_LOG_WARN("EventSource (libinput): no xkb keymap; unmapped keys "
                       "will be labelled by keycode");

    ready.store(true);
    notifyStartup();
    KEYCAST_LOG_INFO("EventSource (libinput): monitoring seat0");

    int fd = libinput_get_fd(li);
    struct pollfd pfd = {.fd = fd, .events = POLLIN, .revents = 0};

    while (running.load()) {
      int ret = poll(&pfd, 1, 100);
      if (ret < 0 && errno != EINTR) {
        KEYCAST_LOG_ERROR("EventSource (libinput): poll() failed: errno=%d",
                          errno);
        break;
      }
      if (ret > 0 && (pfd.revents & POLLIN)) {
        libinput_dispatch(li);
        struct libinput_event *ev;
        while ((ev = libinput_get_event(li))) {
          switch (libinput_event_get_type(ev)) {
          case LIBINPUT_EVENT_KEYBOARD_KEY:
            handleKeyEvent(libinput_event_get_keyboard_event(ev), xkbKeymap);
            break;
          case LIBINPUT_EVENT_POINTER_BUTTON:
            handleButtonEvent(libinput_event_get_pointer_event(ev));
            break;
          default:
            break;
          }
          libinput_event_destroy(ev);
        }
      }
    }

    if (xkbKeymap)
      xkb_keymap_unref(xkbKeymap);
    if (xkbCtx)
      xkb_context_unref(xkbCtx);
    libinput_unref(li);
    udev_unref(udev);
    running.store(false);
    ready.store(false);
  }

  void handleKeyEvent(struct libinput_event_keyboard *kev,
                      struct xkb_keymap *keymap) {
    if (!kev || !translator)
      return;

    RawKey raw;
    raw.code = libinput_event_keyboard_get_key(kev);
    raw.key = keyFromEvdev(raw.code);
    bool pressed = libinput_event_keyboard_get_key_state(kev) ==
                   LIBINPUT_KEY_STATE_PRESSED;

    if (raw.key == Key::Unknown && pressed && keymap) {
      // libinput provides evdev keycodes; xkbcommon expects keycodes offset
      // by 8
      const xkb_keysym_t *syms = nullptr;
      int n = xkb_keymap_key_get_syms_by_level(keymap, raw.code + 8, 0, 0,
                                               &syms);
      if (n > 0) {
        char name[64] = {0};
        if (xkb_keysym_get_name(syms[0], name, sizeof(name)) > 0)
          raw.platformName = name;
      }
    }

    KEYCAST_LOG_DEBUG("EventSource (libinput) %s: evdev=%u key=%s",
                      pressed ? "press" : "release", raw.code,
                      keyToString(raw.key).c_str());
    translator->onKey(raw, pressed);
  }

  void handleButtonEvent(struct libinput_event_pointer *pev) {
    if (!pev || !translator)
      return;
    uint32_t code = libinput_event_pointer_get_button(pev);
    bool pressed = libinput_event_pointer_get_button_state(pev) ==
                   LIBINPUT_BUTTON_STATE_PRESSED;
    translator->onButton(mouseButtonFromEvdev(code), code, pressed);
  }

  std::thread worker;
  std::atomic_bool running{false};
  std::atomic_bool ready{false};
  std::mutex stateMutex;
  std::mutex readyMutex;
  std::condition_variable readyCv;
  std::string xkbLayoutName;
  std::optional<InputTranslator> translator;
};

LibinputEventSource::LibinputEventSource() : m_impl(std::make_unique<Impl>()) {}
LibinputEventSource::~LibinputEventSource() { stop(); }

bool LibinputEventSource::start(const std::shared_ptr<EventChannel> &channel) {
  return m_impl ? m_impl->start(channel) : false;
}

void LibinputEventSource::stop() {
  if (m_impl)
    m_impl->stop();
}

bool LibinputEventSource::isRunning() const {
  return m_impl ? m_impl->isRunning() : false;
}

} // namespace keycast::input

#endif // __linux__
