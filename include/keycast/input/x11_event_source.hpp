#pragma once
/**
 * @file input/x11_event_source.hpp
 * @brief X11 XInput2 raw-event capture backend.
 *
 * Observes XI_RawKeyPress / XI_RawKeyRelease / XI_RawButtonPress on the root
 * window, which delivers global input inside an X session without extra
 * privileges. Under Wayland only XWayland clients are visible.
 */

#include <keycast/input/event_source.hpp>

#include <memory>

namespace keycast {
namespace input {

class KEYCAST_API X11EventSource final : public KeyEventSource {
public:
  X11EventSource();
  ~X11EventSource() override;

  X11EventSource(const X11EventSource &) = delete;
  X11EventSource &operator=(const X11EventSource &) = delete;

  bool start(const std::shared_ptr<EventChannel> &channel) override;
  void stop() override;
  [[nodiscard]] bool isRunning() const override;
  [[nodiscard]] const char *name() const override { return "x11"; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace input
} // namespace keycast
