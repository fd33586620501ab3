#pragma once
/**
 * @file input/libinput_event_source.hpp
 * @brief libinput/udev capture backend.
 *
 * Reads keyboard and pointer button events from every device on `seat0`.
 * Works on the console and under Wayland, but requires read access to
 * /dev/input (membership of the `input` group or equivalent privileges).
 */

#include <keycast/input/event_source.hpp>

#include <memory>

namespace keycast {
namespace input {

class KEYCAST_API LibinputEventSource final : public KeyEventSource {
public:
  LibinputEventSource();
  ~LibinputEventSource() override;

  LibinputEventSource(const LibinputEventSource &) = delete;
  LibinputEventSource &operator=(const LibinputEventSource &) = delete;

  bool start(const std::shared_ptr<EventChannel> &channel) override;
  void stop() override;
  [[nodiscard]] bool isRunning() const override;
  [[nodiscard]] const char *name() const override { return "libinput"; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace input
} // namespace keycast
