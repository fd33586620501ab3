#pragma once
/**
 * @file app/overlay_app.hpp
 * @brief The per-frame overlay loop.
 *
 * OverlayApp owns the display buffer, the debounce gate and the current
 * configuration snapshot; all three live on the frame-loop thread only.
 * The only state shared with the capture thread is the EventChannel.
 */

#include <keycast/config/config.hpp>
#include <keycast/config/config_watcher.hpp>
#include <keycast/core.hpp>
#include <keycast/display/debounce_gate.hpp>
#include <keycast/display/key_buffer.hpp>
#include <keycast/display/render.hpp>
#include <keycast/input/event_channel.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace keycast {
namespace app {

class KEYCAST_API OverlayApp {
public:
  using Clock = std::chrono::steady_clock;

  /// Idle frame interval (~30 Hz).
  static constexpr std::chrono::milliseconds kIdleFrame{33};

  OverlayApp(config::Config config,
             std::shared_ptr<input::EventChannel> channel,
             std::unique_ptr<config::ConfigWatcher> watcher = nullptr,
             Clock::time_point start = Clock::now());

  /**
   * @brief Run one frame.
   *
   * Applies a pending config reload, drains the channel through the
   * debounce gate into the buffer, clears the gate when its window elapsed,
   * then renders the buffer onto @p surface.
   *
   * @return true when at least one event reached the buffer this frame.
   */
  bool tick(display::RenderSurface &surface, Clock::time_point now);

  /**
   * @brief Loop frames until the surface closes or @p quit becomes true.
   *
   * Frames run back to back while input keeps arriving and at ~30 Hz when
   * idle.
   */
  void run(display::RenderSurface &surface, const std::atomic_bool &quit);

  /**
   * @brief Replace the whole configuration snapshot.
   *
   * Buffered entries keep only their category, so they pick up the new
   * styles on the next render pass.
   */
  void replaceConfig(config::Config config,
                     display::RenderSurface *surface = nullptr);

  [[nodiscard]] const config::Config &config() const { return m_config; }
  [[nodiscard]] const display::KeyBuffer &buffer() const { return m_buffer; }
  [[nodiscard]] const display::DebounceGate &gate() const { return m_gate; }

private:
  config::Config m_config;
  std::shared_ptr<input::EventChannel> m_channel;
  std::unique_ptr<config::ConfigWatcher> m_watcher;
  display::KeyBuffer m_buffer;
  display::DebounceGate m_gate;
  std::vector<input::InputEvent> m_pending;
};

} // namespace app
} // namespace keycast
