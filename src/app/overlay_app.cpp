/**
 * @file app/overlay_app.cpp
 * @brief Frame loop: reload, drain, debounce, buffer, render.
 */

#include <keycast/app/overlay_app.hpp>
#include <keycast/log.hpp>

#include <thread>
#include <utility>

namespace keycast::app {

OverlayApp::OverlayApp(config::Config config,
                       std::shared_ptr<input::EventChannel> channel,
                       std::unique_ptr<config::ConfigWatcher> watcher,
                       Clock::time_point start)
    : m_config(std::move(config)), m_channel(std::move(channel)),
      m_watcher(std::move(watcher)), m_gate(start) {}

void OverlayApp::replaceConfig(config::Config config,
                               display::RenderSurface *surface) {
  const bool geometryChanged = !(config.window == m_config.window);
  m_config = std::move(config);
  if (surface && geometryChanged)
    surface->applyGeometry(m_config.window);
}

bool OverlayApp::tick(display::RenderSurface &surface, Clock::time_point now) {
  if (m_watcher) {
    if (auto reloaded = m_watcher->pollReload())
      replaceConfig(std::move(*reloaded), &surface);
  }

  bool admitted = false;
  m_pending.clear();
  if (m_channel)
    m_channel->drainInto(m_pending);
  for (const input::InputEvent &ev : m_pending) {
    if (!m_gate.admit(ev.label))
      continue;
    m_buffer.push(ev.label, ev.isMouse(), now);
    admitted = true;
  }

  if (m_gate.update(now))
    KEYCAST_LOG_DEBUG("OverlayApp: debounce window cleared");

  m_buffer.tickAndRender(surface, m_config.styles, now);
  return admitted;
}

void OverlayApp::run(display::RenderSurface &surface,
                     const std::atomic_bool &quit) {
  KEYCAST_LOG_INFO("OverlayApp: frame loop started");
  while (!quit.load() && surface.pumpEvents()) {
    const bool busy = tick(surface, Clock::now());
    if (!busy && (!m_channel || m_channel->size() == 0))
      std::this_thread::sleep_for(kIdleFrame);
  }
  KEYCAST_LOG_INFO("OverlayApp: frame loop finished");
}

} // namespace keycast::app
