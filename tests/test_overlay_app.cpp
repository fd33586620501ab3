// test_overlay_app.cpp
// Unit tests for the frame loop: draining the channel, debouncing, config
// replacement and hot reload, driven against an in-memory surface.

#include <gtest/gtest.h>

#include <keycast/app/overlay_app.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <variant>

using namespace keycast;
using keycast::app::OverlayApp;
using keycast::input::EventChannel;
using keycast::input::InputEvent;
using keycast::input::KeyCategory;
using namespace std::chrono_literals;

namespace {

class RecordingSurface : public display::RenderSurface {
public:
  display::Rect bounds() const override { return {0, 0, 1000, 120}; }
  void applyGeometry(const display::WindowGeometry &geometry) override {
    ++geometryCalls;
    lastGeometry = geometry;
  }
  bool pumpEvents() override {
    ++pumps;
    return open;
  }
  void present(const display::DrawList &commands) override {
    ++frames;
    last = commands;
  }

  std::size_t rects() const {
    std::size_t n = 0;
    for (const auto &cmd : last)
      n += std::holds_alternative<display::FillRect>(cmd) ? 1 : 0;
    return n;
  }

  int geometryCalls{0};
  int pumps{0};
  int frames{0};
  bool open{true};
  display::WindowGeometry lastGeometry;
  display::DrawList last;
};

const OverlayApp::Clock::time_point kT0 = OverlayApp::Clock::time_point{} + 60s;

} // namespace

TEST(OverlayAppTest, TickDrainsDebouncesAndRenders) {
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(config::defaultConfig(), channel, nullptr, kT0);
  RecordingSurface surface;

  channel->send(InputEvent::keyPress("A"));
  channel->send(InputEvent::keyPress("A"));
  channel->send(InputEvent::mouseClick("MouseLeft"));

  EXPECT_TRUE(app.tick(surface, kT0 + 10ms));
  EXPECT_EQ(channel->size(), 0u);
  ASSERT_EQ(app.buffer().size(), 2u);
  EXPECT_EQ(app.buffer().entries()[0].text, "A");
  EXPECT_EQ(app.buffer().entries()[1].category, KeyCategory::Mouse);
  EXPECT_EQ(surface.frames, 1);
  EXPECT_EQ(surface.rects(), 2u);
}

TEST(OverlayAppTest, EmptyChannelStillPresentsAFrame) {
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(config::defaultConfig(), channel, nullptr, kT0);
  RecordingSurface surface;

  EXPECT_FALSE(app.tick(surface, kT0));
  EXPECT_EQ(surface.frames, 1);
  EXPECT_TRUE(surface.last.empty());
}

TEST(OverlayAppTest, DebounceWindowReopensAfterItElapses) {
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(config::defaultConfig(), channel, nullptr, kT0);
  RecordingSurface surface;

  channel->send(InputEvent::keyPress("A"));
  ASSERT_TRUE(app.tick(surface, kT0 + 5ms));

  channel->send(InputEvent::keyPress("A"));
  EXPECT_FALSE(app.tick(surface, kT0 + 100ms));

  // The gate clears at the end of this tick...
  EXPECT_FALSE(app.tick(surface, kT0 + 260ms));
  EXPECT_EQ(app.gate().size(), 0u);

  // ...so the next repeat is admitted and refreshes the existing entry.
  channel->send(InputEvent::keyPress("A"));
  EXPECT_TRUE(app.tick(surface, kT0 + 300ms));
  ASSERT_EQ(app.buffer().size(), 1u);
  EXPECT_EQ(app.buffer().entries()[0].lastTouch, kT0 + 300ms);
}

TEST(OverlayAppTest, EntriesExpireFromTheFrame) {
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(config::defaultConfig(), channel, nullptr, kT0);
  RecordingSurface surface;

  channel->send(InputEvent::keyPress("Q"));
  app.tick(surface, kT0);
  EXPECT_EQ(surface.rects(), 1u);
  app.tick(surface, kT0 + 1100ms);
  EXPECT_TRUE(app.buffer().empty());
  EXPECT_TRUE(surface.last.empty());
}

TEST(OverlayAppTest, ReplaceConfigAppliesGeometryOnlyWhenItChanges) {
  OverlayApp app(config::defaultConfig(), std::make_shared<EventChannel>(),
                 nullptr, kT0);
  RecordingSurface surface;

  config::Config sameWindow = config::defaultConfig();
  sameWindow.timeoutMs = 10;
  app.replaceConfig(sameWindow, &surface);
  EXPECT_EQ(surface.geometryCalls, 0);
  EXPECT_EQ(app.config().timeoutMs, 10u);

  config::Config moved = config::defaultConfig();
  moved.window.x = 42;
  app.replaceConfig(moved, &surface);
  EXPECT_EQ(surface.geometryCalls, 1);
  EXPECT_FLOAT_EQ(surface.lastGeometry.x, 42.0f);

  // Without a surface the config is still swapped in.
  moved.window.y = 7;
  app.replaceConfig(moved);
  EXPECT_FLOAT_EQ(app.config().window.y, 7.0f);
  EXPECT_EQ(surface.geometryCalls, 1);
}

TEST(OverlayAppTest, WatcherReloadRestylesVisibleEntries) {
  namespace fs = std::filesystem;
  const fs::path dir =
      fs::temp_directory_path() /
      ("keycast_app_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const fs::path file = dir / "config.toml";
  {
    std::ofstream out(file);
    out << "[styles.normal]\nbg_color = \"#000000\"\n";
  }

  config::Config initial = config::loadConfig(file);
  auto watcher =
      std::make_unique<config::ConfigWatcher>(file, initial.lastModified);
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(initial, channel, std::move(watcher), kT0);
  RecordingSurface surface;

  channel->send(InputEvent::keyPress("A"));
  app.tick(surface, kT0);
  ASSERT_EQ(surface.rects(), 1u);
  EXPECT_EQ(std::get<display::FillRect>(surface.last[0]).color,
            (display::Color{0, 0, 0, 0xff}));

  {
    std::ofstream out(file, std::ios::trunc);
    out << "[styles.normal]\nbg_color = \"#ff0000\"\n"
           "[window]\nsize = [900, 120]\n";
  }
  fs::last_write_time(file, fs::last_write_time(file) + 2s);

  app.tick(surface, kT0 + 50ms);
  EXPECT_EQ(std::get<display::FillRect>(surface.last[0]).color,
            (display::Color{0xff, 0, 0, 0xff}));
  EXPECT_EQ(surface.geometryCalls, 1);
  EXPECT_FLOAT_EQ(surface.lastGeometry.width, 900.0f);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(OverlayAppTest, RunStopsWhenQuitIsSet) {
  auto channel = std::make_shared<EventChannel>();
  OverlayApp app(config::defaultConfig(), channel);
  RecordingSurface surface;
  std::atomic_bool quit{false};

  std::thread loop([&] { app.run(surface, quit); });
  std::this_thread::sleep_for(100ms);
  quit.store(true);
  loop.join();
  EXPECT_GT(surface.frames, 0);
}

TEST(OverlayAppTest, RunStopsWhenSurfaceCloses) {
  OverlayApp app(config::defaultConfig(), std::make_shared<EventChannel>());
  RecordingSurface surface;
  surface.open = false;
  std::atomic_bool quit{false};

  app.run(surface, quit);
  EXPECT_EQ(surface.pumps, 1);
  EXPECT_EQ(surface.frames, 0);
}
