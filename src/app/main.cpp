/*
 * keycast: show recent keystrokes and mouse clicks in an on-screen overlay.
 *
 * Run:
 *   ./keycast --help
 *
 * Note: global capture needs an X session (XInput2) or read access to
 * /dev/input/event* for the libinput backend (usually the `input` group).
 */

#include <keycast/app/overlay_app.hpp>
#include <keycast/config/config.hpp>
#include <keycast/config/config_watcher.hpp>
#include <keycast/core.hpp>
#include <keycast/display/x11_surface.hpp>
#include <keycast/input/event_source.hpp>
#include <keycast/log.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

std::atomic_bool g_quit{false};

void onSignal(int) { g_quit.store(true); }

void printUsage() {
  std::cout
      << "Usage: keycast [options]\n"
      << "  --config PATH       : use PATH instead of the default config.toml\n"
      << "  --backend NAME      : capture backend: auto, x11 or libinput\n"
      << "  --log-level LEVEL   : debug, info, warn or error\n"
      << "  --print-config      : print the effective config and exit\n"
      << "  --version           : print the version and exit\n"
      << "  --help              : show this text\n";
}

void warnIfWayland() {
  const char *session = std::getenv("XDG_SESSION_TYPE");
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if ((session && std::string(session) == "wayland") ||
      (wayland && *wayland)) {
    KEYCAST_LOG_WARN("keycast: Wayland session detected; X11 capture only "
                     "sees XWayland clients (try --backend libinput)");
  }
}

} // namespace

int main(int argc, char **argv) {
  using namespace keycast;

  std::string configOverride;
  std::optional<input::EventSourceKind> backendOverride;
  bool printConfig = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage();
      return 0;

    } else if (arg == "--version") {
      std::cout << "keycast " << libraryVersion() << "\n";
      return 0;

    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config requires a path\n";
        return 1;
      }
      configOverride = argv[++i];

    } else if (arg == "--backend") {
      if (i + 1 >= argc) {
        std::cerr << "--backend requires auto, x11 or libinput\n";
        return 1;
      }
      std::string name = argv[++i];
      backendOverride = input::parseEventSourceKind(name);
      if (!backendOverride) {
        std::cerr << "Unknown backend: " << name << "\n";
        return 1;
      }

    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        std::cerr << "--log-level requires debug, info, warn or error\n";
        return 1;
      }
      std::string name = argv[++i];
      log::Level level;
      if (!log::parseLevel(name, level)) {
        std::cerr << "Unknown log level: " << name << "\n";
        return 1;
      }
      log::setLevel(level);

    } else if (arg == "--print-config") {
      printConfig = true;

    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      printUsage();
      return 1;
    }
  }

  KEYCAST_LOG_INFO("keycast %s starting", libraryVersion());

  const std::filesystem::path configPath =
      config::resolveConfigPath(configOverride);
  if (!config::ensureConfigExists(configPath))
    KEYCAST_LOG_WARN("keycast: could not create %s; using built-in defaults",
                     configPath.c_str());
  config::Config cfg = config::loadConfig(configPath);
  if (backendOverride)
    cfg.backend = *backendOverride;

  if (printConfig) {
    std::cout << "# " << configPath.string() << "\n" << config::formatConfig(cfg);
    return 0;
  }

  warnIfWayland();

  std::unique_ptr<display::X11Surface> surface =
      display::X11Surface::create(cfg.window);
  if (!surface) {
    std::cerr << "keycast: cannot open the overlay window (is DISPLAY set?)\n";
    return 1;
  }

  auto channel = std::make_shared<input::EventChannel>();
  const input::EventSourceKind kind = input::resolveEventSourceKind(cfg.backend);
  std::unique_ptr<input::KeyEventSource> source =
      input::createEventSource(kind);
  if (!source || !source->start(channel)) {
    KEYCAST_LOG_ERROR("keycast: %s capture failed to start; the overlay will "
                      "stay empty",
                      input::eventSourceKindName(kind));
  } else {
    KEYCAST_LOG_INFO("keycast: capturing with %s", source->name());
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  auto watcher =
      std::make_unique<config::ConfigWatcher>(configPath, cfg.lastModified);
  app::OverlayApp overlay(std::move(cfg), channel, std::move(watcher));
  overlay.run(*surface, g_quit);

  if (source)
    source->stop();
  KEYCAST_LOG_INFO("keycast: bye");
  return 0;
}
