#pragma once
/**
 * @file config/config_watcher.hpp
 * @brief Change detection for the config file.
 *
 * The watcher does not own a thread. The overlay loop calls `pollReload()`
 * once per frame; it drains pending inotify events without blocking and
 * additionally compares the file's modification time, which also covers
 * systems where inotify is unavailable.
 */

#include <keycast/config/config.hpp>
#include <keycast/core.hpp>

#include <filesystem>
#include <optional>

namespace keycast {
namespace config {

class KEYCAST_API ConfigWatcher {
public:
  /**
   * @param path Config file to watch. The file may not exist yet; its
   * directory is watched so creation is noticed too.
   * @param lastModified Modification time of the snapshot currently in use.
   */
  explicit ConfigWatcher(
      std::filesystem::path path,
      std::optional<std::filesystem::file_time_type> lastModified = {});
  ~ConfigWatcher();

  ConfigWatcher(const ConfigWatcher &) = delete;
  ConfigWatcher &operator=(const ConfigWatcher &) = delete;

  /**
   * @brief Reload the file if it changed since the last snapshot.
   * @return The new snapshot, or std::nullopt when nothing changed.
   */
  std::optional<Config> pollReload();

  [[nodiscard]] const std::filesystem::path &path() const { return m_path; }
  [[nodiscard]] bool usingInotify() const { return m_inotifyFd >= 0; }

private:
  bool drainInotify();

  std::filesystem::path m_path;
  std::optional<std::filesystem::file_time_type> m_lastModified;
  int m_inotifyFd{-1};
  int m_watch{-1};
};

} // namespace config
} // namespace keycast
