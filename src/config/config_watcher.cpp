/**
 * @file config/config_watcher.cpp
 * @brief inotify + mtime based config change detection.
 */

#include <keycast/config/config_watcher.hpp>
#include <keycast/log.hpp>

#include <cerrno>
#include <climits>
#include <cstring>
#include <string>
#include <sys/inotify.h>
#include <unistd.h>
#include <utility>

namespace keycast::config {

ConfigWatcher::ConfigWatcher(
    std::filesystem::path path,
    std::optional<std::filesystem::file_time_type> lastModified)
    : m_path(std::move(path)), m_lastModified(lastModified) {
  if (!m_lastModified)
    m_lastModified = modificationTime(m_path);

  std::filesystem::path dir = m_path.parent_path();
  if (dir.empty())
    dir = ".";

  m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (m_inotifyFd < 0) {
    KEYCAST_LOG_WARN("ConfigWatcher: inotify unavailable (%s); polling "
                     "modification time",
                     std::strerror(errno));
    return;
  }
  m_watch = inotify_add_watch(m_inotifyFd, dir.c_str(),
                              IN_CLOSE_WRITE | IN_MODIFY | IN_MOVED_TO |
                                  IN_CREATE | IN_DELETE);
  if (m_watch < 0) {
    KEYCAST_LOG_WARN("ConfigWatcher: cannot watch %s (%s); polling "
                     "modification time",
                     dir.c_str(), std::strerror(errno));
    ::close(m_inotifyFd);
    m_inotifyFd = -1;
    return;
  }
  KEYCAST_LOG_DEBUG("ConfigWatcher: watching %s", m_path.c_str());
}

ConfigWatcher::~ConfigWatcher() {
  if (m_inotifyFd >= 0) {
    if (m_watch >= 0)
      inotify_rm_watch(m_inotifyFd, m_watch);
    ::close(m_inotifyFd);
  }
}

bool ConfigWatcher::drainInotify() {
  if (m_inotifyFd < 0)
    return false;

  const std::string fileName = m_path.filename().string();
  bool touched = false;
  alignas(struct inotify_event) char buf[4096];
  for (;;) {
    ssize_t n = ::read(m_inotifyFd, buf, sizeof(buf));
    if (n <= 0) {
      if (n < 0 && errno != EAGAIN && errno != EINTR)
        KEYCAST_LOG_WARN("ConfigWatcher: inotify read failed: %s",
                         std::strerror(errno));
      break;
    }
    for (char *p = buf; p < buf + n;) {
      auto *ev = reinterpret_cast<struct inotify_event *>(p);
      if (ev->len > 0 && fileName == ev->name)
        touched = true;
      p += sizeof(struct inotify_event) + ev->len;
    }
  }
  return touched;
}

std::optional<Config> ConfigWatcher::pollReload() {
  bool changed = drainInotify();

  auto mtime = modificationTime(m_path);
  if (mtime != m_lastModified)
    changed = true;

  if (!changed)
    return std::nullopt;

  Config cfg = loadConfig(m_path);
  m_lastModified = cfg.lastModified;
  KEYCAST_LOG_INFO("ConfigWatcher: reloaded %s", m_path.c_str());
  return cfg;
}

} // namespace keycast::config
