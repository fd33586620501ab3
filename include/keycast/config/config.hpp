#pragma once
/**
 * @file config/config.hpp
 * @brief Overlay configuration: styles, window geometry, backend choice.
 *
 * Configuration lives in `config.toml`. Only the subset of TOML the file
 * needs is understood: comments, `[table]` and dotted `[styles.<category>]`
 * headers, and `key = value` pairs whose values are numbers, booleans,
 * quoted strings or flat numeric arrays. Problems never fail a load: every
 * missing or malformed field is replaced by its built-in default and a
 * warning is logged.
 */

#include <keycast/core.hpp>
#include <keycast/display/render.hpp>
#include <keycast/display/style.hpp>
#include <keycast/input/event_source.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keycast {
namespace config {

/**
 * @struct Config
 * @brief A complete, validated configuration snapshot.
 *
 * Snapshots are replaced wholesale on reload; nothing holds references into
 * a previous snapshot across frames.
 */
struct Config {
  display::StyleSheet styles{display::StyleSheet::defaults()};
  /// Accepted for compatibility; the display lifetime is fixed at 1 s.
  uint64_t timeoutMs{1200};
  display::WindowGeometry window;
  input::EventSourceKind backend{input::EventSourceKind::Auto};
  /// File the snapshot was loaded from (empty for built-in defaults).
  std::filesystem::path path;
  std::optional<std::filesystem::file_time_type> lastModified;
};

/// Built-in defaults.
KEYCAST_API Config defaultConfig();

/// Contents written by ensureConfigExists().
KEYCAST_API const char *defaultConfigToml();

/**
 * @brief Parse configuration text.
 * @param text TOML text.
 * @param origin Name used in warnings (usually the file path).
 */
KEYCAST_API Config parseConfig(const std::string &text,
                               const std::string &origin = "<string>");

/**
 * @brief Load configuration from @p path.
 *
 * A missing or unreadable file yields the built-in defaults (with `path`
 * still set so the file can be watched once it appears).
 */
KEYCAST_API Config loadConfig(const std::filesystem::path &path);

/**
 * @brief Candidate config locations, most preferred first:
 * `$XDG_CONFIG_HOME/keycast/config.toml`, `$HOME/.config/keycast/config.toml`,
 * `./config.toml`.
 */
KEYCAST_API std::vector<std::filesystem::path> configSearchPaths();

/**
 * @brief Pick the config file to use.
 *
 * An explicit @p override wins, then `KEYCAST_CONFIG`, then the first
 * existing search path, then the first search path (where a default file
 * would be created).
 */
KEYCAST_API std::filesystem::path
resolveConfigPath(const std::string &override = {});

/**
 * @brief Write the default config to @p path when no file exists there,
 * creating parent directories as needed.
 * @return true when the file exists afterwards.
 */
KEYCAST_API bool ensureConfigExists(const std::filesystem::path &path);

/// Serialize @p config back to TOML (used by `--print-config`).
KEYCAST_API std::string formatConfig(const Config &config);

/// Modification time of @p path, if it can be read.
KEYCAST_API std::optional<std::filesystem::file_time_type>
modificationTime(const std::filesystem::path &path);

} // namespace config
} // namespace keycast
