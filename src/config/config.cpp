/**
 * @file config/config.cpp
 * @brief config.toml parsing, defaults, search paths and serialization.
 */

#include <keycast/config/config.hpp>
#include <keycast/log.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace keycast::config {

namespace {

using Value = std::variant<double, bool, std::string, std::vector<double>>;
using Table = std::map<std::string, std::pair<Value, int>>; // value, line

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    sv.remove_suffix(1);
  return sv;
}

std::string lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Cut a trailing `# comment`, ignoring '#' inside quoted strings.
std::string_view stripComment(std::string_view sv) {
  char quote = 0;
  for (size_t i = 0; i < sv.size(); ++i) {
    char c = sv[i];
    if (quote) {
      if (c == '\\' && quote == '"' && i + 1 < sv.size())
        ++i;
      else if (c == quote)
        quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return sv.substr(0, i);
    }
  }
  return sv;
}

std::optional<double> parseNumber(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty())
    return std::nullopt;
  std::string str(sv);
  str.erase(std::remove(str.begin(), str.end(), '_'), str.end());
  char *end = nullptr;
  double value = std::strtod(str.c_str(), &end);
  if (end == str.c_str() + str.size() && std::isfinite(value))
    return value;
  return std::nullopt;
}

std::optional<Value> parseValue(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty())
    return std::nullopt;

  if (sv.front() == '"' || sv.front() == '\'') {
    const char quote = sv.front();
    if (sv.size() < 2 || sv.back() != quote)
      return std::nullopt;
    std::string out;
    for (size_t i = 1; i + 1 < sv.size(); ++i) {
      char c = sv[i];
      if (quote == '"' && c == '\\' && i + 2 < sv.size()) {
        char n = sv[++i];
        switch (n) {
        case 'n':
          out += '\n';
          break;
        case 't':
          out += '\t';
          break;
        default:
          out += n;
          break;
        }
      } else {
        out += c;
      }
    }
    return Value{out};
  }

  if (sv.front() == '[') {
    if (sv.back() != ']')
      return std::nullopt;
    std::vector<double> items;
    std::string_view body = trim(sv.substr(1, sv.size() - 2));
    while (!body.empty()) {
      size_t comma = body.find(',');
      std::string_view item = trim(body.substr(0, comma));
      if (!item.empty()) {
        auto n = parseNumber(item);
        if (!n)
          return std::nullopt;
        items.push_back(*n);
      }
      if (comma == std::string_view::npos)
        break;
      body = body.substr(comma + 1);
    }
    return Value{items};
  }

  if (sv == "true")
    return Value{true};
  if (sv == "false")
    return Value{false};

  if (auto n = parseNumber(sv))
    return Value{*n};
  return std::nullopt;
}

std::map<std::string, Table> parseTables(const std::string &text,
                                         const std::string &origin) {
  std::map<std::string, Table> tables;
  std::string current;
  std::istringstream in(text);
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    std::string_view sv = trim(stripComment(line));
    if (sv.empty())
      continue;

    if (sv.front() == '[') {
      if (sv.back() != ']' || sv.size() < 3) {
        KEYCAST_LOG_WARN("%s:%d: malformed table header", origin.c_str(),
                         lineNo);
        continue;
      }
      current = lower(trim(sv.substr(1, sv.size() - 2)));
      tables[current];
      continue;
    }

    size_t eq = sv.find('=');
    if (eq == std::string_view::npos) {
      KEYCAST_LOG_WARN("%s:%d: expected 'key = value'", origin.c_str(), lineNo);
      continue;
    }
    std::string key = lower(trim(sv.substr(0, eq)));
    auto value = parseValue(sv.substr(eq + 1));
    if (key.empty() || !value) {
      KEYCAST_LOG_WARN("%s:%d: invalid value for '%s'", origin.c_str(), lineNo,
                       key.c_str());
      continue;
    }
    tables[current][key] = {std::move(*value), lineNo};
  }
  return tables;
}

const double *asNumber(const Value &v) { return std::get_if<double>(&v); }
const std::string *asString(const Value &v) {
  return std::get_if<std::string>(&v);
}
const std::vector<double> *asArray(const Value &v) {
  return std::get_if<std::vector<double>>(&v);
}

// True when @p v is non-negative and converts to T without overflow.
template <typename T> bool fitsNonNegative(double v) {
  return v >= 0 &&
         v < static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
}

bool fitsFloat(double v) {
  return std::fabs(v) <=
         static_cast<double>(std::numeric_limits<float>::max());
}

void applyRoot(Config &cfg, const Table &root, const std::string &origin) {
  for (const auto &[key, entry] : root) {
    const auto &[value, line] = entry;
    if (key == "timeout_ms") {
      const double *n = asNumber(value);
      if (n && fitsNonNegative<uint64_t>(*n))
        cfg.timeoutMs = static_cast<uint64_t>(*n);
      else
        KEYCAST_LOG_WARN("%s:%d: timeout_ms must be a non-negative number "
                         "in range",
                         origin.c_str(), line);
    } else if (key == "backend") {
      const std::string *s = asString(value);
      auto kind = s ? input::parseEventSourceKind(*s) : std::nullopt;
      if (kind)
        cfg.backend = *kind;
      else
        KEYCAST_LOG_WARN("%s:%d: backend must be \"auto\", \"x11\" or "
                         "\"libinput\"; using auto",
                         origin.c_str(), line);
    } else {
      KEYCAST_LOG_WARN("%s:%d: unknown key '%s' ignored", origin.c_str(), line,
                       key.c_str());
    }
  }
}

void applyWindow(Config &cfg, const Table &window, const std::string &origin) {
  for (const auto &[key, entry] : window) {
    const auto &[value, line] = entry;
    const std::vector<double> *arr = asArray(value);
    if (key == "monitor") {
      const double *n = asNumber(value);
      if (n && fitsNonNegative<int>(*n))
        cfg.window.monitor = static_cast<int>(*n);
      else
        KEYCAST_LOG_WARN("%s:%d: window.monitor must be a non-negative "
                         "number in range",
                         origin.c_str(), line);
    } else if (key == "position") {
      if (arr && arr->size() == 2 && fitsFloat((*arr)[0]) &&
          fitsFloat((*arr)[1])) {
        cfg.window.x = static_cast<float>((*arr)[0]);
        cfg.window.y = static_cast<float>((*arr)[1]);
      } else {
        KEYCAST_LOG_WARN("%s:%d: window.position must be [x, y]",
                         origin.c_str(), line);
      }
    } else if (key == "size") {
      if (arr && arr->size() == 2 && (*arr)[0] > 0 && (*arr)[1] > 0 &&
          fitsFloat((*arr)[0]) && fitsFloat((*arr)[1])) {
        cfg.window.width = static_cast<float>((*arr)[0]);
        cfg.window.height = static_cast<float>((*arr)[1]);
      } else {
        KEYCAST_LOG_WARN("%s:%d: window.size must be [width, height] with "
                         "positive values",
                         origin.c_str(), line);
      }
    } else {
      KEYCAST_LOG_WARN("%s:%d: unknown key 'window.%s' ignored",
                       origin.c_str(), line, key.c_str());
    }
  }
}

display::Style parseStyle(input::KeyCategory category, const Table &table,
                          const std::string &origin) {
  const char *cat = input::categoryName(category);
  display::Style style = display::defaultStyle(category);

  auto number = [&](const char *key, float &out) {
    auto it = table.find(key);
    const double *n = it != table.end() ? asNumber(it->second.first) : nullptr;
    if (n && fitsNonNegative<float>(*n)) {
      out = static_cast<float>(*n);
      return;
    }
    KEYCAST_LOG_WARN("%s: missing or invalid `%s` for styles.%s; using %.1f",
                     origin.c_str(), key, cat, static_cast<double>(out));
  };
  auto color = [&](const char *key, display::Color &out) {
    auto it = table.find(key);
    const std::string *s =
        it != table.end() ? asString(it->second.first) : nullptr;
    if (s) {
      if (auto c = display::parseHexColor(*s)) {
        out = *c;
        return;
      }
      KEYCAST_LOG_WARN("%s: invalid color '%s' for styles.%s.%s; using %s",
                       origin.c_str(), s->c_str(), cat, key,
                       display::toHexString(out).c_str());
      return;
    }
    KEYCAST_LOG_WARN("%s: missing color `%s` for styles.%s; using %s",
                     origin.c_str(), key, cat,
                     display::toHexString(out).c_str());
  };

  number("width", style.width);
  number("height", style.height);
  number("icon_size", style.iconSize);
  number("text_size", style.textSize);
  color("bg_color", style.background);
  color("fg_color", style.foreground);

  for (const auto &[key, entry] : table) {
    if (key != "width" && key != "height" && key != "icon_size" &&
        key != "text_size" && key != "bg_color" && key != "fg_color")
      KEYCAST_LOG_WARN("%s:%d: unknown key 'styles.%s.%s' ignored",
                       origin.c_str(), entry.second, cat, key.c_str());
  }
  return style;
}

std::string formatNumber(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  std::string s(buf);
  while (s.size() > 1 && s.back() == '0' && s[s.size() - 2] != '.')
    s.pop_back();
  return s;
}

} // namespace

KEYCAST_API Config defaultConfig() { return Config{}; }

KEYCAST_API Config parseConfig(const std::string &text,
                               const std::string &origin) {
  Config cfg;
  const std::string stylesPrefix = "styles.";
  for (const auto &[name, table] : parseTables(text, origin)) {
    if (name.empty()) {
      applyRoot(cfg, table, origin);
    } else if (name == "window") {
      applyWindow(cfg, table, origin);
    } else if (name == "styles") {
      if (!table.empty())
        KEYCAST_LOG_WARN("%s: keys directly under [styles] are ignored; use "
                         "[styles.<category>]",
                         origin.c_str());
    } else if (name.starts_with(stylesPrefix)) {
      std::string catName = name.substr(stylesPrefix.size());
      auto cat = input::parseCategory(catName);
      if (!cat) {
        KEYCAST_LOG_WARN("%s: unknown style category '%s' ignored",
                         origin.c_str(), catName.c_str());
        continue;
      }
      cfg.styles.set(*cat, parseStyle(*cat, table, origin));
    } else {
      KEYCAST_LOG_WARN("%s: unknown table [%s] ignored", origin.c_str(),
                       name.c_str());
    }
  }
  return cfg;
}

KEYCAST_API std::optional<std::filesystem::file_time_type>
modificationTime(const std::filesystem::path &path) {
  std::error_code ec;
  auto t = std::filesystem::last_write_time(path, ec);
  if (ec)
    return std::nullopt;
  return t;
}

KEYCAST_API Config loadConfig(const std::filesystem::path &path) {
  Config cfg;
  std::ifstream f(path);
  if (!f) {
    KEYCAST_LOG_WARN("Config: cannot read %s; using built-in defaults",
                     path.c_str());
  } else {
    std::stringstream ss;
    ss << f.rdbuf();
    cfg = parseConfig(ss.str(), path.string());
    KEYCAST_LOG_INFO("Config: loaded %s", path.c_str());
  }
  cfg.path = path;
  cfg.lastModified = modificationTime(path);
  return cfg;
}

KEYCAST_API std::vector<std::filesystem::path> configSearchPaths() {
  std::vector<std::filesystem::path> paths;
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg)
    paths.push_back(std::filesystem::path(xdg) / "keycast" / "config.toml");
  const char *home = std::getenv("HOME");
  if (home && *home)
    paths.push_back(std::filesystem::path(home) / ".config" / "keycast" /
                    "config.toml");
  paths.emplace_back("config.toml");
  return paths;
}

KEYCAST_API std::filesystem::path resolveConfigPath(const std::string &override) {
  if (!override.empty())
    return override;
  if (const char *env = std::getenv("KEYCAST_CONFIG"); env && *env)
    return env;

  const auto paths = configSearchPaths();
  for (const auto &p : paths) {
    std::error_code ec;
    if (std::filesystem::exists(p, ec))
      return p;
  }
  return paths.front();
}

KEYCAST_API bool ensureConfigExists(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec))
    return true;

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      KEYCAST_LOG_ERROR("Config: cannot create %s: %s",
                        path.parent_path().c_str(), ec.message().c_str());
      return false;
    }
  }

  std::ofstream out(path);
  if (!out) {
    KEYCAST_LOG_ERROR("Config: cannot write %s", path.c_str());
    return false;
  }
  out << defaultConfigToml();
  out.close();
  if (!out) {
    KEYCAST_LOG_ERROR("Config: write to %s failed", path.c_str());
    return false;
  }
  KEYCAST_LOG_INFO("Config: created default config at %s", path.c_str());
  return true;
}

KEYCAST_API std::string formatConfig(const Config &config) {
  std::ostringstream out;
  out << "timeout_ms = " << config.timeoutMs << "\n";
  out << "backend = \"" << input::eventSourceKindName(config.backend)
      << "\" # auto | x11 | libinput\n\n";

  out << "[window]\n";
  out << "monitor = " << config.window.monitor << "\n";
  out << "position = [" << formatNumber(config.window.x) << ", "
      << formatNumber(config.window.y) << "]\n";
  out << "size = [" << formatNumber(config.window.width) << ", "
      << formatNumber(config.window.height) << "]\n";

  for (input::KeyCategory cat : input::allCategories()) {
    const display::Style &s = config.styles.get(cat);
    out << "\n[styles." << input::categoryName(cat) << "]\n";
    out << "width = " << formatNumber(s.width) << "\n";
    out << "height = " << formatNumber(s.height) << "\n";
    out << "icon_size = " << formatNumber(s.iconSize) << "\n";
    out << "text_size = " << formatNumber(s.textSize) << "\n";
    out << "bg_color = \"" << display::toHexString(s.background) << "\"\n";
    out << "fg_color = \"" << display::toHexString(s.foreground) << "\"\n";
  }
  return out.str();
}

KEYCAST_API const char *defaultConfigToml() {
  static const std::string text =
      "# keycast configuration\n"
      "#\n"
      "# Changes are picked up while keycast is running.\n"
      "# Style tables: escape, normal, numeric, modifier, editor, navigation,\n"
      "# scrollable, space, symbol, unknown, function, altfunction, mouse.\n"
      "\n" +
      formatConfig(defaultConfig());
  return text.c_str();
}

} // namespace keycast::config
