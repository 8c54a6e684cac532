#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace harbor::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HARBOR_", 0) == 0) {
    alt = std::string("harbor_") + n.substr(7);
  } else if (n.rfind("harbor_", 0) == 0) {
    alt = std::string("HARBOR_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  char* end = nullptr;
  long out = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return defv;
  return static_cast<int>(out);
}

static double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  char* end = nullptr;
  double out = std::strtod(v, &end);
  if (end == v || *end != '\0') return defv;
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/harbor/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/harbor/config.toml";
  return {};
}

std::string default_journal_dir() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return "/tmp/harbor-journal";
#ifdef __APPLE__
  return std::string(home) + "/Library/Application Support/harbor/journal";
#else
  if (const char* st = std::getenv("XDG_STATE_HOME"); st && *st)
    return std::string(st) + "/harbor/journal";
  return std::string(home) + "/.local/state/harbor/journal";
#endif
}

// TOML -> env -> default
static int resolve_int(const harbor::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key, const char* env, int defv) {
  if (have_toml && toml.has(section, key)) return toml.get_int(section, key, defv);
  return getenv_int(env, defv);
}

static double resolve_double(const harbor::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key, const char* env, double defv) {
  if (have_toml && toml.has(section, key)) return toml.get_double(section, key, defv);
  return getenv_double(env, defv);
}

static void resolve_threshold(const harbor::util::TomlReader& toml, bool have_toml, const char* metric,
                              harbor::model::Threshold& t) {
  std::string ek = std::string(metric) + "_elevated";
  std::string ck = std::string(metric) + "_critical";
  std::string upper(metric);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  std::string ee = "HARBOR_" + upper + "_ELEVATED";
  std::string ce = "HARBOR_" + upper + "_CRITICAL";
  t.elevated_at = resolve_double(toml, have_toml, "thresholds", ek.c_str(), ee.c_str(), t.elevated_at);
  t.critical_at = resolve_double(toml, have_toml, "thresholds", ck.c_str(), ce.c_str(), t.critical_at);
  if (t.elevated_at > t.critical_at) {
    std::fprintf(stderr, "harbor: Config: %s elevated (%.1f) above critical (%.1f); swapping\n",
                 metric, t.elevated_at, t.critical_at);
    std::swap(t.elevated_at, t.critical_at);
  }
}

EngineConfig load_engine_config(const std::string& toml_path) {
  EngineConfig c;
  harbor::util::TomlReader toml;
  bool have_toml = !toml_path.empty() && toml.load(toml_path);
  for (int line : toml.malformed()) {
    std::fprintf(stderr, "harbor: Config: %s:%d: expected [section] or key = value, ignored\n",
                 toml_path.c_str(), line);
  }

  auto& s = c.sampling;
  s.interval_s = std::clamp(resolve_int(toml, have_toml, "sampling", "interval_s", "HARBOR_INTERVAL_S", s.interval_s), 1, 10);
  s.min_interval_ms = std::clamp(resolve_int(toml, have_toml, "sampling", "min_interval_ms", "HARBOR_MIN_INTERVAL_MS", s.min_interval_ms), 10, 1000);
  s.smoothing_window = std::clamp(resolve_int(toml, have_toml, "sampling", "smoothing_window", "HARBOR_SMOOTHING_WINDOW", s.smoothing_window), 1, 60);
  s.history_capacity = std::clamp(resolve_int(toml, have_toml, "sampling", "history_capacity", "HARBOR_HISTORY_CAPACITY", s.history_capacity), 1, 3600);

  auto& t = c.thresholds;
  resolve_threshold(toml, have_toml, "cpu", t.cpu);
  resolve_threshold(toml, have_toml, "memory", t.memory);
  resolve_threshold(toml, have_toml, "volume", t.volume);
  resolve_threshold(toml, have_toml, "temperature", t.temperature);
  t.hysteresis = std::clamp(resolve_double(toml, have_toml, "thresholds", "hysteresis", "HARBOR_HYSTERESIS", t.hysteresis), 0.0, 20.0);

  auto& a = c.alerts;
  a.cpu_high_pct = resolve_double(toml, have_toml, "alerts", "cpu_high_pct", "HARBOR_ALERT_CPU_PCT", a.cpu_high_pct);
  a.mem_high_pct = resolve_double(toml, have_toml, "alerts", "memory_high_pct", "HARBOR_ALERT_MEMORY_PCT", a.mem_high_pct);
  a.volume_high_pct = resolve_double(toml, have_toml, "alerts", "volume_high_pct", "HARBOR_ALERT_VOLUME_PCT", a.volume_high_pct);
  a.cpu_sustain = std::chrono::seconds(std::max(0, resolve_int(toml, have_toml, "alerts", "cpu_sustain_s", "HARBOR_ALERT_CPU_SUSTAIN_S", static_cast<int>(a.cpu_sustain.count()))));
  a.cpu_cooldown = std::chrono::seconds(std::max(0, resolve_int(toml, have_toml, "alerts", "cpu_cooldown_s", "HARBOR_ALERT_CPU_COOLDOWN_S", static_cast<int>(a.cpu_cooldown.count()))));
  a.mem_cooldown = std::chrono::seconds(std::max(0, resolve_int(toml, have_toml, "alerts", "memory_cooldown_s", "HARBOR_ALERT_MEMORY_COOLDOWN_S", static_cast<int>(a.mem_cooldown.count()))));
  a.volume_cooldown = std::chrono::seconds(std::max(0, resolve_int(toml, have_toml, "alerts", "volume_cooldown_s", "HARBOR_ALERT_VOLUME_COOLDOWN_S", static_cast<int>(a.volume_cooldown.count()))));

  auto& th = c.thermal;
  th.idle_c = resolve_double(toml, have_toml, "thermal", "idle_c", "HARBOR_THERMAL_IDLE_C", th.idle_c);
  th.max_c = resolve_double(toml, have_toml, "thermal", "max_c", "HARBOR_THERMAL_MAX_C", th.max_c);
  if (th.max_c < th.idle_c) std::swap(th.max_c, th.idle_c);

  auto& cl = c.cleanup;
  cl.max_depth = std::clamp(resolve_int(toml, have_toml, "cleanup", "max_depth", "HARBOR_MAX_DEPTH", cl.max_depth), 1, 64);
  cl.log_age_days = std::clamp(resolve_int(toml, have_toml, "cleanup", "log_age_days", "HARBOR_LOG_AGE_DAYS", cl.log_age_days), 0, 3650);
  cl.installer_age_days = std::clamp(resolve_int(toml, have_toml, "cleanup", "installer_age_days", "HARBOR_INSTALLER_AGE_DAYS", cl.installer_age_days), 0, 3650);
  if (have_toml && toml.has("cleanup", "journal_dir")) cl.journal_dir = toml.get_string("cleanup", "journal_dir");
  else if (const char* jd = getenv_compat("HARBOR_JOURNAL_DIR")) cl.journal_dir = jd;
  else cl.journal_dir = default_journal_dir();
  return c;
}

EngineConfig load_engine_config() {
  return load_engine_config(config_file_path());
}

} // namespace harbor::app
