#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string cfg_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("harbor_test_cfg_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

TEST(config_defaults_without_file) {
  auto c = harbor::app::load_engine_config(cfg_path("absent"));
  ASSERT_EQ(c.sampling.interval_s, 2);
  ASSERT_EQ(c.thresholds.cpu.elevated_at, 70.0);
  ASSERT_EQ(c.thresholds.cpu.critical_at, 90.0);
  ASSERT_EQ(c.cleanup.max_depth, 16);
  ASSERT_TRUE(!c.cleanup.journal_dir.empty());
}

TEST(config_toml_values_applied_and_clamped) {
  auto path = cfg_path("values");
  write_file(path,
    "[sampling]\n"
    "interval_s = 99\n"
    "smoothing_window = 5\n"
    "[thresholds]\n"
    "memory_elevated = 60\n"
    "[cleanup]\n"
    "max_depth = 0\n"
    "journal_dir = \"/var/tmp/harbor-j\"\n"
  );
  auto c = harbor::app::load_engine_config(path);
  ASSERT_EQ(c.sampling.interval_s, 10);
  ASSERT_EQ(c.sampling.smoothing_window, 5);
  ASSERT_EQ(c.thresholds.memory.elevated_at, 60.0);
  ASSERT_EQ(c.thresholds.memory.critical_at, 90.0);
  ASSERT_EQ(c.cleanup.max_depth, 1);
  ASSERT_EQ(c.cleanup.journal_dir, "/var/tmp/harbor-j");
  std::filesystem::remove(path);
}

TEST(config_inverted_thresholds_are_swapped) {
  auto path = cfg_path("swap");
  write_file(path, "[thresholds]\ncpu_elevated = 95\ncpu_critical = 50\n");
  auto c = harbor::app::load_engine_config(path);
  ASSERT_EQ(c.thresholds.cpu.elevated_at, 50.0);
  ASSERT_EQ(c.thresholds.cpu.critical_at, 95.0);
  std::filesystem::remove(path);
}

TEST(config_env_used_when_toml_silent) {
  auto path = cfg_path("env");
  write_file(path, "[sampling]\ninterval_s = 4\n");
  ::setenv("HARBOR_INTERVAL_S", "7", 1);
  ::setenv("HARBOR_LOG_AGE_DAYS", "3", 1);
  auto c = harbor::app::load_engine_config(path);
  ::unsetenv("HARBOR_INTERVAL_S");
  ::unsetenv("HARBOR_LOG_AGE_DAYS");
  // TOML wins over env
  ASSERT_EQ(c.sampling.interval_s, 4);
  ASSERT_EQ(c.cleanup.log_age_days, 3);
  std::filesystem::remove(path);
}

TEST(config_env_lowercase_alias) {
  ::setenv("harbor_installer_age_days", "12", 1);
  int v = harbor::app::getenv_int("HARBOR_INSTALLER_AGE_DAYS", 30);
  ::unsetenv("harbor_installer_age_days");
  ASSERT_EQ(v, 12);
  ::setenv("HARBOR_INSTALLER_AGE_DAYS", "junk", 1);
  v = harbor::app::getenv_int("HARBOR_INSTALLER_AGE_DAYS", 30);
  ::unsetenv("HARBOR_INSTALLER_AGE_DAYS");
  ASSERT_EQ(v, 30);
}
