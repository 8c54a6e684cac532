#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("harbor_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  harbor::util::TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[sampling]\n"
    "interval_s = 3\n"
    "\n"
    "[thresholds]\n"
    "cpu_elevated = 65.5\n"
    "hysteresis = 2\n"
    "\n"
    "[cleanup]\n"
    "journal_dir = \"/var/tmp/harbor\"\n"
  );
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_s"), 3);
  ASSERT_EQ(tr.get_double("thresholds", "cpu_elevated"), 65.5);
  ASSERT_EQ(tr.get_double("thresholds", "hysteresis"), 2.0);
  ASSERT_EQ(tr.get_string("cleanup", "journal_dir"), "/var/tmp/harbor");
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[sampling]\ninterval_s = 2\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("sampling", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("sampling", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_double("sampling", "missing_double", 1.5), 1.5);
  ASSERT_EQ(tr.get_bool("sampling", "missing_bool", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  remove_file(path);
}

TEST(toml_has) {
  auto path = tmp_path("has");
  write_file(path, "[alerts]\ncpu_sustain_s = 30\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.has("alerts", "cpu_sustain_s"));
  ASSERT_TRUE(!tr.has("alerts", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "cpu_sustain_s"));
  remove_file(path);
}

TEST(toml_bool_variants) {
  auto path = tmp_path("bool");
  write_file(path, "[b]\na = true\nb = True\nc = 1\nd = false\ne = FALSE\nf = 0\ng = junk\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d"), false);
  ASSERT_EQ(tr.get_bool("b", "e"), false);
  ASSERT_EQ(tr.get_bool("b", "f"), false);
  ASSERT_EQ(tr.get_bool("b", "g", true), true);
  ASSERT_EQ(tr.get_bool("b", "g", false), false);
  remove_file(path);
}

TEST(toml_numeric_coercion) {
  auto path = tmp_path("num");
  write_file(path, "[n]\npos = 42\nneg = -7\nfrac = 2.5\nstr = hello\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  // a decimal is not an integer
  ASSERT_EQ(tr.get_int("n", "frac", 99), 99);
  ASSERT_EQ(tr.get_double("n", "frac"), 2.5);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_EQ(tr.get_double("n", "str", 9.5), 9.5);
  remove_file(path);
}

TEST(toml_comments_and_whitespace) {
  auto path = tmp_path("comments");
  write_file(path,
    "# Top-level comment\n"
    "\n"
    "[ thermal ]  \n"
    "  idle_c  =  40   # cool machine\n"
    "# inline section comment\n"
    "  label = \"a # b\"\n"
  );
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("thermal", "idle_c"), 40);
  ASSERT_EQ(tr.get_string("thermal", "label"), "a # b");
  remove_file(path);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
  remove_file(path);
}

TEST(toml_malformed_lines_are_reported) {
  auto path = tmp_path("malformed");
  write_file(path, "[ok]\na = 1\njust words\n[broken\n= 5\nb = 2\n");
  harbor::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.malformed().size(), 3u);
  ASSERT_EQ(tr.malformed()[0], 3);
  ASSERT_EQ(tr.malformed()[2], 5);
  ASSERT_EQ(tr.get_int("ok", "a"), 1);
  ASSERT_EQ(tr.get_int("ok", "b"), 2);
  remove_file(path);
}
