#pragma once

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace harbor::util {

// Flat [section] key = value reader for the harbor config file. Supports
// integers, decimals, booleans and double-quoted strings; no arrays or tables.
// Lines that are neither a header nor an assignment are collected in
// malformed() instead of failing the whole load.
class TomlReader {
public:
  bool load(const std::string& path) {
    values_.clear();
    malformed_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']') { malformed_.push_back(line_no); continue; }
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        values_[section];
        continue;
      }
      auto eq = sv.find('=');
      auto key = eq == std::string_view::npos ? std::string_view{} : trim(sv.substr(0, eq));
      if (key.empty()) { malformed_.push_back(line_no); continue; }
      values_[section][std::string(key)] = unquote(trim(sv.substr(eq + 1)));
    }
    return true;
  }

  // 1-based line numbers that could not be parsed by the last load()
  const std::vector<int>& malformed() const { return malformed_; }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* v = lookup(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = lookup(section, key);
    if (!v || v->empty()) return def;
    int out = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return def;
    return out;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* v = lookup(section, key);
    if (!v || v->empty()) return def;
    char* end = nullptr;
    double out = std::strtod(v->c_str(), &end);
    if (end != v->c_str() + v->size()) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = lookup(section, key);
    if (!v) return def;
    std::string s;
    for (char c : *v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return lookup(section, key) != nullptr;
  }

private:
  using Table = std::map<std::string, std::string, std::less<>>;

  std::map<std::string, Table, std::less<>> values_;
  std::vector<int> malformed_;

  [[nodiscard]] const std::string* lookup(std::string_view section, std::string_view key) const {
    auto s = values_.find(section);
    if (s == values_.end()) return nullptr;
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
  }

  // '#' starts a comment unless it sits inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string unquote(std::string_view sv) {
    if (sv.size() >= 2 && sv.front() == '"' && sv.back() == '"') sv = sv.substr(1, sv.size() - 2);
    return std::string(sv);
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace harbor::util
