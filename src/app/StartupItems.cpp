#include "app/StartupItems.hpp"
#include "util/Plist.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

using harbor::model::Category;
using harbor::model::CleanablePath;
using harbor::model::Protection;
using harbor::model::StartupItem;
using harbor::model::StartupKind;
using harbor::model::StartupScope;

namespace harbor::app {

static constexpr std::array<std::string_view, 7> kLabelNoise = {"com", "local", "user", "io", "org", "net", "app"};

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// "keystone agent" -> "Keystone Agent"
static std::string capitalized(std::string_view s) {
  std::string out = lower(s);
  bool start = true;
  for (auto& c : out) {
    if (start && std::isalpha(static_cast<unsigned char>(c))) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    start = c == ' ';
  }
  return out;
}

std::string StartupItems::friendly_name(std::string_view label, std::string_view program) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= label.size()) {
    auto dot = label.find('.', start);
    parts.push_back(label.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (it->empty()) continue;
    if (std::find(kLabelNoise.begin(), kLabelNoise.end(), lower(*it)) != kLabelNoise.end()) continue;
    std::string name(*it);
    std::replace(name.begin(), name.end(), '-', ' ');
    std::replace(name.begin(), name.end(), '_', ' ');
    return capitalized(name);
  }
  if (!parts.empty() && !parts.back().empty()) return capitalized(parts.back());
  return fs::path(std::string(program)).filename().string();
}

void StartupItems::read_folder(const fs::path& dir, StartupKind kind, StartupScope scope,
                               std::vector<StartupItem>& out) const {
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return;  // folder absent
  std::vector<StartupItem> found;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      std::fprintf(stderr, "harbor: StartupItems: listing %s stopped: %s\n", dir.c_str(), ec.message().c_str());
      break;
    }
    const auto& p = it->path();
    if (p.extension() != ".plist") continue;
    auto plist = harbor::util::read_plist(p.string());
    if (!plist) {
      std::fprintf(stderr, "harbor: StartupItems: %s is not a property list, skipped\n", p.c_str());
      continue;
    }
    StartupItem item;
    item.path = p.string();
    item.kind = kind;
    item.scope = scope;
    auto label = plist->strings.find("Label");
    item.label = label != plist->strings.end() && !label->second.empty() ? label->second : p.stem().string();
    if (auto prog = plist->strings.find("Program"); prog != plist->strings.end()) {
      item.program = prog->second;
    } else if (auto args = plist->string_arrays.find("ProgramArguments");
               args != plist->string_arrays.end() && !args->second.empty()) {
      item.program = args->second.front();
    }
    if (auto dis = plist->bools.find("Disabled"); dis != plist->bools.end()) item.disabled = dis->second;
    item.loaded = launchd_.loaded(item.label);
    item.name = friendly_name(item.label, item.program);
    found.push_back(std::move(item));
  }
  std::sort(found.begin(), found.end(), [](const StartupItem& a, const StartupItem& b){ return a.path < b.path; });
  out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
}

std::vector<StartupItem> StartupItems::list() const {
  const auto& layout = policy_.layout();
  std::vector<StartupItem> out;
  read_folder(layout.library() / "LaunchAgents", StartupKind::LaunchAgent, StartupScope::User, out);
  read_folder(layout.system_library / "LaunchAgents", StartupKind::LaunchAgent, StartupScope::System, out);
  read_folder(layout.system_library / "LaunchDaemons", StartupKind::LaunchDaemon, StartupScope::System, out);
  return out;
}

bool StartupItems::modifiable(const StartupItem& item) const {
  if (item.kind != StartupKind::LaunchAgent || item.scope != StartupScope::User) return false;
  return fs::path(item.path).parent_path() == policy_.layout().library() / "LaunchAgents";
}

// Nesting of <dict>/<array> at pos; 1 is the top-level dictionary.
static int depth_at(std::string_view xml, size_t pos) {
  int depth = 0;
  size_t i = 0;
  while ((i = xml.find('<', i)) != std::string_view::npos && i < pos) {
    auto rest = xml.substr(i);
    if (rest.starts_with("<dict>") || rest.starts_with("<array>")) ++depth;
    else if (rest.starts_with("</dict>") || rest.starts_with("</array>")) --depth;
    ++i;
  }
  return depth;
}

std::optional<std::string> StartupItems::with_disabled(std::string_view xml, bool disabled) {
  if (xml.find("<plist") == std::string_view::npos || xml.find("<dict>") == std::string_view::npos) return std::nullopt;
  const std::string_view value = disabled ? "<true/>" : "<false/>";
  constexpr std::string_view key = "<key>Disabled</key>";

  size_t pos = 0;
  while ((pos = xml.find(key, pos)) != std::string_view::npos) {
    if (depth_at(xml, pos) == 1) break;
    pos += key.size();
  }
  std::string out(xml);
  if (pos != std::string_view::npos) {
    size_t v = pos + key.size();
    while (v < xml.size() && std::isspace(static_cast<unsigned char>(xml[v]))) ++v;
    auto rest = xml.substr(v);
    size_t len = rest.starts_with("<true/>") ? 7 : rest.starts_with("<false/>") ? 8 : 0;
    if (len == 0) return std::nullopt;
    out.replace(v, len, value);
    return out;
  }

  auto close = xml.rfind("</dict>");
  if (close == std::string_view::npos) return std::nullopt;
  out.insert(close, "\t" + std::string(key) + "\n\t" + std::string(value) + "\n");
  return out;
}

bool StartupItems::set_disabled(const StartupItem& item, bool disabled, std::string& err) {
  if (!modifiable(item)) { err = "Can only modify user Launch Agents"; return false; }

  std::ifstream in(item.path, std::ios::binary);
  if (!in) { err = "cannot read " + item.path; return false; }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  in.close();
  if (text.starts_with("bplist00")) { err = "binary property list; convert it to XML first"; return false; }

  auto edited = with_disabled(text, disabled);
  if (!edited) { err = "not an editable property list"; return false; }

  std::string tmp = item.path + ".harbor-tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << *edited;
    if (!out.good()) { err = "cannot write " + tmp; return false; }
  }
  if (std::rename(tmp.c_str(), item.path.c_str()) != 0) {
    err = std::string("cannot replace plist: ") + std::strerror(errno);
    std::error_code ec;
    fs::remove(tmp, ec);
    return false;
  }

  bool ok = disabled ? launchd_.unload(item.path) : launchd_.load(item.path);
  if (!ok) {
    std::fprintf(stderr, "harbor: StartupItems: launchctl %s %s failed; takes effect at next login\n",
                 disabled ? "unload" : "load", item.path.c_str());
  }
  return true;
}

bool StartupItems::remove(const StartupItem& item, const LiveState& live, CleanupExecutor& exec,
                          Confirmation conf, harbor::model::CleanupResult& out, std::string& err) {
  if (!modifiable(item)) { err = "Can only remove user Launch Agents"; return false; }

  CleanablePath cp;
  if (!policy_.inspect(item.path, Category::StartupItem, live, cp, err)) return false;
  if (cp.protection != Protection::Deletable) { err = cp.reason; return false; }
  cp.label = "Startup item " + item.name;

  if (conf.confirmed && launchd_.loaded(item.label) && !launchd_.unload(item.path)) {
    std::fprintf(stderr, "harbor: StartupItems: launchctl unload %s failed\n", item.path.c_str());
  }
  std::vector<CleanablePath> one;
  one.push_back(std::move(cp));
  out = exec.execute(harbor::model::make_plan(std::move(one)), conf);
  return true;
}

} // namespace harbor::app
