#include "minitest.hpp"
#include "test_support.hpp"
#include "app/StartupItems.hpp"
#include "util/Plist.hpp"
#include <set>
#include <sstream>

using harbor::app::CleanupExecutor;
using harbor::app::Confirmation;
using harbor::app::HostLayout;
using harbor::app::ILaunchControl;
using harbor::app::LiveState;
using harbor::app::PathPolicy;
using harbor::app::StartupItems;
using harbor::app::TrashBin;
using harbor::model::ExecuteStatus;
using harbor::model::StartupItem;
using harbor::model::StartupKind;
using harbor::model::StartupScope;

class FakeLaunchControl : public ILaunchControl {
public:
  std::set<std::string> jobs;
  std::vector<std::string> calls;

  bool loaded(const std::string& label) override { return jobs.count(label) != 0; }
  bool load(const std::string& p) override { calls.push_back("load " + p); return true; }
  bool unload(const std::string& p) override { calls.push_back("unload " + p); return true; }
};

static void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << text;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::string plist(const std::string& body) {
  return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<plist version=\"1.0\">\n<dict>\n" + body + "</dict>\n</plist>\n";
}

static std::optional<harbor::util::PlistDict> parse_text(const std::string& s) {
  return harbor::util::parse_plist(std::vector<unsigned char>(s.begin(), s.end()));
}

// user agent, unparseable user file, system agent, system daemon without a Label
static void populate(const fs::path& root) {
  write_text(root / "home/Library/LaunchAgents/com.example.sync-helper.plist", plist(
    "\t<key>Label</key>\n\t<string>com.example.sync-helper</string>\n"
    "\t<key>ProgramArguments</key>\n\t<array>\n\t\t<string>/Applications/Sync.app/Contents/MacOS/sync</string>\n"
    "\t\t<string>--background</string>\n\t</array>\n"
    "\t<key>Disabled</key>\n\t<false/>\n"));
  write_text(root / "home/Library/LaunchAgents/junk.plist", "garbage");
  write_text(root / "home/Library/LaunchAgents/readme.txt", "not a job");
  write_text(root / "Library/LaunchAgents/com.vendor.updater.plist", plist(
    "\t<key>Label</key>\n\t<string>com.vendor.updater</string>\n"
    "\t<key>Program</key>\n\t<string>/usr/local/bin/updater</string>\n"
    "\t<key>Disabled</key>\n\t<true/>\n"));
  write_text(root / "Library/LaunchDaemons/com.vendor.helper.plist", plist(
    "\t<key>Program</key>\n\t<string>/usr/local/libexec/helper</string>\n"));
}

TEST(startup_friendly_names) {
  ASSERT_EQ(StartupItems::friendly_name("com.google.keystone.agent", ""), "Agent");
  ASSERT_EQ(StartupItems::friendly_name("com.example.sync-helper", ""), "Sync Helper");
  ASSERT_EQ(StartupItems::friendly_name("io.user_daemon", ""), "User Daemon");
  ASSERT_EQ(StartupItems::friendly_name("local.app", ""), "App");
  ASSERT_EQ(StartupItems::friendly_name("", "/usr/local/bin/tool"), "tool");
}

TEST(startup_lists_agents_and_daemons) {
  auto root = make_test_root("startup_list");
  PathPolicy policy(HostLayout::under(root));
  populate(root);
  FakeLaunchControl launchd;
  launchd.jobs = {"com.example.sync-helper", "com.vendor.helper"};

  StartupItems startup(policy, launchd);
  auto items = startup.list();
  ASSERT_EQ(items.size(), 3u);

  const auto& user = items[0];
  ASSERT_EQ(user.label, "com.example.sync-helper");
  ASSERT_EQ(user.name, "Sync Helper");
  ASSERT_EQ(user.program, "/Applications/Sync.app/Contents/MacOS/sync");
  ASSERT_TRUE(user.kind == StartupKind::LaunchAgent);
  ASSERT_TRUE(user.scope == StartupScope::User);
  ASSERT_TRUE(user.enabled());
  ASSERT_TRUE(startup.modifiable(user));

  const auto& agent = items[1];
  ASSERT_EQ(agent.label, "com.vendor.updater");
  ASSERT_EQ(agent.program, "/usr/local/bin/updater");
  ASSERT_TRUE(agent.disabled);
  ASSERT_TRUE(!agent.enabled());
  ASSERT_TRUE(agent.scope == StartupScope::System);
  ASSERT_TRUE(!startup.modifiable(agent));

  const auto& daemon = items[2];
  ASSERT_EQ(daemon.label, "com.vendor.helper");
  ASSERT_TRUE(daemon.kind == StartupKind::LaunchDaemon);
  ASSERT_TRUE(daemon.loaded);
  ASSERT_TRUE(!startup.modifiable(daemon));
  fs::remove_all(root);
}

TEST(startup_with_disabled_replaces_top_level_key) {
  auto xml = plist("\t<key>Label</key>\n\t<string>x</string>\n\t<key>Disabled</key>\n\t<false/>\n");
  auto on = StartupItems::with_disabled(xml, true);
  ASSERT_TRUE(on.has_value());
  auto parsed = parse_text(*on);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->bools.at("Disabled"));
  ASSERT_EQ(on->find("<key>Disabled</key>"), on->rfind("<key>Disabled</key>"));
  ASSERT_EQ(parsed->strings.at("Label"), "x");
}

TEST(startup_with_disabled_ignores_nested_key) {
  auto xml = plist("\t<key>Label</key>\n\t<string>x</string>\n"
                   "\t<key>KeepAlive</key>\n\t<dict>\n\t\t<key>Disabled</key>\n\t\t<true/>\n\t</dict>\n");
  auto off = StartupItems::with_disabled(xml, false);
  ASSERT_TRUE(off.has_value());
  auto parsed = parse_text(*off);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->bools.count("Disabled") == 1);
  ASSERT_TRUE(!parsed->bools.at("Disabled"));
  // the nested value is left alone
  ASSERT_TRUE(off->find("\t\t<key>Disabled</key>\n\t\t<true/>") != std::string::npos);
}

TEST(startup_with_disabled_rejects_odd_input) {
  ASSERT_TRUE(!StartupItems::with_disabled("not a plist", true).has_value());
  auto xml = plist("\t<key>Disabled</key>\n\t<string>yes</string>\n");
  ASSERT_TRUE(!StartupItems::with_disabled(xml, true).has_value());
}

TEST(startup_disable_then_enable_user_agent) {
  auto root = make_test_root("startup_toggle");
  PathPolicy policy(HostLayout::under(root));
  populate(root);
  FakeLaunchControl launchd;
  launchd.jobs = {"com.example.sync-helper"};
  StartupItems startup(policy, launchd);
  auto items = startup.list();
  auto path = root / "home/Library/LaunchAgents/com.example.sync-helper.plist";

  std::string err;
  ASSERT_TRUE(startup.set_disabled(items[0], true, err));
  ASSERT_TRUE(parse_text(slurp(path))->bools.at("Disabled"));
  ASSERT_EQ(launchd.calls.size(), 1u);
  ASSERT_EQ(launchd.calls[0], "unload " + path.string());
  ASSERT_TRUE(startup.list()[0].disabled);
  ASSERT_TRUE(!fs::exists(path.string() + ".harbor-tmp"));

  ASSERT_TRUE(startup.set_disabled(items[0], false, err));
  ASSERT_TRUE(!parse_text(slurp(path))->bools.at("Disabled"));
  ASSERT_EQ(launchd.calls.back(), "load " + path.string());

  ASSERT_TRUE(!startup.set_disabled(items[1], true, err));
  ASSERT_EQ(err, "Can only modify user Launch Agents");
  fs::remove_all(root);
}

TEST(startup_binary_plist_is_not_rewritten) {
  auto root = make_test_root("startup_binary");
  PathPolicy policy(HostLayout::under(root));
  FakeLaunchControl launchd;
  StartupItems startup(policy, launchd);
  StartupItem item;
  item.path = (root / "home/Library/LaunchAgents/com.example.bin.plist").string();
  item.label = "com.example.bin";
  write_text(item.path, "bplist00 not really");
  std::string err;
  ASSERT_TRUE(!startup.set_disabled(item, true, err));
  ASSERT_EQ(err, "binary property list; convert it to XML first");
  ASSERT_EQ(slurp(item.path), "bplist00 not really");
  fs::remove_all(root);
}

TEST(startup_remove_goes_through_executor) {
  auto root = make_test_root("startup_remove");
  auto layout = HostLayout::under(root);
  PathPolicy policy(layout);
  populate(root);
  FakeLaunchControl launchd;
  launchd.jobs = {"com.example.sync-helper"};
  FakeProcessSource procs;
  TrashBin trash(layout);
  CleanupExecutor exec(policy, trash, procs);
  StartupItems startup(policy, launchd);
  auto items = startup.list();
  auto path = root / "home/Library/LaunchAgents/com.example.sync-helper.plist";

  harbor::model::CleanupResult result;
  std::string err;
  ASSERT_TRUE(startup.remove(items[0], LiveState{}, exec, Confirmation{}, result, err));
  ASSERT_TRUE(result.status == ExecuteStatus::ConfirmationMissing);
  ASSERT_TRUE(fs::exists(path));
  ASSERT_TRUE(launchd.calls.empty());

  ASSERT_TRUE(startup.remove(items[0], LiveState{}, exec, Confirmation{true, false}, result, err));
  ASSERT_TRUE(result.status == ExecuteStatus::Completed);
  ASSERT_EQ(result.removed, 1u);
  ASSERT_TRUE(!fs::exists(path));
  ASSERT_TRUE(fs::exists(root / "home/.Trash/com.example.sync-helper.plist"));
  ASSERT_EQ(launchd.calls.size(), 1u);
  ASSERT_EQ(launchd.calls[0], "unload " + path.string());

  ASSERT_TRUE(!startup.remove(items[2], LiveState{}, exec, Confirmation{true, false}, result, err));
  ASSERT_EQ(err, "Can only remove user Launch Agents");
  ASSERT_TRUE(fs::exists(root / "Library/LaunchDaemons/com.vendor.helper.plist"));
  fs::remove_all(root);
}
