#include "minitest.hpp"
#include "test_support.hpp"
#include "app/PathPolicy.hpp"

using harbor::app::HostLayout;
using harbor::app::LiveState;
using harbor::app::PathPolicy;
using harbor::model::Category;
using harbor::model::CleanablePath;
using harbor::model::EntryKind;
using harbor::model::Protection;

static bool denied_with(const PathPolicy& pol, const fs::path& p, Category c, const char* why) {
  auto d = pol.denied(p.string(), c);
  return d && *d == why;
}

TEST(policy_is_under_is_strict) {
  ASSERT_TRUE(PathPolicy::is_under("/a/b", "/a"));
  ASSERT_TRUE(PathPolicy::is_under("/a/b/c", "/a/"));
  ASSERT_TRUE(!PathPolicy::is_under("/a", "/a"));
  ASSERT_TRUE(!PathPolicy::is_under("/ab", "/a"));
  ASSERT_TRUE(!PathPolicy::is_under("/a/b", ""));
}

TEST(policy_allowed_area) {
  auto root = make_test_root("policy_area");
  PathPolicy pol(HostLayout::under(root));
  ASSERT_TRUE(pol.in_allowed_area((root / "home/Library/Caches/x").string()));
  ASSERT_TRUE(pol.in_allowed_area((root / "tmp/x").string()));
  ASSERT_TRUE(!pol.in_allowed_area((root / "home").string()));
  ASSERT_TRUE(!pol.in_allowed_area((root / "elsewhere/x").string()));
  fs::remove_all(root);
}

TEST(policy_denylist) {
  auto root = make_test_root("policy_deny");
  PathPolicy pol(HostLayout::under(root));
  auto home = root / "home";
  ASSERT_TRUE(denied_with(pol, "/usr/lib/libc.so", Category::AppCache, "system location"));
  ASSERT_TRUE(denied_with(pol, "/System/Library", Category::AppCache, "system location"));
  ASSERT_TRUE(denied_with(pol, root / "elsewhere/x", Category::AppCache, "outside the home directory"));
  ASSERT_TRUE(denied_with(pol, home / "Library/Caches", Category::AppCache, "protected folder"));
  ASSERT_TRUE(denied_with(pol, home / "Documents", Category::AppCache, "protected folder"));
  ASSERT_TRUE(denied_with(pol, home / "Library/Keychains/login.keychain-db", Category::AppCache, "protected folder"));
  ASSERT_TRUE(denied_with(pol, home / "Library/Mobile Documents/x", Category::AppCache, "protected folder"));
  ASSERT_TRUE(denied_with(pol, home / ".ssh", Category::AppCache, "hidden entry"));
  ASSERT_TRUE(denied_with(pol, home / "Library/Caches/.hidden", Category::AppCache, "hidden entry"));
  ASSERT_TRUE(denied_with(pol, home / "Library/Caches/CloudKit", Category::AppCache, "system cache"));
  ASSERT_TRUE(denied_with(pol, home / "Downloads/Tool.app", Category::Installer, "application bundle"));
  ASSERT_TRUE(!pol.denied((home / "Library/Caches/com.example.app").string(), Category::AppCache).has_value());
  ASSERT_TRUE(!pol.denied((home / ".cache/pip").string(), Category::AppCache).has_value());
  ASSERT_TRUE(!pol.denied((root / "tmp/build.log").string(), Category::Tmp).has_value());
  fs::remove_all(root);
}

TEST(policy_app_bundle_location) {
  auto root = make_test_root("policy_bundle");
  PathPolicy pol(HostLayout::under(root));
  ASSERT_TRUE(!pol.denied((root / "Applications/Editor.app").string(), Category::AppBundle).has_value());
  ASSERT_TRUE(!pol.denied((root / "home/Applications/Editor.app").string(), Category::AppBundle).has_value());
  ASSERT_TRUE(denied_with(pol, root / "Applications/Sub/Editor.app", Category::AppBundle, "outside the application folders"));
  ASSERT_TRUE(denied_with(pol, root / "Applications/Editor", Category::AppBundle, "not an application bundle"));
  fs::remove_all(root);
}

TEST(policy_inspect_file_and_directory) {
  auto root = make_test_root("policy_inspect");
  PathPolicy pol(HostLayout::under(root));
  auto caches = root / "home/Library/Caches";
  write_bytes(caches / "com.example.one/a.bin", 100);
  write_bytes(caches / "com.example.one/sub/b.bin", 250);
  write_bytes(caches / "loose.bin", 42);
  LiveState live;

  CleanablePath cp; std::string err;
  ASSERT_TRUE(pol.inspect((caches / "com.example.one").string(), Category::AppCache, live, cp, err));
  ASSERT_TRUE(cp.protection == Protection::Deletable);
  ASSERT_EQ(cp.size_bytes, 350u);
  ASSERT_TRUE(cp.identity.kind == EntryKind::Directory);

  ASSERT_TRUE(pol.inspect((caches / "loose.bin").string(), Category::AppCache, live, cp, err));
  ASSERT_TRUE(cp.protection == Protection::Deletable);
  ASSERT_EQ(cp.size_bytes, 42u);
  ASSERT_TRUE(cp.identity.kind == EntryKind::File);
  fs::remove_all(root);
}

TEST(policy_inspect_missing_is_vanished) {
  auto root = make_test_root("policy_missing");
  PathPolicy pol(HostLayout::under(root));
  CleanablePath cp; std::string err;
  ASSERT_TRUE(!pol.inspect((root / "home/Library/Caches/gone").string(), Category::AppCache, LiveState{}, cp, err));
  ASSERT_EQ(err, "vanished");
  fs::remove_all(root);
}

TEST(policy_symlink_is_protected) {
  auto root = make_test_root("policy_link");
  PathPolicy pol(HostLayout::under(root));
  auto caches = root / "home/Library/Caches";
  write_bytes(root / "home/Documents/secret.txt", 10);
  fs::create_directories(caches);
  fs::create_directory_symlink(root / "home/Documents", caches / "link");
  CleanablePath cp; std::string err;
  ASSERT_TRUE(pol.inspect((caches / "link").string(), Category::AppCache, LiveState{}, cp, err));
  ASSERT_TRUE(cp.protection == Protection::Protected);
  ASSERT_EQ(cp.reason, "symbolic link");
  ASSERT_EQ(cp.size_bytes, 0u);
  fs::remove_all(root);
}

TEST(policy_open_file_marks_entry_in_use) {
  auto root = make_test_root("policy_open");
  PathPolicy pol(HostLayout::under(root));
  auto dir = root / "home/Library/Caches/com.example.busy";
  write_bytes(dir / "db.sqlite", 64);
  LiveState live;
  live.open_paths = {(dir / "db.sqlite").string()};
  live.normalize();
  CleanablePath cp; std::string err;
  ASSERT_TRUE(pol.inspect(dir.string(), Category::AppCache, live, cp, err));
  ASSERT_TRUE(cp.protection == Protection::InUse);
  ASSERT_EQ(cp.reason, "open by a running process");

  // a sibling with a shared prefix is not affected
  write_bytes(root / "home/Library/Caches/com.example.busy-old", 8);
  ASSERT_TRUE(pol.inspect((root / "home/Library/Caches/com.example.busy-old").string(), Category::AppCache, live, cp, err));
  ASSERT_TRUE(cp.protection == Protection::Deletable);
  fs::remove_all(root);
}

TEST(policy_running_owner_marks_entry_in_use) {
  auto root = make_test_root("policy_owner");
  PathPolicy pol(HostLayout::under(root));
  auto dir = root / "home/Library/Caches/Firefox/Profiles";
  write_bytes(dir / "cache2", 16);
  LiveState live;
  live.running_bundle_ids = {"org.mozilla.firefox"};
  CleanablePath cp; std::string err;
  ASSERT_TRUE(pol.inspect(dir.string(), Category::BrowserCache, live, cp, err, "org.mozilla.firefox"));
  ASSERT_TRUE(cp.protection == Protection::InUse);
  ASSERT_EQ(cp.reason, "org.mozilla.firefox is running");
  ASSERT_TRUE(pol.inspect(dir.string(), Category::BrowserCache, LiveState{}, cp, err, "org.mozilla.firefox"));
  ASSERT_TRUE(cp.protection == Protection::Deletable);
  fs::remove_all(root);
}

TEST(policy_running_bundle_is_in_use) {
  auto root = make_test_root("policy_running_app");
  PathPolicy pol(HostLayout::under(root));
  auto app = root / "Applications/Editor.app";
  write_bytes(app / "Contents/MacOS/Editor", 128);
  LiveState live;
  live.running_exes = {(app / "Contents/MacOS/Editor").string()};
  CleanablePath cp; std::string err;
  ASSERT_TRUE(pol.inspect(app.string(), Category::AppBundle, live, cp, err));
  ASSERT_TRUE(cp.protection == Protection::InUse);
  ASSERT_EQ(cp.reason, "application is running");
  ASSERT_TRUE(pol.inspect(app.string(), Category::AppBundle, LiveState{}, cp, err));
  ASSERT_TRUE(cp.protection == Protection::Deletable);
  ASSERT_EQ(cp.size_bytes, 128u);
  fs::remove_all(root);
}

TEST(policy_size_respects_depth_limit) {
  auto root = make_test_root("policy_depth");
  auto dir = root / "home/Library/Caches/deep";
  write_bytes(dir / "top.bin", 10);
  write_bytes(dir / "a/inner.bin", 20);
  write_bytes(dir / "a/b/innermost.bin", 40);
  PathPolicy shallow(HostLayout::under(root), 1);
  PathPolicy deep(HostLayout::under(root));
  ASSERT_EQ(shallow.max_depth(), 1);
  ASSERT_EQ(shallow.size_of(dir.string()), 10u);
  ASSERT_EQ(deep.size_of(dir.string()), 70u);
  ASSERT_EQ(PathPolicy(HostLayout::under(root), 500).max_depth(), 64);
  fs::remove_all(root);
}

TEST(live_state_bundle_and_name_matching) {
  LiveState live;
  live.running_bundle_ids = {"com.example.editor"};
  live.running_exes = {"/Applications/Editor.app/Contents/MacOS/Editor"};
  ASSERT_TRUE(live.bundle_running("com.example.Editor"));
  ASSERT_TRUE(live.bundle_running("com.example.editor.helper"));
  ASSERT_TRUE(!live.bundle_running("com.example.editorx"));
  ASSERT_TRUE(!live.bundle_running("com.example"));
  ASSERT_TRUE(live.app_name_running("Editor"));
  ASSERT_TRUE(!live.app_name_running("Edit"));
  ASSERT_TRUE(live.exe_under("/Applications/Editor.app"));
  ASSERT_TRUE(!live.exe_under("/Applications/Edit"));
}

TEST(live_state_capture_from_source) {
  FakeProcessSource src;
  src.procs = {{10, 1, 501, "a", "/opt/b/bin", 0, 0}, {11, 1, 501, "a", "/opt/a/bin", 0, 0}};
  src.open = {"/tmp/z", "/tmp/a", "/tmp/a"};
  auto live = LiveState::capture(src);
  ASSERT_EQ(live.open_paths.size(), 2u);
  ASSERT_EQ(live.open_paths.front(), "/tmp/a");
  ASSERT_EQ(live.running_exes.front(), "/opt/a/bin");
  ASSERT_TRUE(live.running_bundle_ids.empty());
}
