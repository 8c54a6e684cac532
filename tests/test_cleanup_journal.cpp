#include "minitest.hpp"
#include "test_support.hpp"
#include "app/CleanupJournal.hpp"
#include <sstream>
#include <thread>
#include <vector>

using harbor::app::CleanupJournal;
using harbor::model::OutcomeKind;
using harbor::model::PathOutcome;

static std::vector<std::string> lines_of(const fs::path& p) {
  std::ifstream in(p);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

TEST(journal_creates_directory_and_chunk) {
  auto root = make_test_root("journal_dir");
  CleanupJournal j(root / "a/b/journal");
  ASSERT_TRUE(fs::is_directory(root / "a/b/journal"));
  auto name = j.chunk_path().filename().string();
  ASSERT_TRUE(name.rfind("harbor_", 0) == 0);
  ASSERT_TRUE(j.chunk_path().extension() == ".log");
  ASSERT_TRUE(j.chunk_path().parent_path() == j.dir());
  fs::remove_all(root);
}

TEST(journal_record_format) {
  auto root = make_test_root("journal_format");
  CleanupJournal j(root);
  PathOutcome removed{"/h/Library/Caches/x", OutcomeKind::Removed, 2048, "", "/h/.Trash/x"};
  PathOutcome skipped{"/h/Library/Caches/y", OutcomeKind::SkippedProtected, 10, "open by a running process", ""};
  j.note("execute 2 paths");
  j.record(removed);
  j.record(skipped);
  auto lines = lines_of(j.chunk_path());
  ASSERT_EQ(lines.size(), 3u);
  // "<timestamp> <entry>"
  auto body = [](const std::string& l) { return l.substr(l.find(' ') + 1); };
  ASSERT_EQ(body(lines[0]), "# execute 2 paths");
  ASSERT_EQ(body(lines[1]), "removed\t2048\t/h/Library/Caches/x\t-> /h/.Trash/x");
  ASSERT_EQ(body(lines[2]), "skipped-protected\t10\t/h/Library/Caches/y\t(open by a running process)");
  fs::remove_all(root);
}

TEST(journal_appends_across_instances) {
  auto root = make_test_root("journal_append");
  {
    CleanupJournal j(root);
    j.note("first");
  }
  CleanupJournal j(root);
  j.note("second");
  auto lines = lines_of(j.chunk_path());
  ASSERT_EQ(lines.size(), 2u);
  fs::remove_all(root);
}

TEST(journal_concurrent_writers) {
  auto root = make_test_root("journal_threads");
  CleanupJournal j(root);
  std::vector<std::thread> ts;
  for (int t = 0; t < 4; ++t) {
    ts.emplace_back([&j, t] {
      for (int i = 0; i < 50; ++i) j.note("t" + std::to_string(t) + " " + std::to_string(i));
    });
  }
  for (auto& t : ts) t.join();
  auto lines = lines_of(j.chunk_path());
  ASSERT_EQ(lines.size(), 200u);
  for (const auto& l : lines) ASSERT_TRUE(l.find(" # t") != std::string::npos);
  fs::remove_all(root);
}
