#include "app/CleanupJournal.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace harbor::app {

CleanupJournal::CleanupJournal(std::filesystem::path dir) : dir_(std::move(dir)) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    std::fprintf(stderr, "harbor: CleanupJournal: failed to create %s: %s\n",
                 dir_.c_str(), ec.message().c_str());
  }
}

std::filesystem::path CleanupJournal::chunk_path() const {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "harbor_%04d-%02d-%02d_%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
  return dir_ / buf;
}

bool CleanupJournal::ensure_open() {
  auto required = chunk_path();
  // Rotate on hour boundary
  if (required == current_path_ && file_.is_open()) return true;
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
  file_.open(required, std::ios::app);
  if (!file_) {
    std::fprintf(stderr, "harbor: CleanupJournal: failed to open %s: %s\n",
                 required.c_str(), std::strerror(errno));
    current_path_.clear();
    return false;
  }
  current_path_ = required;
  return true;
}

void CleanupJournal::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!ensure_open()) return;
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%S", &tm);
  file_ << ts << ' ' << line << '\n';
  file_.flush();
}

void CleanupJournal::record(const harbor::model::PathOutcome& o) {
  std::string line = harbor::model::to_string(o.kind);
  line += '\t';
  line += std::to_string(o.bytes);
  line += '\t';
  line += o.path;
  if (!o.trashed_to.empty()) { line += "\t-> "; line += o.trashed_to; }
  if (!o.reason.empty()) { line += "\t("; line += o.reason; line += ')'; }
  write_line(line);
}

void CleanupJournal::note(const std::string& line) { write_line("# " + line); }

} // namespace harbor::app
