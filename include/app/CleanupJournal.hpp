#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include "model/Cleanup.hpp"

namespace harbor::app {

// Append-only record of every path outcome, rotated hourly:
// <dir>/harbor_YYYY-MM-DD_HH.log
class CleanupJournal {
public:
  explicit CleanupJournal(std::filesystem::path dir);
  CleanupJournal(const CleanupJournal&) = delete;
  CleanupJournal& operator=(const CleanupJournal&) = delete;

  void record(const harbor::model::PathOutcome& o);
  void note(const std::string& line);

  [[nodiscard]] std::filesystem::path chunk_path() const;
  const std::filesystem::path& dir() const { return dir_; }

private:
  bool ensure_open();
  void write_line(const std::string& line);

  std::filesystem::path dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
  std::mutex mu_;
};

} // namespace harbor::app
