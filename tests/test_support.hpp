#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include "collectors/IProcessSource.hpp"

namespace fs = std::filesystem;

// Fresh per-test directory under the system temp dir.
inline fs::path make_test_root(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("harbor_test_") + tag) / std::to_string(::getpid());
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  return fs::weakly_canonical(root);
}

inline void write_bytes(const fs::path& p, size_t n) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << std::string(n, 'x');
}

// Process table under test control.
class FakeProcessSource : public harbor::collectors::IProcessSource {
public:
  std::vector<harbor::collectors::ProcessSample> procs;
  std::vector<std::string> open;
  bool fail{false};

  bool list(std::vector<harbor::collectors::ProcessSample>& out) override {
    if (fail) return false;
    out = procs;
    return true;
  }
  std::vector<std::string> open_paths() override { return open; }
  const char* name() const override { return "fake"; }
};
