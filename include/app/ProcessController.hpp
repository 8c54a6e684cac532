#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "collectors/IProcessSource.hpp"
#include "model/Process.hpp"

namespace harbor::app {

struct TerminateResult {
  bool success = false;
  bool process_still_running = false;
  std::string error_message;
};

class ProcessController {
public:
  explicit ProcessController(harbor::collectors::IProcessSource& src,
                             std::chrono::milliseconds sample_window = std::chrono::milliseconds(250));

  // CPU% needs two reads; the first call takes both, 'sample_window' apart.
  bool list_processes(harbor::model::ProcessTable& out, harbor::model::ProcessSort sort = harbor::model::ProcessSort::Cpu,
                      std::string_view filter = {});

  // SIGTERM, or SIGKILL with force. PID 0, PID 1 and our own PID are refused.
  TerminateResult terminate(int32_t pid, bool force = false) const;

  static void sort(std::vector<harbor::model::ProcessInfo>& v, harbor::model::ProcessSort key);
  static std::optional<harbor::model::ProcessSort> parse_sort(std::string_view s);
  static std::string clean_name(std::string_view raw);
  static bool is_system_process(const harbor::model::ProcessInfo& p);

private:
  bool read(std::vector<harbor::collectors::ProcessSample>& out, std::chrono::steady_clock::time_point& at);
  const std::string& user_name(uint32_t uid);

  harbor::collectors::IProcessSource& src_;
  std::chrono::milliseconds window_;
  std::unordered_map<int32_t, uint64_t> last_cpu_ns_;
  std::chrono::steady_clock::time_point last_at_{};
  bool have_last_{false};
  std::unordered_map<uint32_t, std::string> users_;
};

} // namespace harbor::app
