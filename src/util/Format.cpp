#include "util/Format.hpp"

#include <cstdio>

namespace harbor::util {

std::string format_bytes(uint64_t bytes) {
  char buf[32];
  double gb = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
  double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  if (gb >= 1.0) std::snprintf(buf, sizeof(buf), "%.2f GB", gb);
  else if (mb >= 1.0) std::snprintf(buf, sizeof(buf), "%.1f MB", mb);
  else std::snprintf(buf, sizeof(buf), "%.0f KB", static_cast<double>(bytes) / 1024.0);
  return buf;
}

std::string format_rate(double bps) {
  char buf[32];
  if (bps < 0.0) bps = 0.0;
  if (bps >= 1e9) std::snprintf(buf, sizeof(buf), "%.1f GB/s", bps / 1e9);
  else if (bps >= 1e6) std::snprintf(buf, sizeof(buf), "%.1f MB/s", bps / 1e6);
  else if (bps >= 1e3) std::snprintf(buf, sizeof(buf), "%.1f KB/s", bps / 1e3);
  else std::snprintf(buf, sizeof(buf), "%.0f B/s", bps);
  return buf;
}

std::string format_pct(double pct) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
  return buf;
}

} // namespace harbor::util
