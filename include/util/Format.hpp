#pragma once

#include <cstdint>
#include <string>

namespace harbor::util {

// "1.50 GB", "12.3 MB", "512 KB" (binary units)
std::string format_bytes(uint64_t bytes);

// "1.2 GB/s", "3.4 MB/s", "5.6 KB/s", "42 B/s" (decimal units)
std::string format_rate(double bytes_per_sec);

// "12.5%"
std::string format_pct(double pct);

} // namespace harbor::util
