#include "collectors/PlatformFactory.hpp"
#include "collectors/ProcfsCounterSource.hpp"
#include "collectors/ProcfsProcessSource.hpp"

namespace harbor::collectors {

std::unique_ptr<ICounterSource> make_counter_source() {
  return std::make_unique<ProcfsCounterSource>();
}

std::unique_ptr<IProcessSource> make_process_source() {
  return std::make_unique<ProcfsProcessSource>();
}

} // namespace harbor::collectors
