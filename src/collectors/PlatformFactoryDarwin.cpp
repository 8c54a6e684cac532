#include "collectors/PlatformFactory.hpp"
#include "collectors/DarwinCounterSource.hpp"
#include "collectors/DarwinProcessSource.hpp"

namespace harbor::collectors {

std::unique_ptr<ICounterSource> make_counter_source() {
  return std::make_unique<DarwinCounterSource>();
}

std::unique_ptr<IProcessSource> make_process_source() {
  return std::make_unique<DarwinProcessSource>();
}

} // namespace harbor::collectors
