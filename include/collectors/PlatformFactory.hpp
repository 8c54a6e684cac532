#pragma once
#include <memory>
#include "collectors/ICounterSource.hpp"
#include "collectors/IProcessSource.hpp"

namespace harbor::collectors {

// Implemented once per platform; the build picks the translation unit.
std::unique_ptr<ICounterSource> make_counter_source();
std::unique_ptr<IProcessSource> make_process_source();

} // namespace harbor::collectors
