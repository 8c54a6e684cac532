#pragma once
#include "model/Snapshot.hpp"

namespace harbor::collectors {

// Thin adapter over the OS cumulative counters. Implementations keep no
// history: every call returns a complete snapshot, and rate math lives in the
// RateEstimator.
class ICounterSource {
public:
  virtual ~ICounterSource() = default;

  // Read all counters into out. False means this tick's read failed; the
  // caller holds its previous values and tries again next tick.
  [[nodiscard]] virtual bool sample(harbor::model::Snapshot& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace harbor::collectors
