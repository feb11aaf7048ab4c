#pragma once

#include "sigrisk/domain/position.hpp"
#include "sigrisk/domain/signal.hpp"

namespace sigrisk {

// -----------------------------------------------------------------------------
// IPersistenceSink: the external store for emitted signals and position
// transitions
// -----------------------------------------------------------------------------
// Implementations may block and may throw; callers on the hot path go
// through AsyncPersistenceWriter, which absorbs both.
// -----------------------------------------------------------------------------
class IPersistenceSink {
 public:
  virtual ~IPersistenceSink() = default;

  virtual void save_signal(const domain::Signal& signal) = 0;
  virtual void save_position_event(const domain::PositionEvent& event) = 0;
};

}  // namespace sigrisk
