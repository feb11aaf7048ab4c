#pragma once

#include "sigrisk/time/i_time_provider.hpp"

namespace sigrisk {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the sigrisk executable. Tests inject SimulationTimeProvider
// instead so tick deadlines, staleness and fingerprint buckets are fully
// deterministic.
//
// Thread model:
//   system_clock::now() is safe to call from any thread. No internal state.
//
// Ownership:
//   Created in main() and passed by const reference to SignalRiskEngine,
//   which hands it on to every component.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace sigrisk
