#pragma once

#include "sigrisk/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace sigrisk {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the caller
//         rather than read from the system clock.
//
// @details
// Tests set the clock to a known epoch before a scheduler tick so that the
// cache's staleness decisions and the reconciler's 5-minute bucket are
// reproducible. advance_by() moves the clock forward relative to its current
// value, which is how tests step across a bucket boundary or past a signal's
// expires_at.
//
// A replay harness can also drive it from tick timestamps: the
// PriceTickGateway calls advance_time() with each tick's timestamp_ms when
// it was handed a SimulationTimeProvider.
//
// Internal storage:
//   std::atomic<int64_t>; lock-free on 64-bit platforms. Readers (scheduler
//   workers, risk loop) never contend with the single writer.
//
// Thread model:
//   advance_time()/advance_by() from one writer thread; now_ms() from any
//   number of readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility; tests occasionally rewind
  // the clock on purpose.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace sigrisk
