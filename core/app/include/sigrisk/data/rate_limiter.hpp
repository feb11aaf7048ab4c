#pragma once

#include "sigrisk/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>

namespace sigrisk {

// -----------------------------------------------------------------------------
// RateLimiter: token bucket guarding upstream requests
// -----------------------------------------------------------------------------
//
// @brief  Allows up to `burst` requests at once and refills at
//         `per_second` tokens per second of provider time.
//
// @details
// try_acquire() never blocks: a caller that is denied must treat it exactly
// like an upstream RateLimited response. Refill is computed lazily from the
// elapsed ITimeProvider time, so a SimulationTimeProvider makes the bucket
// deterministic in tests.
//
// Thread model:
//   Shared by every scheduler worker through the MarketDataCache. A single
//   mutex guards the token count; the critical section is a few arithmetic
//   operations.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  RateLimiter(const ITimeProvider& clock, double per_second, double burst);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Takes one token if available. Returns false when the bucket is empty.
  bool try_acquire();

  // Current token count after refill; for status reporting and tests.
  double available();

 private:
  void refill_locked(std::int64_t now_ms);

  const ITimeProvider& clock_;
  const double per_second_;
  const double burst_;

  std::mutex mutex_;
  double tokens_;
  std::int64_t last_refill_ms_;
};

}  // namespace sigrisk
