#include "sigrisk/data/rate_limiter.hpp"

#include <algorithm>

namespace sigrisk {

RateLimiter::RateLimiter(const ITimeProvider& clock, double per_second,
                         double burst)
    : clock_(clock),
      per_second_(per_second),
      burst_(burst),
      tokens_(burst),
      last_refill_ms_(clock.now_ms()) {}

bool RateLimiter::try_acquire() {
  std::lock_guard lock(mutex_);
  refill_locked(clock_.now_ms());
  if (tokens_ < 1.0) {
    return false;
  }
  tokens_ -= 1.0;
  return true;
}

double RateLimiter::available() {
  std::lock_guard lock(mutex_);
  refill_locked(clock_.now_ms());
  return tokens_;
}

// -----------------------------------------------------------------------------
// refill_locked(): a clock that moved backwards refills nothing
// -----------------------------------------------------------------------------
void RateLimiter::refill_locked(std::int64_t now_ms) {
  if (now_ms <= last_refill_ms_) {
    return;
  }
  double elapsed_s = static_cast<double>(now_ms - last_refill_ms_) / 1000.0;
  tokens_ = std::min(burst_, tokens_ + elapsed_s * per_second_);
  last_refill_ms_ = now_ms;
}

}  // namespace sigrisk
