#pragma once

#include <chrono>
#include <cstdint>

namespace sigrisk {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions shared by the components that mix epoch
//         milliseconds with std::chrono durations.
//
// @details
// ITimeProvider speaks int64_t milliseconds, while waits on condition
// variables (scheduler driver, backoff sleeps, dispatch retries) take
// std::chrono durations. floor_to_bucket() is the single place the 5-minute
// fingerprint bucket and the "hour of day" feature agree on integer
// division semantics for negative inputs.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerSecond = 1000;
inline constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
inline constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
inline constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

inline std::chrono::milliseconds to_duration(std::int64_t ms) {
  return std::chrono::milliseconds{ms};
}

inline std::int64_t to_ms(std::chrono::milliseconds d) { return d.count(); }

// -------------------------------------------------------------------------
// floor_to_bucket
// -------------------------------------------------------------------------
// @brief  Index of the bucket of width bucket_ms containing time_ms.
//
// @details
// Floors toward negative infinity, so times before the epoch land in the
// bucket below rather than being truncated toward zero. bucket_ms must be
// positive.
// -------------------------------------------------------------------------
inline std::int64_t floor_to_bucket(std::int64_t time_ms,
                                    std::int64_t bucket_ms) {
  std::int64_t q = time_ms / bucket_ms;
  if ((time_ms % bucket_ms) != 0 && (time_ms < 0)) {
    --q;
  }
  return q;
}

}  // namespace sigrisk
