#pragma once

#include "sigrisk/domain/signal.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sigrisk {

// -----------------------------------------------------------------------------
// SignalDeduplicator: registry of unexpired signal fingerprints
// -----------------------------------------------------------------------------
//
// @brief  Guarantees at most one emitted signal per fingerprint while the
//         first one is unexpired.
//
// @details
// check_and_register() is the single atomic test-and-set the scheduler uses
// before emitting: it returns true and records the fingerprint until the
// signal's expires_at, or returns false when an unexpired signal with the
// same fingerprint was already registered. Expired fingerprints are purged
// lazily on each call.
//
// Thread model:
//   One mutex; concurrent scheduler workers may call it freely.
// -----------------------------------------------------------------------------
class SignalDeduplicator {
 public:
  explicit SignalDeduplicator(const ITimeProvider& clock);

  SignalDeduplicator(const SignalDeduplicator&) = delete;
  SignalDeduplicator& operator=(const SignalDeduplicator&) = delete;

  bool check_and_register(const domain::Signal& signal);

  bool contains(const std::string& fingerprint) const;
  std::size_t size() const;

 private:
  void purge_locked(std::int64_t now_ms);

  const ITimeProvider& clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::int64_t> expires_at_;
};

}  // namespace sigrisk
