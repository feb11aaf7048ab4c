#include "sigrisk/signal/signal_deduplicator.hpp"

namespace sigrisk {

SignalDeduplicator::SignalDeduplicator(const ITimeProvider& clock)
    : clock_(clock) {}

bool SignalDeduplicator::check_and_register(const domain::Signal& signal) {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  purge_locked(now);

  auto it = expires_at_.find(signal.fingerprint);
  if (it != expires_at_.end()) {
    return false;
  }
  expires_at_.emplace(signal.fingerprint, signal.expires_at_ms);
  return true;
}

bool SignalDeduplicator::contains(const std::string& fingerprint) const {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  auto it = expires_at_.find(fingerprint);
  return it != expires_at_.end() && it->second > now;
}

std::size_t SignalDeduplicator::size() const {
  std::lock_guard lock(mutex_);
  return expires_at_.size();
}

void SignalDeduplicator::purge_locked(std::int64_t now_ms) {
  for (auto it = expires_at_.begin(); it != expires_at_.end();) {
    if (it->second <= now_ms) {
      it = expires_at_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace sigrisk
