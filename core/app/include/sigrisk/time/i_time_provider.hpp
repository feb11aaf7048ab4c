#pragma once

#include <cstdint>

namespace sigrisk {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Every time-dependent decision in the pipeline goes through this interface:
// candle staleness and idle eviction in the MarketDataCache, run deadlines
// in the SignalScheduler, the created_at/expires_at stamps and 5-minute
// fingerprint bucket in the SignalReconciler, signal expiry checks in the
// PositionRiskManager, and fill timestamps in the PaperExecutionClient.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller (tests,
//                              replay harnesses).
//
// int64_t epoch milliseconds is used everywhere instead of chrono
// time_points: candle open times, tick timestamps and the JSON wire
// formats all carry integer milliseconds.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads
//   (scheduler workers, the risk loop and the IPC thread all read the clock).
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace sigrisk
