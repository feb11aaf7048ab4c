#pragma once

#include "sigrisk/concurrent/worker_pool.hpp"
#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/data/market_data_cache.hpp"
#include "sigrisk/domain/signal.hpp"
#include "sigrisk/events/event_types.hpp"
#include "sigrisk/features/feature_engine.hpp"
#include "sigrisk/model/model_adapter.hpp"
#include "sigrisk/signal/signal_deduplicator.hpp"
#include "sigrisk/signal/signal_reconciler.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sigrisk {

enum class SymbolState {
  Idle,
  Fetching,
  Computing,
  Emitting,
  Failed,
};

const char* to_string(SymbolState s);

// IDLE and FAILED symbols may be claimed by the next tick.
bool is_claimable(SymbolState s);

enum class RunOutcome {
  Emitted,     // a new signal left the pipeline
  Suppressed,  // reconciled, but its fingerprint was already emitted
  Failed,      // every attempt failed; see error
  Skipped,     // previous run for the symbol still in flight
  Pending,     // dispatched, not finished when run_tick() stopped waiting
};

const char* to_string(RunOutcome o);

struct RunResult {
  std::string symbol;
  RunOutcome outcome{RunOutcome::Failed};
  int attempts{0};
  std::string error;
  std::optional<domain::Signal> signal;
};

struct TickSummary {
  std::int64_t tick_start_ms{0};
  std::int64_t deadline_ms{0};
  std::vector<RunResult> runs;

  std::size_t count(RunOutcome outcome) const;
  const RunResult* find(const std::string& symbol) const;
};

struct SymbolStatus {
  std::string symbol;
  SymbolState state{SymbolState::Idle};
  std::uint64_t runs{0};
  std::uint64_t emitted{0};
  std::uint64_t suppressed{0};
  std::uint64_t failures{0};
  std::uint64_t skipped{0};
  std::string last_error;
  std::int64_t last_run_ms{0};
};

// -----------------------------------------------------------------------------
// SignalScheduler: per-symbol pipeline runs on a fixed cadence
// -----------------------------------------------------------------------------
//
// @brief  Each tick dispatches one pipeline run per tracked symbol onto a
//         bounded WorkerPool:
//           cache window → features → inference → reconcile → dedup → emit.
//
// @details
// Per-symbol state machine:
//
//   IDLE → FETCHING → COMPUTING → EMITTING → IDLE
//                 ↘        ↘          ↘
//                   FAILED (logged)
//
// FAILED stays visible in status() until the next tick claims the symbol
// again, exactly as it would claim an IDLE one. Any other state means a run
// is still in flight, and the symbol is skipped for that tick. Symbols
// added or removed between ticks are picked up by the next tick; removing
// a symbol drops its status record, at once or when its run finishes.
//
// The scheduler waits for results until the tick deadline plus a short
// grace (never past the safety margin), so a run that gives up exactly at
// its deadline is reported Failed rather than Pending.
//
// Deadline of a run: min(tick start + tick interval - safety margin,
// run start + run_timeout). The deadline is passed to the cache (bounds the
// upstream fetch) and the model adapter (discards late inference), and is
// checked between stages. A run past its deadline fails with RunCancelled.
//
// Error classification at the run boundary:
//   RateLimited, InferenceTimeout   retried with exponential backoff
//                                   (base · multiplier^(attempt-1)) while
//                                   attempts remain and the backoff ends
//                                   before the deadline
//   InsufficientHistory/Window      failed, retried next tick
//   DataUnavailable                 failed, skip this tick
//   FeatureShapeMismatch            failed, logged CRITICAL, alert raised
//   RunCancelled, anything else     failed
// A failure never affects sibling runs and never blacklists the symbol.
//
// run_tick() waits for its runs until the tick deadline; runs still going
// then are reported Pending and finish in the background.
//
// Thread model:
//   run_tick() is called by the driver thread (start()/stop()) or directly
//   by tests; pipeline stages run on pool workers. mutex_ guards symbols,
//   per-symbol records and the reconciler pointer. The signal and alert
//   sinks are invoked on worker threads and must be set before the first
//   tick.
//
// Ownership:
//   Owned by SignalRiskEngine. Non-owning references to the cache, feature
//   engine, model adapter, deduplicator and clock; shares ownership of the
//   current reconciler; owns its WorkerPool and driver thread.
// -----------------------------------------------------------------------------
class SignalScheduler {
 public:
  using SignalSink = std::function<void(const domain::Signal&)>;
  using AlertSink = std::function<void(const CriticalAlertEvent&)>;

  SignalScheduler(SchedulerConfig config, MarketDataCache& cache,
                  const FeatureEngine& features, const ModelAdapter& model,
                  std::shared_ptr<const SignalReconciler> reconciler,
                  SignalDeduplicator& dedup, const ITimeProvider& clock);
  ~SignalScheduler();

  SignalScheduler(const SignalScheduler&) = delete;
  SignalScheduler& operator=(const SignalScheduler&) = delete;
  SignalScheduler(SignalScheduler&&) = delete;
  SignalScheduler& operator=(SignalScheduler&&) = delete;

  void set_signal_sink(SignalSink sink);
  void set_alert_sink(AlertSink sink);

  // Runs one tick over the current symbol set.
  TickSummary run_tick();

  // Driver thread: run_tick() every tick_interval_ms until stop().
  void start();
  void stop();
  bool running() const;

  // Returns false if the symbol was already tracked / not tracked.
  bool add_symbol(const std::string& symbol);
  bool remove_symbol(const std::string& symbol);
  std::vector<std::string> symbols() const;

  // Subsequent runs use the new reconciler; runs in flight finish with the
  // one they started with.
  void replace_reconciler(std::shared_ptr<const SignalReconciler> reconciler);

  std::vector<SymbolStatus> status() const;

 private:
  struct Record {
    SymbolState state{SymbolState::Idle};
    std::uint64_t runs{0};
    std::uint64_t emitted{0};
    std::uint64_t suppressed{0};
    std::uint64_t failures{0};
    std::uint64_t skipped{0};
    std::string last_error;
    std::int64_t last_run_ms{0};
  };

  RunResult run_symbol(const std::string& symbol, std::int64_t tick_deadline_ms);
  RunOutcome run_pipeline(const std::string& symbol, std::int64_t deadline_ms,
                          std::optional<domain::Signal>& emitted);

  void set_state(const std::string& symbol, SymbolState state);
  void check_deadline(const std::string& symbol, const char* stage,
                      std::int64_t deadline_ms) const;
  void raise_alert(const std::string& symbol, const std::string& message);

  // Sleeps for delay_ms unless stop() is called first; returns false then.
  bool backoff(std::int64_t delay_ms);

  void driver_loop();

  const SchedulerConfig config_;
  MarketDataCache& cache_;
  const FeatureEngine& features_;
  const ModelAdapter& model_;
  SignalDeduplicator& dedup_;
  const ITimeProvider& clock_;

  SignalSink signal_sink_;
  AlertSink alert_sink_;

  mutable std::mutex mutex_;
  std::vector<std::string> symbols_;
  std::unordered_map<std::string, Record> records_;
  std::shared_ptr<const SignalReconciler> reconciler_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_{false};
  std::atomic<bool> running_{false};
  std::thread driver_;

  // Declared last so it is destroyed first.
  std::unique_ptr<WorkerPool> pool_;
};

}  // namespace sigrisk
