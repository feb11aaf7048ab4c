#include "sigrisk/scheduler/signal_scheduler.hpp"

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <iostream>
#include <utility>

namespace sigrisk {

namespace {

// Extra wait after the tick deadline for runs that give up at the deadline.
constexpr std::int64_t kResultGraceMs = 50;

}  // namespace

const char* to_string(SymbolState s) {
  switch (s) {
    case SymbolState::Idle:      return "IDLE";
    case SymbolState::Fetching:  return "FETCHING";
    case SymbolState::Computing: return "COMPUTING";
    case SymbolState::Emitting:  return "EMITTING";
    case SymbolState::Failed:    return "FAILED";
  }
  return "UNKNOWN";
}

bool is_claimable(SymbolState s) {
  return s == SymbolState::Idle || s == SymbolState::Failed;
}

const char* to_string(RunOutcome o) {
  switch (o) {
    case RunOutcome::Emitted:    return "emitted";
    case RunOutcome::Suppressed: return "suppressed";
    case RunOutcome::Failed:     return "failed";
    case RunOutcome::Skipped:    return "skipped";
    case RunOutcome::Pending:    return "pending";
  }
  return "unknown";
}

std::size_t TickSummary::count(RunOutcome outcome) const {
  return static_cast<std::size_t>(
      std::count_if(runs.begin(), runs.end(),
                    [outcome](const RunResult& r) { return r.outcome == outcome; }));
}

const RunResult* TickSummary::find(const std::string& symbol) const {
  for (const auto& r : runs) {
    if (r.symbol == symbol) {
      return &r;
    }
  }
  return nullptr;
}

SignalScheduler::SignalScheduler(SchedulerConfig config, MarketDataCache& cache,
                                 const FeatureEngine& features,
                                 const ModelAdapter& model,
                                 std::shared_ptr<const SignalReconciler> reconciler,
                                 SignalDeduplicator& dedup,
                                 const ITimeProvider& clock)
    : config_(std::move(config)),
      cache_(cache),
      features_(features),
      model_(model),
      dedup_(dedup),
      clock_(clock),
      reconciler_(std::move(reconciler)) {
  if (!reconciler_) {
    throw ConfigError("SignalScheduler: reconciler is required");
  }
  if (config_.tick_interval_ms <= 0 || config_.safety_margin_ms < 0 ||
      config_.safety_margin_ms >= config_.tick_interval_ms) {
    throw ConfigError("SignalScheduler: require 0 <= safety_margin_ms < tick_interval_ms");
  }
  if (config_.run_timeout_ms <= 0 || config_.max_attempts < 1 ||
      config_.backoff_base_ms < 0 || config_.backoff_multiplier < 1.0) {
    throw ConfigError("SignalScheduler: invalid run timeout or retry policy");
  }
  if (model_.input_dimension() != features_.dimension()) {
    std::cerr << "[SignalScheduler] WARNING: model expects "
              << model_.input_dimension() << " features, engine produces "
              << features_.dimension() << "\n";
  }
  for (const auto& symbol : config_.symbols) {
    add_symbol(symbol);
  }
  pool_ = std::make_unique<WorkerPool>(config_.worker_pool_size);
}

SignalScheduler::~SignalScheduler() {
  stop();
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  pool_->shutdown();
}

void SignalScheduler::set_signal_sink(SignalSink sink) {
  signal_sink_ = std::move(sink);
}

void SignalScheduler::set_alert_sink(AlertSink sink) {
  alert_sink_ = std::move(sink);
}

bool SignalScheduler::add_symbol(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  if (std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end()) {
    return false;
  }
  symbols_.push_back(symbol);
  records_.try_emplace(symbol);
  std::cout << "[SignalScheduler] tracking " << symbol << "\n";
  return true;
}

bool SignalScheduler::remove_symbol(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = std::find(symbols_.begin(), symbols_.end(), symbol);
  if (it == symbols_.end()) {
    return false;
  }
  symbols_.erase(it);
  // A run still in flight keeps its record until it finishes.
  auto record = records_.find(symbol);
  if (record != records_.end() && is_claimable(record->second.state)) {
    records_.erase(record);
  }
  std::cout << "[SignalScheduler] no longer tracking " << symbol << "\n";
  return true;
}

std::vector<std::string> SignalScheduler::symbols() const {
  std::lock_guard lock(mutex_);
  return symbols_;
}

void SignalScheduler::replace_reconciler(
    std::shared_ptr<const SignalReconciler> reconciler) {
  if (!reconciler) {
    throw ConfigError("SignalScheduler: reconciler is required");
  }
  std::lock_guard lock(mutex_);
  reconciler_ = std::move(reconciler);
  std::cout << "[SignalScheduler] reconciler replaced\n";
}

std::vector<SymbolStatus> SignalScheduler::status() const {
  std::lock_guard lock(mutex_);
  std::vector<SymbolStatus> out;
  out.reserve(symbols_.size());
  for (const auto& symbol : symbols_) {
    const Record& r = records_.at(symbol);
    SymbolStatus s;
    s.symbol = symbol;
    s.state = r.state;
    s.runs = r.runs;
    s.emitted = r.emitted;
    s.suppressed = r.suppressed;
    s.failures = r.failures;
    s.skipped = r.skipped;
    s.last_error = r.last_error;
    s.last_run_ms = r.last_run_ms;
    out.push_back(std::move(s));
  }
  return out;
}

// -----------------------------------------------------------------------------
// run_tick()
// -----------------------------------------------------------------------------
// Claims every IDLE or FAILED symbol (→ FETCHING under mutex_) before
// submitting it, so a symbol can never have two runs in flight. The wait for results
// is bounded by the tick deadline plus kResultGraceMs, converted to a
// steady_clock time point once so a frozen simulation clock cannot stretch
// it.
// -----------------------------------------------------------------------------
TickSummary SignalScheduler::run_tick() {
  TickSummary summary;
  summary.tick_start_ms = clock_.now_ms();
  summary.deadline_ms =
      summary.tick_start_ms + config_.tick_interval_ms - config_.safety_margin_ms;
  const std::int64_t grace_ms = std::min(kResultGraceMs, config_.safety_margin_ms);
  const auto wait_until =
      std::chrono::steady_clock::now() +
      to_duration(summary.deadline_ms - summary.tick_start_ms + grace_ms);

  const std::size_t evicted = cache_.evict_idle();
  if (evicted > 0) {
    std::cout << "[SignalScheduler] evicted " << evicted << " idle cache entries\n";
  }

  std::vector<std::pair<std::string, std::future<RunResult>>> dispatched;
  {
    std::lock_guard lock(mutex_);
    for (const auto& symbol : symbols_) {
      Record& record = records_[symbol];
      if (!is_claimable(record.state)) {
        ++record.skipped;
        RunResult skipped;
        skipped.symbol = symbol;
        skipped.outcome = RunOutcome::Skipped;
        summary.runs.push_back(std::move(skipped));
        std::cout << "[SignalScheduler] " << symbol << " skipped, previous run is "
                  << to_string(record.state) << "\n";
        continue;
      }
      record.state = SymbolState::Fetching;
      ++record.runs;
      record.last_run_ms = summary.tick_start_ms;
      dispatched.emplace_back(symbol, std::future<RunResult>{});
    }
  }

  const std::int64_t tick_deadline = summary.deadline_ms;
  for (auto& [symbol, future] : dispatched) {
    future = pool_->submit([this, symbol = symbol, tick_deadline] {
      return run_symbol(symbol, tick_deadline);
    });
  }

  for (auto& [symbol, future] : dispatched) {
    if (future.wait_until(wait_until) == std::future_status::ready) {
      summary.runs.push_back(future.get());
    } else {
      RunResult pending;
      pending.symbol = symbol;
      pending.outcome = RunOutcome::Pending;
      summary.runs.push_back(std::move(pending));
    }
  }

  std::cout << "[SignalScheduler] tick: " << summary.count(RunOutcome::Emitted)
            << " emitted, " << summary.count(RunOutcome::Suppressed)
            << " suppressed, " << summary.count(RunOutcome::Failed) << " failed, "
            << summary.count(RunOutcome::Skipped) << " skipped, "
            << summary.count(RunOutcome::Pending) << " pending\n";
  return summary;
}

// -----------------------------------------------------------------------------
// run_symbol(): the run boundary. Every failure stops here; the record is
// left FAILED, which the next tick claims like IDLE. A symbol removed while
// this run was in flight has its record dropped here.
// -----------------------------------------------------------------------------
RunResult SignalScheduler::run_symbol(const std::string& symbol,
                                      std::int64_t tick_deadline_ms) {
  const std::int64_t run_start = clock_.now_ms();
  const std::int64_t deadline =
      std::min(tick_deadline_ms, run_start + config_.run_timeout_ms);

  RunResult result;
  result.symbol = symbol;

  for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
    result.attempts = attempt;
    bool retry = false;
    try {
      result.outcome = run_pipeline(symbol, deadline, result.signal);
      result.error.clear();
      break;
    } catch (const RateLimited& e) {
      result.error = std::string("rate limited: ") + e.what();
      retry = true;
    } catch (const InferenceTimeout& e) {
      result.error = std::string("inference timeout: ") + e.what();
      retry = true;
    } catch (const InsufficientHistory& e) {
      result.error = std::string("insufficient history: ") + e.what();
    } catch (const InsufficientWindow& e) {
      result.error = std::string("insufficient window: ") + e.what();
    } catch (const DataUnavailable& e) {
      result.error = std::string("data unavailable: ") + e.what();
    } catch (const FeatureShapeMismatch& e) {
      result.error = std::string("feature shape mismatch: ") + e.what();
      std::cerr << "[SignalScheduler] CRITICAL " << symbol << ": " << result.error
                << "\n";
      raise_alert(symbol, result.error);
    } catch (const RunCancelled& e) {
      result.error = std::string("cancelled: ") + e.what();
    } catch (const std::exception& e) {
      result.error = e.what();
    }

    result.outcome = RunOutcome::Failed;
    if (!retry || attempt == config_.max_attempts) {
      break;
    }
    const auto delay = static_cast<std::int64_t>(
        static_cast<double>(config_.backoff_base_ms) *
        std::pow(config_.backoff_multiplier, attempt - 1));
    if (clock_.now_ms() + delay >= deadline) {
      std::cout << "[SignalScheduler] " << symbol << " backoff of " << delay
                << "ms does not fit before the deadline, giving up\n";
      break;
    }
    std::cout << "[SignalScheduler] " << symbol << " attempt " << attempt
              << " failed (" << result.error << "), retrying in " << delay << "ms\n";
    if (!backoff(delay)) {
      result.error += " (scheduler stopping)";
      break;
    }
  }

  std::lock_guard lock(mutex_);
  Record& record = records_[symbol];
  switch (result.outcome) {
    case RunOutcome::Emitted:
      ++record.emitted;
      record.state = SymbolState::Idle;
      break;
    case RunOutcome::Suppressed:
      ++record.suppressed;
      record.state = SymbolState::Idle;
      break;
    default:
      ++record.failures;
      record.last_error = result.error;
      record.state = SymbolState::Failed;
      std::cerr << "[SignalScheduler] " << symbol << " run FAILED after "
                << result.attempts << " attempt(s): " << result.error << "\n";
      break;
  }
  if (std::find(symbols_.begin(), symbols_.end(), symbol) == symbols_.end()) {
    records_.erase(symbol);
  }
  return result;
}

RunOutcome SignalScheduler::run_pipeline(const std::string& symbol,
                                         std::int64_t deadline_ms,
                                         std::optional<domain::Signal>& emitted) {
  set_state(symbol, SymbolState::Fetching);
  check_deadline(symbol, "fetch", deadline_ms);
  const std::vector<domain::Candle> window =
      cache_.get_window(symbol, config_.timeframe, features_.lookback(), deadline_ms);

  set_state(symbol, SymbolState::Computing);
  check_deadline(symbol, "features", deadline_ms);
  const domain::FeatureVector features = features_.compute(window);
  check_deadline(symbol, "inference", deadline_ms);
  const domain::ModelPrediction prediction = model_.infer(features, deadline_ms);

  std::shared_ptr<const SignalReconciler> reconciler;
  {
    std::lock_guard lock(mutex_);
    reconciler = reconciler_;
  }
  domain::Signal signal = reconciler->reconcile(prediction);

  set_state(symbol, SymbolState::Emitting);
  check_deadline(symbol, "emit", deadline_ms);
  if (!dedup_.check_and_register(signal)) {
    std::cout << "[SignalScheduler] " << symbol << " "
              << domain::to_string(signal.type) << " suppressed (fingerprint "
              << signal.fingerprint << " already emitted)\n";
    return RunOutcome::Suppressed;
  }

  std::cout << "[SignalScheduler] " << symbol << " emitting "
            << domain::to_string(signal.type) << " confidence=" << signal.confidence
            << " agreement=" << signal.agreement_ratio << "\n";
  if (signal_sink_) {
    signal_sink_(signal);
  }
  emitted = std::move(signal);
  return RunOutcome::Emitted;
}

void SignalScheduler::set_state(const std::string& symbol, SymbolState state) {
  std::lock_guard lock(mutex_);
  records_[symbol].state = state;
}

void SignalScheduler::check_deadline(const std::string& symbol, const char* stage,
                                     std::int64_t deadline_ms) const {
  if (clock_.now_ms() >= deadline_ms) {
    throw RunCancelled(symbol + " run exceeded its deadline before " + stage);
  }
}

void SignalScheduler::raise_alert(const std::string& symbol,
                                  const std::string& message) {
  if (!alert_sink_) {
    return;
  }
  CriticalAlertEvent alert;
  alert.component = "SignalScheduler";
  alert.symbol = symbol;
  alert.message = message;
  alert.timestamp_ms = clock_.now_ms();
  alert_sink_(alert);
}

bool SignalScheduler::backoff(std::int64_t delay_ms) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, to_duration(delay_ms), [this] { return stopping_; });
}

// -----------------------------------------------------------------------------
// Driver thread
// -----------------------------------------------------------------------------
void SignalScheduler::start() {
  if (driver_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = false;
  }
  running_.store(true);
  driver_ = std::thread([this] { driver_loop(); });
  std::cout << "[SignalScheduler] started, tick every " << config_.tick_interval_ms
            << "ms on " << pool_->size() << " worker(s)\n";
}

void SignalScheduler::stop() {
  if (!driver_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  driver_.join();
  running_.store(false);
  std::cout << "[SignalScheduler] stopped\n";
}

bool SignalScheduler::running() const { return running_.load(); }

void SignalScheduler::driver_loop() {
  while (true) {
    const std::int64_t tick_start = clock_.now_ms();
    run_tick();

    const std::int64_t next_tick = tick_start + config_.tick_interval_ms;
    const std::int64_t wait_ms = std::max<std::int64_t>(0, next_tick - clock_.now_ms());
    std::unique_lock lock(stop_mutex_);
    if (stop_cv_.wait_for(lock, to_duration(wait_ms), [this] { return stopping_; })) {
      return;
    }
  }
}

}  // namespace sigrisk
