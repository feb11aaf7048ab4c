// =============================================================================
// signal_scheduler_test.cpp
// =============================================================================
// Unit tests for sigrisk::SignalScheduler driven tick by tick through
// run_tick() against a scripted source, a stub model and a simulated clock.
//
// Validates:
//   - one run per symbol per tick; a repeat inside the fingerprint bucket is
//     suppressed, the next bucket emits again
//   - RateLimited is retried with backoff and fails the run once attempts
//     run out; DataUnavailable fails the run for this tick only
//   - a failed symbol shows FAILED until the next tick claims it again
//   - FeatureShapeMismatch is logged CRITICAL and raises an alert
//   - a symbol whose previous run is still in flight is skipped
//   - a run that crosses its deadline is cancelled, including one stuck
//     inside the model
//   - symbol add/remove between ticks and the per-symbol status records,
//     which are dropped with the symbol
//   - replace_reconciler() takes effect on the next run
// =============================================================================

#include "sigrisk/data/market_data_cache.hpp"
#include "sigrisk/domain/errors.hpp"
#include "sigrisk/features/feature_engine.hpp"
#include "sigrisk/model/model_adapter.hpp"
#include "sigrisk/scheduler/signal_scheduler.hpp"
#include "sigrisk/signal/signal_deduplicator.hpp"
#include "sigrisk/signal/signal_reconciler.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using sigrisk::RunOutcome;
using sigrisk::domain::SignalType;
using sigrisk::testing_support::kEpochMs;

namespace {

sigrisk::CacheConfig cache_config() {
  sigrisk::CacheConfig c;
  c.max_candles = 200;
  return c;
}

// Short real-time tick so that a stalled run costs the test about a second.
sigrisk::SchedulerConfig scheduler_config(std::vector<std::string> symbols) {
  sigrisk::SchedulerConfig c;
  c.symbols = std::move(symbols);
  c.tick_interval_ms = 2000;
  c.safety_margin_ms = 500;
  c.run_timeout_ms = 1500;
  c.worker_pool_size = 2;
  c.max_attempts = 3;
  c.backoff_base_ms = 10;
  return c;
}

}  // namespace

class SignalSchedulerTest : public ::testing::Test {
 protected:
  SignalSchedulerTest()
      : clock(kEpochMs + 60 * 1000),
        source(clock),
        cache(source, clock, cache_config()),
        features(sigrisk::FeatureConfig{96}),
        model(features.dimension(), sigrisk::testing_support::bullish_output()),
        adapter(model, clock, sigrisk::ModelConfig{}),
        dedup(clock) {}

  std::unique_ptr<sigrisk::SignalScheduler> make_scheduler(
      std::vector<std::string> symbols = {"BTCUSDT"}) {
    auto scheduler = std::make_unique<sigrisk::SignalScheduler>(
        scheduler_config(std::move(symbols)), cache, features, adapter,
        std::make_shared<const sigrisk::SignalReconciler>(sigrisk::ReconcilerConfig{},
                                                          clock),
        dedup, clock);
    scheduler->set_signal_sink([this](const sigrisk::domain::Signal& s) {
      std::lock_guard lock(mutex);
      emitted.push_back(s);
    });
    scheduler->set_alert_sink([this](const sigrisk::CriticalAlertEvent& a) {
      std::lock_guard lock(mutex);
      alerts.push_back(a);
    });
    return scheduler;
  }

  std::size_t emitted_count() {
    std::lock_guard lock(mutex);
    return emitted.size();
  }

  sigrisk::SimulationTimeProvider clock;
  sigrisk::testing_support::ScriptedSource source;
  sigrisk::MarketDataCache cache;
  sigrisk::FeatureEngine features;
  sigrisk::testing_support::StubModel model;
  sigrisk::ModelAdapter adapter;
  sigrisk::SignalDeduplicator dedup;

  std::mutex mutex;
  std::vector<sigrisk::domain::Signal> emitted;
  std::vector<sigrisk::CriticalAlertEvent> alerts;
};

// -----------------------------------------------------------------------------
// 1. First tick emits LONG; the next tick in the same 5-minute bucket is
//    suppressed; a tick in the next bucket emits again.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, EmitsThenSuppressesWithinBucket) {
  auto scheduler = make_scheduler();

  const auto first = scheduler->run_tick();
  ASSERT_EQ(first.runs.size(), 1u);
  const auto* run = first.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Emitted) << run->error;
  EXPECT_EQ(run->attempts, 1);
  ASSERT_TRUE(run->signal.has_value());
  EXPECT_EQ(run->signal->type, SignalType::Long);
  EXPECT_EQ(emitted_count(), 1u);

  clock.advance_by(60 * 1000);
  const auto second = scheduler->run_tick();
  EXPECT_EQ(second.count(RunOutcome::Suppressed), 1u);
  EXPECT_EQ(emitted_count(), 1u);

  clock.advance_by(5 * 60 * 1000);
  const auto third = scheduler->run_tick();
  EXPECT_EQ(third.count(RunOutcome::Emitted), 1u);
  EXPECT_EQ(emitted_count(), 2u);
}

// -----------------------------------------------------------------------------
// 2. An upstream 429 is retried and the run still emits.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, RateLimitedIsRetried) {
  auto scheduler = make_scheduler();
  source.fail_next(std::make_exception_ptr(sigrisk::RateLimited("HTTP 429")));

  const auto summary = scheduler->run_tick();
  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Emitted) << run->error;
  EXPECT_EQ(run->attempts, 2);
  EXPECT_EQ(source.calls(), 2);
}

// -----------------------------------------------------------------------------
// 2b. A 429 on every attempt exhausts max_attempts: the run fails, nothing is
//     emitted, status() shows FAILED, and the next tick claims the symbol
//     again and emits.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, RateLimitedOnEveryAttemptFails) {
  auto scheduler = make_scheduler();
  for (int i = 0; i < scheduler_config({}).max_attempts; ++i) {
    source.fail_next(std::make_exception_ptr(sigrisk::RateLimited("HTTP 429")));
  }

  const auto summary = scheduler->run_tick();
  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Failed);
  EXPECT_EQ(run->attempts, 3);
  EXPECT_NE(run->error.find("rate limited"), std::string::npos);
  EXPECT_EQ(source.calls(), 3);
  EXPECT_EQ(emitted_count(), 0u);
  EXPECT_EQ(scheduler->status()[0].state, sigrisk::SymbolState::Failed);
  EXPECT_STREQ(sigrisk::to_string(scheduler->status()[0].state), "FAILED");

  const auto next = scheduler->run_tick();
  EXPECT_EQ(next.count(RunOutcome::Skipped), 0u);
  EXPECT_EQ(next.count(RunOutcome::Emitted), 1u);
  EXPECT_EQ(emitted_count(), 1u);
  EXPECT_EQ(scheduler->status()[0].state, sigrisk::SymbolState::Idle);
}

// -----------------------------------------------------------------------------
// 3. DataUnavailable fails the run without retrying; the symbol is tried
//    again on the next tick.
// Why: A failed symbol is never blacklisted.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, DataUnavailableFailsOnlyThisTick) {
  auto scheduler = make_scheduler();
  source.fail_next(std::make_exception_ptr(sigrisk::DataUnavailable("exchange down")));

  const auto failed = scheduler->run_tick();
  const auto* run = failed.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Failed);
  EXPECT_EQ(run->attempts, 1);
  EXPECT_NE(run->error.find("data unavailable"), std::string::npos);

  const auto status = scheduler->status();
  ASSERT_EQ(status.size(), 1u);
  EXPECT_EQ(status[0].state, sigrisk::SymbolState::Failed);
  EXPECT_EQ(status[0].failures, 1u);
  EXPECT_FALSE(status[0].last_error.empty());

  const auto recovered = scheduler->run_tick();
  EXPECT_EQ(recovered.count(RunOutcome::Emitted), 1u);
}

// -----------------------------------------------------------------------------
// 4. A model whose input dimension disagrees with the feature engine fails
//    every run without retry and raises one alert per symbol.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, FeatureShapeMismatchRaisesAlert) {
  sigrisk::testing_support::StubModel wrong(features.dimension() + 1,
                                            sigrisk::testing_support::bullish_output());
  sigrisk::ModelAdapter wrong_adapter(wrong, clock, sigrisk::ModelConfig{});
  sigrisk::SignalScheduler scheduler(
      scheduler_config({"BTCUSDT", "ETHUSDT"}), cache, features, wrong_adapter,
      std::make_shared<const sigrisk::SignalReconciler>(sigrisk::ReconcilerConfig{}, clock),
      dedup, clock);
  scheduler.set_alert_sink([this](const sigrisk::CriticalAlertEvent& a) {
    std::lock_guard lock(mutex);
    alerts.push_back(a);
  });

  const auto summary = scheduler.run_tick();
  EXPECT_EQ(summary.count(RunOutcome::Failed), 2u);
  for (const auto& run : summary.runs) {
    EXPECT_EQ(run.attempts, 1) << run.symbol;
    EXPECT_NE(run.error.find("feature shape mismatch"), std::string::npos);
  }
  EXPECT_EQ(wrong.calls(), 0);

  std::lock_guard lock(mutex);
  ASSERT_EQ(alerts.size(), 2u);
  EXPECT_EQ(alerts[0].component, "SignalScheduler");
  EXPECT_FALSE(alerts[0].symbol.empty());
}

// -----------------------------------------------------------------------------
// 5. While a run is stalled inside the fetch, run_tick() reports it Pending
//    and the next tick skips the symbol. Once released, the symbol returns to
//    IDLE and is dispatched again.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, SkipsSymbolWithRunInFlight) {
  auto scheduler = make_scheduler();

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> entered;
  std::once_flag entered_once;
  source.set_before_fetch([&] {
    std::call_once(entered_once, [&] { entered.set_value(); });
    gate.wait();
  });

  const auto first = scheduler->run_tick();
  ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  EXPECT_EQ(first.count(RunOutcome::Pending), 1u);

  const auto second = scheduler->run_tick();
  EXPECT_EQ(second.count(RunOutcome::Skipped), 1u);
  EXPECT_EQ(scheduler->status()[0].skipped, 1u);

  source.set_before_fetch(nullptr);
  release.set_value();

  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (scheduler->status()[0].state != sigrisk::SymbolState::Idle &&
         std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(scheduler->status()[0].state, sigrisk::SymbolState::Idle);
  EXPECT_EQ(emitted_count(), 1u);

  const auto third = scheduler->run_tick();
  EXPECT_EQ(third.count(RunOutcome::Skipped), 0u);
  EXPECT_EQ(third.count(RunOutcome::Suppressed), 1u);
}

// -----------------------------------------------------------------------------
// 6. A fetch that pushes the clock past the run deadline cancels the run
//    before feature computation; nothing is emitted.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, RunPastDeadlineIsCancelled) {
  auto scheduler = make_scheduler();
  source.set_before_fetch([this] { clock.advance_by(10 * 1000); });

  const auto summary = scheduler->run_tick();
  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Failed);
  EXPECT_NE(run->error.find("cancelled"), std::string::npos);
  EXPECT_EQ(model.calls(), 0);
  EXPECT_EQ(emitted_count(), 0u);
}

// -----------------------------------------------------------------------------
// 6b. A model that hangs past the run deadline is abandoned: the run is
//     reported Failed as cancelled in the same tick, not Pending, and the
//     symbol is claimable on the next tick.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, HungInferenceFailsWithinTick) {
  auto config = scheduler_config({"BTCUSDT"});
  config.run_timeout_ms = 300;
  sigrisk::SignalScheduler scheduler(
      config, cache, features, adapter,
      std::make_shared<const sigrisk::SignalReconciler>(sigrisk::ReconcilerConfig{}, clock),
      dedup, clock);
  model.set_on_predict([] { std::this_thread::sleep_for(std::chrono::milliseconds(1500)); });

  const auto started = std::chrono::steady_clock::now();
  const auto summary = scheduler.run_tick();
  const auto waited = std::chrono::steady_clock::now() - started;

  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->outcome, RunOutcome::Failed);
  EXPECT_NE(run->error.find("cancelled"), std::string::npos) << run->error;
  EXPECT_EQ(summary.count(RunOutcome::Pending), 0u);
  EXPECT_LT(waited, std::chrono::milliseconds(1500));
  EXPECT_EQ(scheduler.status()[0].state, sigrisk::SymbolState::Failed);

  model.set_on_predict(nullptr);
  EXPECT_EQ(scheduler.run_tick().count(RunOutcome::Emitted), 1u);
}

// -----------------------------------------------------------------------------
// 7. Symbols added or removed between ticks are picked up by the next tick.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, AddAndRemoveSymbols) {
  auto scheduler = make_scheduler({"BTCUSDT"});

  EXPECT_TRUE(scheduler->add_symbol("ETHUSDT"));
  EXPECT_FALSE(scheduler->add_symbol("ETHUSDT"));
  EXPECT_FALSE(scheduler->remove_symbol("XRPUSDT"));
  EXPECT_EQ(scheduler->symbols(), (std::vector<std::string>{"BTCUSDT", "ETHUSDT"}));

  const auto both = scheduler->run_tick();
  EXPECT_EQ(both.count(RunOutcome::Emitted), 2u);
  ASSERT_NE(both.find("ETHUSDT"), nullptr);

  const auto status = scheduler->status();
  ASSERT_EQ(status.size(), 2u);
  for (const auto& s : status) {
    EXPECT_EQ(s.runs, 1u) << s.symbol;
    EXPECT_EQ(s.emitted, 1u) << s.symbol;
    EXPECT_EQ(s.last_run_ms, both.tick_start_ms);
  }

  EXPECT_TRUE(scheduler->remove_symbol("ETHUSDT"));
  const auto one = scheduler->run_tick();
  ASSERT_EQ(one.runs.size(), 1u);
  EXPECT_EQ(one.runs[0].symbol, "BTCUSDT");

  // The removed symbol's record went with it; re-adding starts afresh.
  EXPECT_TRUE(scheduler->add_symbol("ETHUSDT"));
  const auto fresh = scheduler->status();
  ASSERT_EQ(fresh.size(), 2u);
  EXPECT_EQ(fresh[1].symbol, "ETHUSDT");
  EXPECT_EQ(fresh[1].runs, 0u);
  EXPECT_EQ(fresh[1].emitted, 0u);
  EXPECT_EQ(fresh[1].state, sigrisk::SymbolState::Idle);
}

// -----------------------------------------------------------------------------
// 7b. Removing a symbol whose run is in flight keeps its record until the run
//     finishes, so re-adding it before then cannot start a second run.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, RemoveDuringRunKeepsRecordUntilDone) {
  auto scheduler = make_scheduler();

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> entered;
  std::once_flag entered_once;
  source.set_before_fetch([&] {
    std::call_once(entered_once, [&] { entered.set_value(); });
    gate.wait();
  });

  EXPECT_EQ(scheduler->run_tick().count(RunOutcome::Pending), 1u);
  ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(5)),
            std::future_status::ready);

  EXPECT_TRUE(scheduler->remove_symbol("BTCUSDT"));
  EXPECT_TRUE(scheduler->status().empty());
  EXPECT_TRUE(scheduler->add_symbol("BTCUSDT"));
  EXPECT_EQ(scheduler->run_tick().count(RunOutcome::Skipped), 1u);
  EXPECT_EQ(scheduler->status()[0].runs, 1u);

  source.set_before_fetch(nullptr);
  release.set_value();

  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (scheduler->status()[0].state != sigrisk::SymbolState::Idle &&
         std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(scheduler->status()[0].state, sigrisk::SymbolState::Idle);
  EXPECT_EQ(emitted_count(), 1u);
}

// -----------------------------------------------------------------------------
// 8. A stricter reconciler swapped in between ticks demotes the same
//    prediction to NEUTRAL, which is still emitted.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, ReplacedReconcilerAppliesToNextRun) {
  auto scheduler = make_scheduler();
  ASSERT_EQ(scheduler->run_tick().count(RunOutcome::Emitted), 1u);

  sigrisk::ReconcilerConfig strict;
  strict.min_confidence = 0.95;
  scheduler->replace_reconciler(
      std::make_shared<const sigrisk::SignalReconciler>(strict, clock));
  EXPECT_THROW(scheduler->replace_reconciler(nullptr), sigrisk::ConfigError);

  const auto summary = scheduler->run_tick();
  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  ASSERT_EQ(run->outcome, RunOutcome::Emitted) << run->error;
  EXPECT_EQ(run->signal->type, SignalType::Neutral);
}

// -----------------------------------------------------------------------------
// 9. Invalid timing configuration is refused.
// -----------------------------------------------------------------------------
TEST_F(SignalSchedulerTest, InvalidConfigThrows) {
  auto config = scheduler_config({"BTCUSDT"});
  config.safety_margin_ms = config.tick_interval_ms;
  auto reconciler =
      std::make_shared<const sigrisk::SignalReconciler>(sigrisk::ReconcilerConfig{}, clock);

  EXPECT_THROW((sigrisk::SignalScheduler{config, cache, features, adapter, reconciler,
                                         dedup, clock}),
               sigrisk::ConfigError);
  EXPECT_THROW((sigrisk::SignalScheduler{scheduler_config({}), cache, features, adapter,
                                         nullptr, dedup, clock}),
               sigrisk::ConfigError);
}
