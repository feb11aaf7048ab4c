// =============================================================================
// signal_risk_engine_test.cpp
// =============================================================================
// Integration tests for sigrisk::SignalRiskEngine with every network
// endpoint disabled and deterministic collaborators injected.
//
// Validates:
//   - construction refuses a model whose input does not match the features
//   - scheduler tick → signal → risk loop → open position → price tick →
//     stop-loss close, with persistence and PositionUpdateEvents in order
//   - HALT blocks entries coming from emitted signals
//   - a rejected open is logged and leaves no position
//   - a rejected exit is retried by the risk loop after its backoff
//   - the IPC command set answered by execute_command()
// =============================================================================

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/engine/signal_risk_engine.hpp"
#include "sigrisk/features/feature_engine.hpp"
#include "sigrisk/persistence/i_persistence_sink.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using sigrisk::domain::PositionEventKind;
using sigrisk::testing_support::kEpochMs;

namespace {

class MemorySink final : public sigrisk::IPersistenceSink {
 public:
  void save_signal(const sigrisk::domain::Signal& signal) override {
    std::lock_guard lock(mutex_);
    signals_.push_back(signal);
  }
  void save_position_event(const sigrisk::domain::PositionEvent& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<sigrisk::domain::Signal> signals() const {
    std::lock_guard lock(mutex_);
    return signals_;
  }
  std::vector<sigrisk::domain::PositionEvent> events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<sigrisk::domain::Signal> signals_;
  std::vector<sigrisk::domain::PositionEvent> events_;
};

sigrisk::EngineConfig offline_config() {
  sigrisk::EngineConfig c;
  c.network.price_tick_endpoint.clear();
  c.network.ipc_cmd_endpoint.clear();
  c.network.ipc_pub_endpoint.clear();
  c.network.candle_source_endpoint.clear();
  c.persistence.jsonl_path.clear();
  c.cache.max_candles = 200;
  c.scheduler.symbols = {"BTCUSDT"};
  c.scheduler.tick_interval_ms = 2000;
  c.scheduler.safety_margin_ms = 500;
  c.scheduler.run_timeout_ms = 1500;
  c.scheduler.backoff_base_ms = 10;
  c.risk.dispatch_backoff_ms = 1;
  return c;
}

bool wait_for(const std::function<bool()>& condition) {
  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= give_up) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

}  // namespace

class SignalRiskEngineTest : public ::testing::Test {
 protected:
  SignalRiskEngineTest()
      : clock(kEpochMs + 60 * 1000),
        source(clock),
        model(sigrisk::FeatureEngine::feature_names().size(),
              sigrisk::testing_support::bullish_output()),
        execution(clock) {}

  sigrisk::SignalRiskEngine::Collaborators collaborators() {
    sigrisk::SignalRiskEngine::Collaborators c;
    c.source = &source;
    c.model = &model;
    c.execution = &execution;
    c.persistence = &sink;
    return c;
  }

  sigrisk::SimulationTimeProvider clock;
  sigrisk::testing_support::ScriptedSource source;
  sigrisk::testing_support::StubModel model;
  sigrisk::testing_support::RecordingExecutionClient execution;
  MemorySink sink;
};

// -----------------------------------------------------------------------------
// 1. Construction-time checks.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, RejectsMismatchedModel) {
  sigrisk::testing_support::StubModel narrow(10, sigrisk::testing_support::bullish_output());
  auto c = collaborators();
  c.model = &narrow;
  EXPECT_THROW(sigrisk::SignalRiskEngine(offline_config(), clock, c), sigrisk::ConfigError);

  auto no_model = collaborators();
  no_model.model = nullptr;
  EXPECT_THROW(sigrisk::SignalRiskEngine(offline_config(), clock, no_model),
               sigrisk::ConfigError);
}

// -----------------------------------------------------------------------------
// 2. End to end: the emitted LONG opens a position on the risk loop; a tick
//    through its stop closes it. Persistence and the risk bus see the
//    signal, the open and the close, in that order.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, SignalOpensPositionAndTickClosesIt) {
  sigrisk::SignalRiskEngine engine(offline_config(), clock, collaborators());

  std::mutex updates_mutex;
  std::vector<sigrisk::PositionUpdateEvent> updates;
  engine.risk_event_bus().subscribe<sigrisk::PositionUpdateEvent>(
      [&](const sigrisk::PositionUpdateEvent& e) {
        std::lock_guard lock(updates_mutex);
        updates.push_back(e);
      });

  engine.start(false);
  EXPECT_TRUE(engine.running());

  const auto summary = engine.scheduler().run_tick();
  const auto* run = summary.find("BTCUSDT");
  ASSERT_NE(run, nullptr);
  ASSERT_EQ(run->outcome, sigrisk::RunOutcome::Emitted) << run->error;
  ASSERT_TRUE(run->signal.has_value());
  ASSERT_TRUE(run->signal->stop_loss_price.has_value());

  ASSERT_TRUE(wait_for([&] { return engine.risk_manager().open_count() == 1; }));
  const auto open = engine.risk_manager().snapshots().at(0);
  EXPECT_EQ(open.symbol, "BTCUSDT");
  EXPECT_DOUBLE_EQ(open.entry_price, run->signal->reference_price);
  EXPECT_DOUBLE_EQ(open.stop_loss_price, *run->signal->stop_loss_price);

  sigrisk::PriceTickEvent tick;
  tick.symbol = "BTCUSDT";
  tick.price = open.stop_loss_price * 0.99;
  tick.timestamp_ms = clock.now_ms();
  engine.push_price_tick(tick);

  ASSERT_TRUE(wait_for([&] { return engine.risk_manager().open_count() == 0; }));
  engine.stop();
  EXPECT_FALSE(engine.running());

  const auto closed = engine.risk_manager().position(open.id);
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->status, sigrisk::domain::PositionStatus::Closed);
  EXPECT_LT(closed->realized_pnl, 0.0);

  ASSERT_EQ(sink.signals().size(), 1u);
  EXPECT_EQ(sink.signals()[0].fingerprint, run->signal->fingerprint);
  const auto persisted = sink.events();
  ASSERT_EQ(persisted.size(), 2u);
  EXPECT_EQ(persisted[0].kind, PositionEventKind::Opened);
  EXPECT_EQ(persisted[1].kind, PositionEventKind::Closed);

  std::lock_guard lock(updates_mutex);
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates[0].event.kind, PositionEventKind::Opened);
  EXPECT_EQ(updates[1].event.kind, PositionEventKind::Closed);
  EXPECT_LT(updates[0].sequence_id, updates[1].sequence_id);
}

// -----------------------------------------------------------------------------
// 3. While halted, emitted signals are still persisted but open nothing.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, HaltBlocksEntries) {
  sigrisk::SignalRiskEngine engine(offline_config(), clock, collaborators());
  engine.start(false);
  engine.execute_command("HALT");

  EXPECT_EQ(engine.scheduler().run_tick().count(sigrisk::RunOutcome::Emitted), 1u);
  engine.stop();

  EXPECT_EQ(engine.risk_manager().open_count(), 0u);
  EXPECT_EQ(sink.signals().size(), 1u);
  EXPECT_TRUE(execution.calls().empty());
}

// -----------------------------------------------------------------------------
// 4. A venue rejecting the open costs the position, not the risk loop.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, RejectedOpenLeavesNoPosition) {
  sigrisk::SignalRiskEngine engine(offline_config(), clock, collaborators());
  engine.start(false);
  execution.reject_next(1);

  EXPECT_EQ(engine.scheduler().run_tick().count(sigrisk::RunOutcome::Emitted), 1u);
  ASSERT_TRUE(wait_for([&] { return execution.rejected() == 1; }));

  // The loop is still alive: a tick for an unknown symbol is processed.
  sigrisk::PriceTickEvent tick;
  tick.symbol = "ETHUSDT";
  tick.price = 10.0;
  engine.push_price_tick(tick);
  engine.stop();

  EXPECT_EQ(engine.risk_manager().open_count(), 0u);
  EXPECT_TRUE(sink.events().empty());
}

// -----------------------------------------------------------------------------
// 4b. A rejected stop exit is re-sent by the risk loop's periodic retry once
//     its backoff has elapsed; no second price tick is needed.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, RejectedExitIsRetriedWithoutAnotherTick) {
  sigrisk::SignalRiskEngine engine(offline_config(), clock, collaborators());
  engine.start(false);

  EXPECT_EQ(engine.scheduler().run_tick().count(sigrisk::RunOutcome::Emitted), 1u);
  ASSERT_TRUE(wait_for([&] { return engine.risk_manager().open_count() == 1; }));
  const auto open = engine.risk_manager().snapshots().at(0);

  execution.reject_next(1);
  sigrisk::PriceTickEvent tick;
  tick.symbol = "BTCUSDT";
  tick.price = open.stop_loss_price * 0.99;
  tick.timestamp_ms = clock.now_ms();
  engine.push_price_tick(tick);
  ASSERT_TRUE(wait_for([&] { return execution.rejected() == 1; }));
  EXPECT_EQ(engine.risk_manager().open_count(), 1u);

  clock.advance_by(1);
  ASSERT_TRUE(wait_for([&] { return engine.risk_manager().open_count() == 0; }));
  engine.stop();

  const auto closed = engine.risk_manager().position(open.id);
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->status, sigrisk::domain::PositionStatus::Closed);
  ASSERT_TRUE(closed->exit_price.has_value());
  EXPECT_DOUBLE_EQ(*closed->exit_price, tick.price);
}

// -----------------------------------------------------------------------------
// 5. The IPC command set.
// -----------------------------------------------------------------------------
TEST_F(SignalRiskEngineTest, ExecuteCommand) {
  sigrisk::SignalRiskEngine engine(offline_config(), clock, collaborators());
  auto run = [&engine](const std::string& cmd) {
    return nlohmann::json::parse(engine.execute_command(cmd));
  };

  const auto ping = run("PING");
  EXPECT_EQ(ping.at("status"), "ok");
  EXPECT_EQ(ping.at("response"), "PONG");

  EXPECT_EQ(run("ADD_SYMBOL ETHUSDT").at("status"), "ok");
  const auto again = run("ADD_SYMBOL ETHUSDT");
  EXPECT_EQ(again.at("status"), "error");
  EXPECT_NE(again.at("response").get<std::string>().find("already tracked"),
            std::string::npos);
  EXPECT_EQ(run("REMOVE_SYMBOL XRPUSDT").at("status"), "error");
  EXPECT_EQ(run("ADD_SYMBOL").at("status"), "error");

  EXPECT_EQ(run("HALT").at("status"), "ok");
  EXPECT_TRUE(engine.risk_manager().halted());

  const auto status = run("STATUS");
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_TRUE(status.at("halted").get<bool>());
  ASSERT_EQ(status.at("symbols").size(), 2u);
  EXPECT_EQ(status.at("symbols")[0].at("symbol"), "BTCUSDT");
  EXPECT_EQ(status.at("symbols")[0].at("state"), "IDLE");
  EXPECT_TRUE(status.at("positions").empty());
  EXPECT_TRUE(status.at("cache").contains("hits"));

  EXPECT_EQ(run("RESUME").at("status"), "ok");
  EXPECT_FALSE(engine.risk_manager().halted());
  EXPECT_EQ(run("REMOVE_SYMBOL ETHUSDT").at("status"), "ok");
  EXPECT_EQ(engine.scheduler().symbols().size(), 1u);

  EXPECT_EQ(run("SELL_EVERYTHING").at("status"), "error");
}
