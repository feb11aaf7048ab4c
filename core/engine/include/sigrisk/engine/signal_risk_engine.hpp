#pragma once

#include "sigrisk/concurrent/event_loop_thread.hpp"
#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/data/i_market_data_source.hpp"
#include "sigrisk/data/market_data_cache.hpp"
#include "sigrisk/eventbus/event_bus.hpp"
#include "sigrisk/events/event.hpp"
#include "sigrisk/execution/i_execution_client.hpp"
#include "sigrisk/features/feature_engine.hpp"
#include "sigrisk/model/i_prediction_model.hpp"
#include "sigrisk/model/model_adapter.hpp"
#include "sigrisk/network/ipc_server.hpp"
#include "sigrisk/network/price_tick_thread.hpp"
#include "sigrisk/persistence/async_persistence_writer.hpp"
#include "sigrisk/persistence/i_persistence_sink.hpp"
#include "sigrisk/risk/position_risk_manager.hpp"
#include "sigrisk/scheduler/signal_scheduler.hpp"
#include "sigrisk/signal/signal_deduplicator.hpp"
#include "sigrisk/signal/signal_reconciler.hpp"
#include "sigrisk/time/i_time_provider.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// SignalRiskEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every pipeline component, the threads that drive them and
//         the bridges between those threads.
//
// @details
// Thread layout:
//
//   scheduler driver + pool  → SignalScheduler ticks, one run per symbol
//   risk_loop thread         → PositionRiskManager (signals and price ticks)
//   price_tick thread        → PriceTickGateway ZMQ recv loop
//   ipc thread               → IpcServer commands and telemetry
//   persistence thread       → AsyncPersistenceWriter
//   main thread              → start(), wait for shutdown, stop()
//
// Bridges (wired in start()):
//   1. scheduler worker → risk_loop:   SignalEvent (and persistence, IPC)
//   2. price_tick       → risk_loop:   PriceTickEvent
//   3. risk manager     → risk_loop bus: PositionUpdateEvent (and
//                                      persistence); IPC subscribes to it
//   4. critical alerts  → IPC telemetry
//
// Collaborators left null in Collaborators are built from the config:
// ZmqCandleSource on network.candle_source_endpoint, LinearSoftmaxModel
// from model.weights_path, PaperExecutionClient, and a
// JsonLinesPersistenceSink on persistence.jsonl_path (no persistence when
// the path is empty). Empty network endpoints disable the price-tick
// thread and the IPC server, which is how the integration tests run.
//
// Lifecycle: one start()/stop() cycle per instance. The components exist
// from construction to destruction, so tests may drive them directly.
//
// Ownership:
//   SignalRiskEngine
//    ├── owned_source_ / owned_model_ / owned_execution_ / owned_sink_
//    │                         (defaults, when not injected)
//    ├── cache_, features_, model_adapter_, dedup_, scheduler_
//    ├── risk_manager_
//    ├── persistence_          (AsyncPersistenceWriter, when a sink exists)
//    ├── risk_loop_            (EventLoopThread, value member)
//    ├── price_tick_thread_    (unique_ptr, when enabled)
//    └── ipc_server_           (unique_ptr, when enabled)
// -----------------------------------------------------------------------------
class SignalRiskEngine {
 public:
  struct Collaborators {
    IMarketDataSource* source{nullptr};
    const IPredictionModel* model{nullptr};
    IExecutionClient* execution{nullptr};
    IPersistenceSink* persistence{nullptr};
    // Advanced to each price tick's timestamp when replaying a feed.
    SimulationTimeProvider* replay_clock{nullptr};
  };

  // Validates the config (ConfigError) and builds every component.
  SignalRiskEngine(EngineConfig config, const ITimeProvider& clock,
                   Collaborators collaborators = {});
  ~SignalRiskEngine();

  SignalRiskEngine(const SignalRiskEngine&) = delete;
  SignalRiskEngine& operator=(const SignalRiskEngine&) = delete;
  SignalRiskEngine(SignalRiskEngine&&) = delete;
  SignalRiskEngine& operator=(SignalRiskEngine&&) = delete;

  // drive_scheduler=false leaves ticking to the caller (run_tick()).
  void start(bool drive_scheduler = true);
  void stop();
  bool running() const { return running_; }

  void push_price_tick(PriceTickEvent tick);

  // PING, STATUS, ADD_SYMBOL <s>, REMOVE_SYMBOL <s>, HALT, RESUME.
  std::string execute_command(const std::string& cmd);

  SignalScheduler& scheduler() { return *scheduler_; }
  PositionRiskManager& risk_manager() { return *risk_manager_; }
  MarketDataCache& cache() { return *cache_; }
  EventBus& risk_event_bus() { return risk_loop_.eventBus(); }

 private:
  void on_signal_emitted(const domain::Signal& signal);
  void on_position_event(const domain::PositionEvent& event);
  void on_alert(const CriticalAlertEvent& alert);

  const EngineConfig config_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* replay_clock_;

  std::unique_ptr<IMarketDataSource> owned_source_;
  std::unique_ptr<IPredictionModel> owned_model_;
  std::unique_ptr<IExecutionClient> owned_execution_;
  std::unique_ptr<IPersistenceSink> owned_sink_;

  std::unique_ptr<MarketDataCache> cache_;
  std::unique_ptr<FeatureEngine> features_;
  std::unique_ptr<ModelAdapter> model_adapter_;
  std::unique_ptr<SignalDeduplicator> dedup_;
  std::unique_ptr<PositionRiskManager> risk_manager_;
  std::unique_ptr<AsyncPersistenceWriter> persistence_;

  EventLoopThread risk_loop_{"RiskLoop"};
  std::vector<EventBus::SubscriptionId> subscriptions_;

  std::unique_ptr<SignalScheduler> scheduler_;
  std::unique_ptr<PriceTickThread> price_tick_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::atomic<std::uint64_t> next_sequence_{1};
  bool running_{false};
};

}  // namespace sigrisk
