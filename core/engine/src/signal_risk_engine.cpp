#include "sigrisk/engine/signal_risk_engine.hpp"

#include "sigrisk/config/config_loader.hpp"
#include "sigrisk/domain/errors.hpp"
#include "sigrisk/execution/paper_execution_client.hpp"
#include "sigrisk/gateway/zmq_candle_source.hpp"
#include "sigrisk/model/linear_softmax_model.hpp"
#include "sigrisk/persistence/json_lines_sink.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <utility>

namespace sigrisk {

// -----------------------------------------------------------------------------
// Constructor: build every component, start nothing
// -----------------------------------------------------------------------------
SignalRiskEngine::SignalRiskEngine(EngineConfig config,
                                   const ITimeProvider& clock,
                                   Collaborators collaborators)
    : config_(std::move(config)),
      clock_(clock),
      replay_clock_(collaborators.replay_clock) {
  validate_engine_config(config_);

  // ---  1) Collaborators: injected or built from the config -----------------
  IMarketDataSource* source = collaborators.source;
  if (source == nullptr) {
    owned_source_ = std::make_unique<ZmqCandleSource>(
        config_.network.candle_source_endpoint);
    source = owned_source_.get();
  }

  const IPredictionModel* model = collaborators.model;
  if (model == nullptr) {
    if (config_.model.weights_path.empty()) {
      throw ConfigError("model.weights_path is required when no model is supplied");
    }
    owned_model_ = std::make_unique<LinearSoftmaxModel>(
        LinearSoftmaxModel::load(config_.model.weights_path));
    model = owned_model_.get();
  }

  IExecutionClient* execution = collaborators.execution;
  if (execution == nullptr) {
    owned_execution_ = std::make_unique<PaperExecutionClient>(clock_);
    execution = owned_execution_.get();
  }

  IPersistenceSink* sink = collaborators.persistence;
  if (sink == nullptr && !config_.persistence.jsonl_path.empty()) {
    owned_sink_ = std::make_unique<JsonLinesPersistenceSink>(
        config_.persistence.jsonl_path);
    sink = owned_sink_.get();
  }

  // ---  2) Pipeline components ----------------------------------------------
  cache_ = std::make_unique<MarketDataCache>(*source, clock_, config_.cache);
  features_ = std::make_unique<FeatureEngine>(config_.features);
  model_adapter_ =
      std::make_unique<ModelAdapter>(*model, clock_, config_.model);

  if (model_adapter_->input_dimension() != features_->dimension()) {
    throw ConfigError("model input dimension " +
                      std::to_string(model_adapter_->input_dimension()) +
                      " does not match the " +
                      std::to_string(features_->dimension()) +
                      " computed features");
  }

  dedup_ = std::make_unique<SignalDeduplicator>(clock_);
  risk_manager_ =
      std::make_unique<PositionRiskManager>(config_.risk, *execution, clock_);
  if (sink != nullptr) {
    persistence_ = std::make_unique<AsyncPersistenceWriter>(*sink);
  }

  scheduler_ = std::make_unique<SignalScheduler>(
      config_.scheduler, *cache_, *features_, *model_adapter_,
      std::make_shared<const SignalReconciler>(config_.reconciler, clock_),
      *dedup_, clock_);
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SignalRiskEngine::~SignalRiskEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SignalRiskEngine::start(bool drive_scheduler) {
  if (running_) {
    return;
  }

  // ---  1) Sinks that must exist before anything produces records ----------
  if (persistence_) {
    persistence_->start();
  }
  // Exits rejected with attempts left are re-sent from here once their
  // backoff has elapsed, even if no further tick arrives for the symbol.
  risk_loop_.set_periodic(
      [this] {
        try {
          risk_manager_->retry_due();
        } catch (const ExecutionRejected& ex) {
          std::cerr << "[SignalRiskEngine] Exit not executed on retry: " << ex.what()
                    << "\n";
        }
      },
      std::chrono::milliseconds(std::max<std::int64_t>(1, config_.risk.dispatch_backoff_ms)));
  risk_loop_.start();

  // ---  2) Risk loop handlers -----------------------------------------------
  EventBus& bus = risk_loop_.eventBus();
  subscriptions_.push_back(bus.subscribe<SignalEvent>(
      [this](const SignalEvent& e) {
        try {
          risk_manager_->on_signal(e.signal);
        } catch (const ExecutionRejected& ex) {
          std::cerr << "[SignalRiskEngine] Open rejected for " << e.signal.symbol
                    << ": " << ex.what() << "\n";
        }
      }));
  subscriptions_.push_back(bus.subscribe<PriceTickEvent>(
      [this](const PriceTickEvent& e) {
        try {
          risk_manager_->on_price_tick(e.symbol, e.price);
        } catch (const ExecutionRejected& ex) {
          std::cerr << "[SignalRiskEngine] Exit not executed for " << e.symbol
                    << ": " << ex.what() << "\n";
        }
      }));

  // ---  3) Bridges out of the risk manager and the scheduler ----------------
  risk_manager_->set_event_sink(
      [this](const domain::PositionEvent& event) { on_position_event(event); });
  risk_manager_->set_alert_sink(
      [this](const CriticalAlertEvent& alert) { on_alert(alert); });
  scheduler_->set_alert_sink(
      [this](const CriticalAlertEvent& alert) { on_alert(alert); });
  scheduler_->set_signal_sink(
      [this](const domain::Signal& signal) { on_signal_emitted(signal); });

  // ---  4) IpcServer (telemetry + commands) ---------------------------------
  if (!config_.network.ipc_cmd_endpoint.empty() &&
      !config_.network.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return execute_command(cmd); },
        config_.network.ipc_cmd_endpoint, config_.network.ipc_pub_endpoint);
    ipc_server_->start();

    subscriptions_.push_back(bus.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) {
          ipc_server_->push_telemetry(e);
        }));
  }

  // ---  5) Scheduler driver -------------------------------------------------
  if (drive_scheduler) {
    scheduler_->start();
  }

  // ---  6) PriceTickThread LAST (ticks begin flowing) -----------------------
  if (!config_.network.price_tick_endpoint.empty()) {
    price_tick_thread_ = std::make_unique<PriceTickThread>(
        [this](Event event) { risk_loop_.push(std::move(event)); },
        config_.network.price_tick_endpoint, replay_clock_);
    price_tick_thread_->start();
  }

  running_ = true;

  std::cout << "[SignalRiskEngine] started. Symbols: "
            << scheduler_->symbols().size() << ", threads: risk"
            << (drive_scheduler ? ", scheduler" : "")
            << (persistence_ ? ", persistence" : "")
            << (ipc_server_ ? ", ipc" : "")
            << (price_tick_thread_ ? ", price_tick" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SignalRiskEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inflow: price ticks first, then new signals -----------------
  if (price_tick_thread_) {
    price_tick_thread_->stop();
    price_tick_thread_.reset();
  }
  scheduler_->stop();

  // ---  2) IPC (execute_command() queries the components) -------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  3) Risk loop drains what was queued, then the handlers go -----------
  risk_loop_.stop();
  for (const auto id : subscriptions_) {
    risk_loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();
  ipc_server_.reset();

  // ---  4) Persistence last: it writes everything accepted so far -----------
  if (persistence_) {
    persistence_->stop();
  }

  running_ = false;

  std::cout << "[SignalRiskEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// push_price_tick(tick)
// -----------------------------------------------------------------------------
void SignalRiskEngine::push_price_tick(PriceTickEvent tick) {
  if (tick.sequence_id == 0) {
    tick.sequence_id = next_sequence_.fetch_add(1);
  }
  risk_loop_.push(std::move(tick));
}

// -----------------------------------------------------------------------------
// Bridges
// -----------------------------------------------------------------------------
void SignalRiskEngine::on_signal_emitted(const domain::Signal& signal) {
  if (persistence_) {
    persistence_->save_signal(signal);
  }

  SignalEvent event{signal, next_sequence_.fetch_add(1)};
  if (ipc_server_) {
    ipc_server_->push_telemetry(event);
  }
  risk_loop_.push(std::move(event));
}

void SignalRiskEngine::on_position_event(const domain::PositionEvent& event) {
  if (persistence_) {
    persistence_->save_position_event(event);
  }
  risk_loop_.eventBus().publish(
      PositionUpdateEvent{event, next_sequence_.fetch_add(1)});
}

void SignalRiskEngine::on_alert(const CriticalAlertEvent& alert) {
  if (ipc_server_) {
    ipc_server_->push_telemetry(alert);
  }
}

// -----------------------------------------------------------------------------
// execute_command(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string SignalRiskEngine::execute_command(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string argument;
  in >> verb >> argument;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    response["status"] = "ok";
    response["halted"] = risk_manager_->halted();

    nlohmann::json symbols_json = nlohmann::json::array();
    for (const auto& s : scheduler_->status()) {
      nlohmann::json j;
      j["symbol"] = s.symbol;
      j["state"] = to_string(s.state);
      j["runs"] = s.runs;
      j["emitted"] = s.emitted;
      j["suppressed"] = s.suppressed;
      j["failures"] = s.failures;
      j["skipped"] = s.skipped;
      j["last_error"] = s.last_error;
      j["last_run_ms"] = s.last_run_ms;
      symbols_json.push_back(std::move(j));
    }
    response["symbols"] = std::move(symbols_json);

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : risk_manager_->snapshots()) {
      nlohmann::json p;
      p["id"] = pos.id;
      p["symbol"] = pos.symbol;
      p["side"] = domain::to_string(pos.side);
      p["entry_price"] = pos.entry_price;
      p["stop_loss_price"] = pos.stop_loss_price;
      p["closed_fraction"] = pos.closed_fraction;
      p["realized_pnl"] = pos.realized_pnl;
      positions_json.push_back(std::move(p));
    }
    response["positions"] = std::move(positions_json);

    const auto stats = cache_->stats();
    response["cache"] = {{"entries", cache_->entry_count()},
                         {"hits", stats.hits},
                         {"misses", stats.misses},
                         {"fetches", stats.fetches},
                         {"fetch_failures", stats.fetch_failures},
                         {"stale_serves", stats.stale_serves}};
  } else if (verb == "ADD_SYMBOL" || verb == "REMOVE_SYMBOL") {
    if (argument.empty()) {
      response["status"] = "error";
      response["response"] = verb + " requires a symbol";
    } else {
      const bool changed = verb == "ADD_SYMBOL"
                               ? scheduler_->add_symbol(argument)
                               : scheduler_->remove_symbol(argument);
      response["status"] = changed ? "ok" : "error";
      response["response"] =
          changed ? verb + " " + argument
                  : argument + (verb == "ADD_SYMBOL" ? " already tracked"
                                                     : " not tracked");
    }
  } else if (verb == "HALT") {
    risk_manager_->halt();
    response["status"] = "ok";
    response["response"] = "New entries halted";
  } else if (verb == "RESUME") {
    risk_manager_->resume();
    response["status"] = "ok";
    response["response"] = "New entries resumed";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace sigrisk
