// -----------------------------------------------------------------------------
// sigrisk: single executable entry point.
//
//   sigrisk [config.json] [--replay]
//
//   1) Load the EngineConfig from JSON (defaults when no file is given).
//   2) Pick the clock: LiveTimeProvider, or with --replay a
//      SimulationTimeProvider that the price-tick gateway advances to each
//      tick's timestamp.
//   3) Build the SignalRiskEngine from the config and start it. The
//      scheduler ticks on its own thread; the risk loop reacts to signals
//      and price ticks.
//   4) Block the main thread until SIGINT/SIGTERM.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread        → waits for a shutdown signal
//   scheduler threads  → driver + worker pool (fetch → features → model →
//                        reconcile → dedup)
//   risk thread        → PositionRiskManager
//   price_tick thread  → PriceTickGateway (ZMQ SUB)
//   ipc thread         → IpcServer (commands + telemetry)
//   persistence thread → AsyncPersistenceWriter
// -----------------------------------------------------------------------------

#include "sigrisk/config/config_loader.hpp"
#include "sigrisk/domain/errors.hpp"
#include "sigrisk/engine/signal_risk_engine.hpp"
#include "sigrisk/events/event_types.hpp"
#include "sigrisk/time/live_time_provider.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag, set by the signal handler and polled by main(). The only
// global in the program.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  std::string config_path;
  bool replay = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--replay") {
      replay = true;
    } else {
      config_path = arg;
    }
  }

  try {
    // -----------------------------------------------------------------------
    // 1) Configuration
    // -----------------------------------------------------------------------
    const sigrisk::EngineConfig config =
        config_path.empty() ? sigrisk::EngineConfig{}
                            : sigrisk::load_engine_config(config_path);

    // -----------------------------------------------------------------------
    // 2) Clock
    // -----------------------------------------------------------------------
    sigrisk::LiveTimeProvider live_clock;
    sigrisk::SimulationTimeProvider replay_clock;
    const sigrisk::ITimeProvider& clock =
        replay ? static_cast<const sigrisk::ITimeProvider&>(replay_clock)
               : live_clock;

    sigrisk::SignalRiskEngine::Collaborators collaborators;
    if (replay) {
      collaborators.replay_clock = &replay_clock;
    }

    // -----------------------------------------------------------------------
    // 3) Engine
    // -----------------------------------------------------------------------
    sigrisk::SignalRiskEngine engine(config, clock, collaborators);

    // Runs on the risk thread, after the manager has committed each event.
    engine.risk_event_bus().subscribe<sigrisk::PositionUpdateEvent>(
        [](const sigrisk::PositionUpdateEvent& e) {
          const auto& pos = e.event.position;
          std::cout << "[PositionUpdate] " << sigrisk::domain::to_string(e.event.kind)
                    << " id=" << pos.id << " symbol=" << pos.symbol
                    << " price=" << e.event.price
                    << " closed_fraction=" << pos.closed_fraction
                    << " stop=" << pos.stop_loss_price
                    << " realized_pnl=" << pos.realized_pnl
                    << " reason=" << e.event.reason << "\n";
        });

    engine.start();

    // -----------------------------------------------------------------------
    // 4) Wait for Ctrl-C
    // -----------------------------------------------------------------------
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    std::cout << "[main] sigrisk running"
              << (replay ? " in replay mode" : "") << ". Press Ctrl-C to shut down.\n";

    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // -----------------------------------------------------------------------
    // 5) Clean shutdown
    // -----------------------------------------------------------------------
    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const sigrisk::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const sigrisk::SigriskError& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
