#pragma once

#include "sigrisk/events/event.hpp"
#include "sigrisk/gateway/price_tick_gateway.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sigrisk {

// -----------------------------------------------------------------------------
// PriceTickThread: dedicated I/O thread for the price-tick feed
// -----------------------------------------------------------------------------
//
// @brief  Owns a PriceTickGateway and the std::thread that runs its recv
//         loop, so network I/O never runs on the risk thread.
//
// @details
// The gateway is created in start(), on the owning thread, and destroyed
// in stop() after the thread is joined; a stopped PriceTickThread holds no
// sockets. The event sink normally pushes into the engine's risk loop.
//
// Thread model:
//   start()/stop() from the owning thread. The internal thread runs
//   PriceTickGateway::run() exclusively.
//
// Ownership:
//   Owned by SignalRiskEngine via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class PriceTickThread {
 public:
  using EventSink = std::function<void(Event)>;

  PriceTickThread(EventSink event_sink, std::string endpoint,
                  SimulationTimeProvider* replay_clock = nullptr);
  ~PriceTickThread();

  PriceTickThread(const PriceTickThread&) = delete;
  PriceTickThread& operator=(const PriceTickThread&) = delete;
  PriceTickThread(PriceTickThread&&) = delete;
  PriceTickThread& operator=(PriceTickThread&&) = delete;

  void start();
  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;
  SimulationTimeProvider* replay_clock_;

  std::unique_ptr<PriceTickGateway> gateway_;
  std::thread thread_;
};

}  // namespace sigrisk
