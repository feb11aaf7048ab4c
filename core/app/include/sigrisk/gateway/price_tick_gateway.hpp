#pragma once

#include "sigrisk/events/event.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// PriceTickGateway: ZeroMQ SUB socket feeding price ticks to the risk loop
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks {"timestamp_ms", "symbol", "price"} from a
//         publisher and hands each one to the event sink as a
//         PriceTickEvent.
//
// @details
// The socket subscribes to every topic and uses ZMQ_RCVTIMEO so run()
// notices stop() within kRecvTimeoutMs even when the feed is silent.
//
// Replay mode: when constructed with a SimulationTimeProvider, the clock is
// advanced to each tick's timestamp before the tick is pushed, so every
// component that reads time while handling the tick sees the tick's time.
// Live mode passes nullptr and leaves time to the LiveTimeProvider.
//
// Malformed payloads (bad JSON, missing keys, non-positive price) are
// logged and skipped.
//
// Thread model:
//   run() blocks the calling thread. stop() may be called from any thread,
//   before or during run(); a stopped gateway is not restarted.
// -----------------------------------------------------------------------------
class PriceTickGateway {
 public:
  using EventSink = std::function<void(Event)>;

  static constexpr int kRecvTimeoutMs = 100;

  PriceTickGateway(EventSink event_sink, const std::string& endpoint,
                   SimulationTimeProvider* replay_clock = nullptr);

  PriceTickGateway(const PriceTickGateway&) = delete;
  PriceTickGateway& operator=(const PriceTickGateway&) = delete;
  PriceTickGateway(PriceTickGateway&&) = delete;
  PriceTickGateway& operator=(PriceTickGateway&&) = delete;

  void run();
  void stop();

  // Decodes one payload; nullopt (logged) when it is not a valid tick.
  static std::optional<PriceTickEvent> decode(const std::string& payload);

  std::uint64_t ticks_received() const { return ticks_received_.load(); }

 private:
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  EventSink event_sink_;
  SimulationTimeProvider* replay_clock_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> ticks_received_{0};
};

}  // namespace sigrisk
