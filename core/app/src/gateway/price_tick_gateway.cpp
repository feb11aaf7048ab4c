#include "sigrisk/gateway/price_tick_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace sigrisk {

PriceTickGateway::PriceTickGateway(EventSink event_sink,
                                   const std::string& endpoint,
                                   SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)), replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

std::optional<PriceTickEvent> PriceTickGateway::decode(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    PriceTickEvent tick;
    tick.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    tick.symbol = json.at("symbol").get<std::string>();
    tick.price = json.at("price").get<double>();
    if (tick.symbol.empty() || !(tick.price > 0.0)) {
      std::cerr << "[PriceTickGateway] rejected tick: " << payload << "\n";
      return std::nullopt;
    }
    return tick;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PriceTickGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop. A timed-out recv returns an empty result and
// the loop re-checks stop_requested_. run() never clears the flag, so a
// stop() that lands before the loop starts still ends it.
// -----------------------------------------------------------------------------
void PriceTickGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }

    auto tick = decode(msg.to_string());
    if (!tick) {
      continue;
    }
    tick->sequence_id = ++ticks_received_;

    if (replay_clock_ != nullptr) {
      replay_clock_->advance_time(tick->timestamp_ms);
    }
    event_sink_(std::move(*tick));
  }
}

void PriceTickGateway::stop() { stop_requested_.store(true); }

}  // namespace sigrisk
