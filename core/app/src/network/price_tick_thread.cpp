#include "sigrisk/network/price_tick_thread.hpp"

#include <iostream>
#include <utility>

namespace sigrisk {

PriceTickThread::PriceTickThread(EventSink event_sink, std::string endpoint,
                                 SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      replay_clock_(replay_clock) {}

PriceTickThread::~PriceTickThread() { stop(); }

void PriceTickThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<PriceTickGateway>(event_sink_, endpoint_, replay_clock_);

  thread_ = std::thread([this] {
    std::cout << "[PriceTickThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[PriceTickThread] recv loop exited after "
              << gateway_->ticks_received() << " ticks.\n";
  });
}

void PriceTickThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace sigrisk
