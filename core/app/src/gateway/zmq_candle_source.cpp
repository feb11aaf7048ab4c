#include "sigrisk/gateway/zmq_candle_source.hpp"

#include "sigrisk/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace sigrisk {

ZmqCandleSource::ZmqCandleSource(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
  std::lock_guard lock(mutex_);
  reconnect_locked();
}

void ZmqCandleSource::reconnect_locked() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

std::vector<domain::Candle> ZmqCandleSource::decode_reply(
    const std::string& payload, const std::string& symbol,
    domain::Timeframe timeframe) {
  try {
    auto json = nlohmann::json::parse(payload);
    const std::string status = json.at("status").get<std::string>();
    if (status == "rate_limited") {
      throw RateLimited("Candle feeder rate limited " + symbol);
    }
    if (status != "ok") {
      throw DataUnavailable("Candle feeder error for " + symbol + ": " +
                            json.value("message", status));
    }

    std::vector<domain::Candle> candles;
    for (const auto& c : json.at("candles")) {
      domain::Candle candle;
      candle.symbol = symbol;
      candle.timeframe = timeframe;
      candle.open_time_ms = c.at("open_time_ms").get<std::int64_t>();
      candle.open = c.at("open").get<double>();
      candle.high = c.at("high").get<double>();
      candle.low = c.at("low").get<double>();
      candle.close = c.at("close").get<double>();
      candle.volume = c.at("volume").get<double>();
      candles.push_back(std::move(candle));
    }
    return candles;
  } catch (const nlohmann::json::exception& e) {
    throw DataUnavailable("Malformed candle reply for " + symbol + ": " + e.what());
  }
}

std::vector<domain::Candle> ZmqCandleSource::fetch_candles(
    const std::string& symbol, domain::Timeframe timeframe, std::int64_t since_ms,
    std::int64_t timeout_ms) {
  const nlohmann::json request = {
      {"symbol", symbol},
      {"timeframe", domain::to_string(timeframe)},
      {"since_ms", since_ms},
  };
  const std::string body = request.dump();

  std::lock_guard lock(mutex_);
  try {
    socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_ms));
    socket_->send(zmq::buffer(body), zmq::send_flags::none);

    zmq::message_t reply;
    auto result = socket_->recv(reply, zmq::recv_flags::none);
    if (!result.has_value()) {
      reconnect_locked();
      throw DataUnavailable("Candle feeder timed out after " +
                            std::to_string(timeout_ms) + "ms for " + symbol);
    }
    return decode_reply(reply.to_string(), symbol, timeframe);
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqCandleSource] " << endpoint_ << ": " << e.what() << "\n";
    reconnect_locked();
    throw DataUnavailable(std::string("Candle feeder I/O error: ") + e.what());
  }
}

}  // namespace sigrisk
