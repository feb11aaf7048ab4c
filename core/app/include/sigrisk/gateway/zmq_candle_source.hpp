#pragma once

#include "sigrisk/data/i_market_data_source.hpp"

#include <zmq.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// ZmqCandleSource: REQ client for the upstream candle feeder
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataSource that asks a feeder process for candles over a
//         ZeroMQ REQ socket.
//
// @details
// Request:  {"symbol": "BTCUSDT", "timeframe": "15m", "since_ms": 1700000000000}
// Reply:    {"status": "ok", "candles": [{"open_time_ms", "open", "high",
//            "low", "close", "volume"}, ...]}
//           {"status": "rate_limited"}            → RateLimited
//           {"status": "error", "message": "..."} → DataUnavailable
//
// The receive timeout is the caller's timeout_ms. A REQ socket that timed
// out is stuck in its send/recv cycle, so it is closed and reopened before
// the next request. Malformed replies and ZeroMQ errors surface as
// DataUnavailable.
//
// Thread model:
//   One socket, one request at a time: fetch_candles() is serialized by
//   mutex_. Different symbols therefore queue behind each other here, which
//   the cache's coalescing and the worker pool size keep short.
// -----------------------------------------------------------------------------
class ZmqCandleSource final : public IMarketDataSource {
 public:
  explicit ZmqCandleSource(std::string endpoint);

  ZmqCandleSource(const ZmqCandleSource&) = delete;
  ZmqCandleSource& operator=(const ZmqCandleSource&) = delete;

  std::vector<domain::Candle> fetch_candles(const std::string& symbol,
                                            domain::Timeframe timeframe,
                                            std::int64_t since_ms,
                                            std::int64_t timeout_ms) override;

  static std::vector<domain::Candle> decode_reply(const std::string& payload,
                                                  const std::string& symbol,
                                                  domain::Timeframe timeframe);

 private:
  void reconnect_locked();

  const std::string endpoint_;
  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace sigrisk
