#pragma once

#include "sigrisk/domain/candle.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// IMarketDataSource: upstream candle provider
// -----------------------------------------------------------------------------
//
// @brief  Narrow interface the MarketDataCache fetches through. Real
//         implementations talk to an exchange feeder (ZmqCandleSource);
//         tests substitute scripted stubs.
//
// @details
// fetch_candles() returns every candle of (symbol, timeframe) whose open time
// is >= since_ms, ordered by ascending open time. The most recent candle may
// still be forming. The call must give up after timeout_ms.
//
// Failure contract:
//   RateLimited     : upstream asked us to back off. No data was returned.
//   DataUnavailable : any other upstream failure, including a timeout.
//
// Thread model:
//   Implementations MUST be safe to call concurrently for different
//   (symbol, timeframe) pairs; the cache never issues two concurrent calls
//   for the same pair.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual std::vector<domain::Candle> fetch_candles(
      const std::string& symbol, domain::Timeframe timeframe,
      std::int64_t since_ms, std::int64_t timeout_ms) = 0;
};

}  // namespace sigrisk
