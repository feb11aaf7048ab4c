#pragma once

#include <cstdint>
#include <string>

namespace sigrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Timeframe
// -----------------------------------------------------------------------------
// Responsibility: Enumerates the candle periods the pipeline understands.
// The string form ("1m", "15m", "1h", ...) is used in configuration files and
// on the wire to the upstream candle source.
// -----------------------------------------------------------------------------
enum class Timeframe {
  M1,
  M5,
  M15,
  H1,
  H4,
  H12,
  D1,
};

// Duration of one candle of the given timeframe, in milliseconds.
std::int64_t timeframe_ms(Timeframe tf);

// "15m", "1h", ... Inverse of parse_timeframe().
const char* to_string(Timeframe tf);

// Parses the string form. Throws ConfigError on an unknown value.
Timeframe parse_timeframe(const std::string& text);

// -----------------------------------------------------------------------------
// Candle
// -----------------------------------------------------------------------------
//
// @brief  One OHLCV bar for a (symbol, timeframe) pair.
//
// @details
// Unique key: symbol + timeframe + open_time_ms. A closed candle is
// immutable. The most recent candle of a series may still be forming; the
// MarketDataCache replaces it in place when a newer snapshot with the same
// open_time_ms arrives.
//
// Plain value type: safe to copy between threads. The authoritative copies
// live inside MarketDataCache; windows handed out are snapshots.
// -----------------------------------------------------------------------------
struct Candle {
  std::string symbol;
  Timeframe timeframe{Timeframe::M15};
  std::int64_t open_time_ms{0};   // Epoch ms at which the period opened
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

}  // namespace domain
}  // namespace sigrisk
