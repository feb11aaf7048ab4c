#include "sigrisk/domain/candle.hpp"
#include "sigrisk/domain/errors.hpp"

namespace sigrisk {
namespace domain {

namespace {

constexpr std::int64_t kMinuteMs = 60 * 1000;

}  // namespace

std::int64_t timeframe_ms(Timeframe tf) {
  switch (tf) {
    case Timeframe::M1:  return kMinuteMs;
    case Timeframe::M5:  return 5 * kMinuteMs;
    case Timeframe::M15: return 15 * kMinuteMs;
    case Timeframe::H1:  return 60 * kMinuteMs;
    case Timeframe::H4:  return 4 * 60 * kMinuteMs;
    case Timeframe::H12: return 12 * 60 * kMinuteMs;
    case Timeframe::D1:  return 24 * 60 * kMinuteMs;
  }
  return kMinuteMs;
}

const char* to_string(Timeframe tf) {
  switch (tf) {
    case Timeframe::M1:  return "1m";
    case Timeframe::M5:  return "5m";
    case Timeframe::M15: return "15m";
    case Timeframe::H1:  return "1h";
    case Timeframe::H4:  return "4h";
    case Timeframe::H12: return "12h";
    case Timeframe::D1:  return "1d";
  }
  return "unknown";
}

Timeframe parse_timeframe(const std::string& text) {
  if (text == "1m") return Timeframe::M1;
  if (text == "5m") return Timeframe::M5;
  if (text == "15m") return Timeframe::M15;
  if (text == "1h") return Timeframe::H1;
  if (text == "4h") return Timeframe::H4;
  if (text == "12h") return Timeframe::H12;
  if (text == "1d") return Timeframe::D1;
  throw ConfigError("Unknown timeframe: '" + text + "'");
}

}  // namespace domain
}  // namespace sigrisk
