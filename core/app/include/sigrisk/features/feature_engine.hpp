#pragma once

#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/domain/candle.hpp"
#include "sigrisk/domain/feature_vector.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// FeatureEngine: candle window → fixed-length feature vector
// -----------------------------------------------------------------------------
//
// @brief  Computes the ordered, named feature vector the model was trained
//         against from exactly `lookback` candles.
//
// @details
// compute() is a pure function of its window: same candles in, same vector
// out, independent of call order or thread.
//
// Feature families (see feature_names() for the exact order):
//   returns           log returns over 1/4/16/48 bars and the whole window
//   trend             close vs SMA(10/20/50) and EMA(12/26), MACD line,
//                     signal and histogram
//   oscillators       RSI(14), stochastic %K(14)/%D(3), Williams %R(14),
//                     CCI(20), MFI(14)
//   volatility        Bollinger %B and width (20, 2σ), ATR(14), realized
//                     volatility over 20/60 bars and the whole window
//   volume            volume ratio and z-score (20), OBV slope (20),
//                     VWAP deviation (20), log volume
//   structure         price-channel position (20), high-low spread, close
//                     location, body and wick ratios, buy pressure (20),
//                     Amihud illiquidity (20), Roll spread (20)
//   levels and time   log close, hour-of-day and day-of-week sin/cos
//
// Oscillators are rescaled to roughly [-1, 1] around their neutral value.
// An indicator that needs more bars than the window holds, or is undefined
// for it (flat prices, zero range), yields the neutral sentinel 0.
//
// Validation:
//   window.size() != lookback                      → InsufficientWindow
//   non-finite or non-positive price, negative or
//   non-finite volume, high < low, open times not
//   strictly ascending, mixed symbols              → DataUnavailable
// Any non-finite output is replaced by 0 and logged, so the returned vector
// never carries NaN or Inf.
//
// Thread model:
//   Stateless apart from the immutable config. Safe from any thread.
// -----------------------------------------------------------------------------
class FeatureEngine {
 public:
  explicit FeatureEngine(FeatureConfig config);

  domain::FeatureVector compute(const std::vector<domain::Candle>& window) const;

  std::size_t lookback() const { return config_.lookback; }
  std::size_t dimension() const { return feature_names().size(); }

  static const std::vector<std::string>& feature_names();

 private:
  void validate(const std::vector<domain::Candle>& window) const;

  const FeatureConfig config_;
};

}  // namespace sigrisk
