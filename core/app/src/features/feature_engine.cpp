#include "sigrisk/features/feature_engine.hpp"

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/features/indicators.hpp"
#include "sigrisk/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace sigrisk {

namespace {

constexpr double kPi = 3.14159265358979323846;

double or_neutral(const std::optional<double>& v) { return v.value_or(0.0); }

// value / reference - 1, neutral when the reference is missing or zero.
double ratio_minus_one(double value, const std::optional<double>& reference) {
  if (!reference || *reference == 0.0) {
    return 0.0;
  }
  return value / *reference - 1.0;
}

// log(close[n-1] / close[n-1-bars]), neutral when the window is too short.
double log_return(const indicators::Series& close, std::size_t bars) {
  if (close.size() <= bars) {
    return 0.0;
  }
  return std::log(close.back() / close[close.size() - 1 - bars]);
}

// Standard deviation of the trailing `bars` log returns.
double realized_vol(const indicators::Series& returns, std::size_t bars) {
  return or_neutral(indicators::stddev(returns, bars));
}

double safe_div(double num, double den) { return den == 0.0 ? 0.0 : num / den; }

}  // namespace

FeatureEngine::FeatureEngine(FeatureConfig config) : config_(config) {
  if (config_.lookback < 2) {
    throw ConfigError("FeatureEngine: lookback must be at least 2");
  }
}

const std::vector<std::string>& FeatureEngine::feature_names() {
  static const std::vector<std::string> names = {
      "ret_1",           "ret_4",           "ret_16",
      "ret_48",          "ret_window",      "sma_ratio_10",
      "sma_ratio_20",    "sma_ratio_50",    "ema_ratio_12",
      "ema_ratio_26",    "macd",            "macd_signal",
      "macd_hist",       "rsi_14",          "stoch_k_14",
      "stoch_d_3",       "williams_r_14",   "cci_20",
      "mfi_14",          "bb_percent_b_20", "bb_width_20",
      "atr_pct_14",      "rv_20",           "rv_60",
      "rv_window",       "volume_ratio_20", "volume_z_20",
      "obv_slope_20",    "vwap_dev_20",     "log_volume",
      "channel_pos_20",  "hl_spread",       "close_location",
      "body_ratio",      "upper_wick",      "lower_wick",
      "buy_pressure_20", "amihud_20",       "roll_spread_20",
      "log_close",       "hour_sin",        "hour_cos",
      "dow_sin",         "dow_cos",
  };
  return names;
}

void FeatureEngine::validate(const std::vector<domain::Candle>& window) const {
  if (window.size() != config_.lookback) {
    throw InsufficientWindow("FeatureEngine: window has " +
                             std::to_string(window.size()) +
                             " candles, lookback is " +
                             std::to_string(config_.lookback));
  }

  const std::string& symbol = window.front().symbol;
  for (std::size_t i = 0; i < window.size(); ++i) {
    const domain::Candle& c = window[i];
    const bool finite_prices = std::isfinite(c.open) && std::isfinite(c.high) &&
                               std::isfinite(c.low) && std::isfinite(c.close);
    if (!finite_prices || c.open <= 0.0 || c.high <= 0.0 || c.low <= 0.0 ||
        c.close <= 0.0) {
      throw DataUnavailable("FeatureEngine: invalid price in " + symbol +
                            " candle at " + std::to_string(c.open_time_ms));
    }
    if (!std::isfinite(c.volume) || c.volume < 0.0) {
      throw DataUnavailable("FeatureEngine: invalid volume in " + symbol +
                            " candle at " + std::to_string(c.open_time_ms));
    }
    if (c.high < c.low) {
      throw DataUnavailable("FeatureEngine: high < low in " + symbol +
                            " candle at " + std::to_string(c.open_time_ms));
    }
    if (c.symbol != symbol) {
      throw DataUnavailable("FeatureEngine: window mixes symbols " + symbol +
                            " and " + c.symbol);
    }
    if (i > 0 && c.open_time_ms <= window[i - 1].open_time_ms) {
      throw DataUnavailable("FeatureEngine: open times not ascending in " +
                            symbol + " window");
    }
  }
}

// -----------------------------------------------------------------------------
// compute()
// -----------------------------------------------------------------------------
// Values are appended in exactly the order of feature_names(); the size
// check at the end catches any drift between the two.
// -----------------------------------------------------------------------------
domain::FeatureVector FeatureEngine::compute(
    const std::vector<domain::Candle>& window) const {
  validate(window);

  const std::size_t n = window.size();
  indicators::Series open, high, low, close, volume;
  open.reserve(n);
  high.reserve(n);
  low.reserve(n);
  close.reserve(n);
  volume.reserve(n);
  for (const auto& c : window) {
    open.push_back(c.open);
    high.push_back(c.high);
    low.push_back(c.low);
    close.push_back(c.close);
    volume.push_back(c.volume);
  }
  const domain::Candle& last = window.back();
  const double px = last.close;
  const indicators::Series returns = indicators::log_returns(close);

  std::vector<double> values;
  values.reserve(feature_names().size());

  // returns
  values.push_back(log_return(close, 1));
  values.push_back(log_return(close, 4));
  values.push_back(log_return(close, 16));
  values.push_back(log_return(close, 48));
  values.push_back(log_return(close, n - 1));

  // trend
  values.push_back(ratio_minus_one(px, indicators::sma(close, 10)));
  values.push_back(ratio_minus_one(px, indicators::sma(close, 20)));
  values.push_back(ratio_minus_one(px, indicators::sma(close, 50)));
  values.push_back(ratio_minus_one(px, indicators::ema(close, 12)));
  values.push_back(ratio_minus_one(px, indicators::ema(close, 26)));
  {
    const indicators::Series fast = indicators::ema_series(close, 12);
    const indicators::Series slow = indicators::ema_series(close, 26);
    indicators::Series macd_line;
    if (!slow.empty()) {
      // fast starts 14 bars earlier than slow.
      const std::size_t offset = fast.size() - slow.size();
      for (std::size_t i = 0; i < slow.size(); ++i) {
        macd_line.push_back((fast[offset + i] - slow[i]) / px);
      }
    }
    const double macd = macd_line.empty() ? 0.0 : macd_line.back();
    const auto signal = indicators::ema(macd_line, 9);
    values.push_back(macd);
    values.push_back(or_neutral(signal));
    values.push_back(signal ? macd - *signal : 0.0);
  }

  // oscillators
  {
    const auto rsi = indicators::rsi(close, 14);
    values.push_back(rsi ? (*rsi - 50.0) / 50.0 : 0.0);

    const indicators::Series k = indicators::stochastic_k_series(high, low, close, 14);
    values.push_back(k.empty() ? 0.0 : (k.back() - 50.0) / 50.0);
    const auto d = indicators::sma(k, 3);
    values.push_back(d ? (*d - 50.0) / 50.0 : 0.0);

    const auto wr = indicators::williams_r(high, low, close, 14);
    values.push_back(wr ? (*wr + 50.0) / 50.0 : 0.0);

    values.push_back(or_neutral(indicators::cci(high, low, close, 20)) / 100.0);

    const auto mfi = indicators::mfi(high, low, close, volume, 14);
    values.push_back(mfi ? (*mfi - 50.0) / 50.0 : 0.0);
  }

  // volatility
  {
    const auto mid = indicators::sma(close, 20);
    const auto sd = indicators::stddev(close, 20);
    if (mid && sd && *sd > 0.0) {
      const double upper = *mid + 2.0 * *sd;
      const double lower = *mid - 2.0 * *sd;
      // %B centred so the middle band maps to 0.
      values.push_back((px - lower) / (upper - lower) - 0.5);
      values.push_back((upper - lower) / *mid);
    } else {
      values.push_back(0.0);
      values.push_back(0.0);
    }
    values.push_back(or_neutral(indicators::atr(high, low, close, 14)) / px);
    values.push_back(realized_vol(returns, 20));
    values.push_back(realized_vol(returns, 60));
    values.push_back(realized_vol(returns, returns.size()));
  }

  // volume
  {
    const auto vol_mean = indicators::sma(volume, 20);
    const auto vol_sd = indicators::stddev(volume, 20);
    values.push_back(ratio_minus_one(last.volume, vol_mean));
    values.push_back(vol_mean && vol_sd && *vol_sd > 0.0
                         ? (last.volume - *vol_mean) / *vol_sd
                         : 0.0);

    const indicators::Series obv = indicators::obv_series(close, volume);
    const auto slope = indicators::linear_slope(obv, 20);
    values.push_back(slope && vol_mean ? safe_div(*slope, *vol_mean) : 0.0);

    double pv = 0.0;
    double v = 0.0;
    for (std::size_t i = n >= 20 ? n - 20 : 0; i < n; ++i) {
      pv += (high[i] + low[i] + close[i]) / 3.0 * volume[i];
      v += volume[i];
    }
    values.push_back(n >= 20 && v > 0.0 ? px / (pv / v) - 1.0 : 0.0);
    values.push_back(std::log1p(last.volume));
  }

  // structure
  {
    if (n >= 20) {
      const auto hi = *std::max_element(high.end() - 20, high.end());
      const auto lo = *std::min_element(low.end() - 20, low.end());
      values.push_back(hi > lo ? 2.0 * (px - lo) / (hi - lo) - 1.0 : 0.0);
    } else {
      values.push_back(0.0);
    }

    const double range = last.high - last.low;
    values.push_back(range / px);
    values.push_back(safe_div((last.close - last.low) - (last.high - last.close), range));
    values.push_back(safe_div(std::abs(last.close - last.open), range));
    values.push_back(safe_div(last.high - std::max(last.open, last.close), range));
    values.push_back(safe_div(std::min(last.open, last.close) - last.low, range));

    if (n >= 20) {
      double pressure = 0.0;
      double illiquidity = 0.0;
      for (std::size_t i = n - 20; i < n; ++i) {
        const double bar_range = high[i] - low[i];
        pressure += bar_range > 0.0 ? (close[i] - low[i]) / bar_range : 0.5;
        const double dollar_volume = volume[i] * close[i];
        if (i > 0 && dollar_volume > 0.0) {
          illiquidity += std::abs(returns[i - 1]) / dollar_volume;
        }
      }
      values.push_back(2.0 * pressure / 20.0 - 1.0);
      values.push_back(std::log1p(1e6 * illiquidity / 20.0));
    } else {
      values.push_back(0.0);
      values.push_back(0.0);
    }

    const auto cov = indicators::first_order_autocovariance(close, 20);
    values.push_back(cov && *cov < 0.0 ? 2.0 * std::sqrt(-*cov) / px : 0.0);
  }

  // levels and time
  {
    values.push_back(std::log(px));
    const std::int64_t day = floor_to_bucket(last.open_time_ms, kMillisPerDay);
    const std::int64_t ms_of_day = last.open_time_ms - day * kMillisPerDay;
    const double hour_angle =
        2.0 * kPi * static_cast<double>(ms_of_day) / static_cast<double>(kMillisPerDay);
    values.push_back(std::sin(hour_angle));
    values.push_back(std::cos(hour_angle));
    // 1970-01-01 was a Thursday; Monday is day 0.
    const std::int64_t dow = ((day + 3) % 7 + 7) % 7;
    const double dow_angle = 2.0 * kPi * static_cast<double>(dow) / 7.0;
    values.push_back(std::sin(dow_angle));
    values.push_back(std::cos(dow_angle));
  }

  const auto& names = feature_names();
  if (values.size() != names.size()) {
    throw FeatureShapeMismatch("FeatureEngine: produced " +
                               std::to_string(values.size()) +
                               " values for " + std::to_string(names.size()) +
                               " names");
  }

  for (std::size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      std::cerr << "[FeatureEngine] " << last.symbol << " feature " << names[i]
                << " is not finite, using 0\n";
      values[i] = 0.0;
    }
  }

  domain::FeatureVector out;
  out.symbol = last.symbol;
  out.as_of_ms = last.open_time_ms;
  out.reference_price = px;
  out.names = names;
  out.values = std::move(values);
  return out;
}

}  // namespace sigrisk
