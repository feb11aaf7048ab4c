#include "sigrisk/features/indicators.hpp"

#include <algorithm>
#include <cmath>

namespace sigrisk {
namespace indicators {

namespace {

// Start index of the trailing window of length `period`.
std::size_t window_start(const Series& values, std::size_t period) {
  return values.size() - period;
}

double typical_price(double h, double l, double c) { return (h + l + c) / 3.0; }

}  // namespace

std::optional<double> sma(const Series& values, std::size_t period) {
  if (period == 0 || values.size() < period) {
    return std::nullopt;
  }
  double sum = 0.0;
  for (std::size_t i = window_start(values, period); i < values.size(); ++i) {
    sum += values[i];
  }
  return sum / static_cast<double>(period);
}

Series ema_series(const Series& values, std::size_t period) {
  Series out;
  if (period == 0 || values.size() < period) {
    return out;
  }
  const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
  double seed = 0.0;
  for (std::size_t i = 0; i < period; ++i) {
    seed += values[i];
  }
  double current = seed / static_cast<double>(period);
  out.reserve(values.size() - period + 1);
  out.push_back(current);
  for (std::size_t i = period; i < values.size(); ++i) {
    current = alpha * values[i] + (1.0 - alpha) * current;
    out.push_back(current);
  }
  return out;
}

std::optional<double> ema(const Series& values, std::size_t period) {
  Series s = ema_series(values, period);
  if (s.empty()) {
    return std::nullopt;
  }
  return s.back();
}

std::optional<double> stddev(const Series& values, std::size_t period) {
  if (period < 2 || values.size() < period) {
    return std::nullopt;
  }
  const double mean = *sma(values, period);
  double acc = 0.0;
  for (std::size_t i = window_start(values, period); i < values.size(); ++i) {
    const double d = values[i] - mean;
    acc += d * d;
  }
  return std::sqrt(acc / static_cast<double>(period - 1));
}

Series log_returns(const Series& values) {
  Series out;
  if (values.size() < 2) {
    return out;
  }
  out.reserve(values.size() - 1);
  for (std::size_t i = 1; i < values.size(); ++i) {
    out.push_back(std::log(values[i] / values[i - 1]));
  }
  return out;
}

// -----------------------------------------------------------------------------
// rsi(): Wilder smoothing. All gains (no losses) → 100; flat → nullopt.
// -----------------------------------------------------------------------------
std::optional<double> rsi(const Series& close, std::size_t period) {
  if (period == 0 || close.size() < period + 1) {
    return std::nullopt;
  }
  double gain = 0.0;
  double loss = 0.0;
  for (std::size_t i = 1; i <= period; ++i) {
    const double change = close[i] - close[i - 1];
    (change > 0.0 ? gain : loss) += std::abs(change);
  }
  gain /= static_cast<double>(period);
  loss /= static_cast<double>(period);
  const double p = static_cast<double>(period);
  for (std::size_t i = period + 1; i < close.size(); ++i) {
    const double change = close[i] - close[i - 1];
    gain = (gain * (p - 1.0) + std::max(change, 0.0)) / p;
    loss = (loss * (p - 1.0) + std::max(-change, 0.0)) / p;
  }
  if (gain == 0.0 && loss == 0.0) {
    return std::nullopt;
  }
  if (loss == 0.0) {
    return 100.0;
  }
  const double rs = gain / loss;
  return 100.0 - 100.0 / (1.0 + rs);
}

Series stochastic_k_series(const Series& high, const Series& low,
                           const Series& close, std::size_t period) {
  Series out;
  if (period == 0 || close.size() < period) {
    return out;
  }
  for (std::size_t end = period; end <= close.size(); ++end) {
    const auto hi = *std::max_element(high.begin() + (end - period),
                                      high.begin() + end);
    const auto lo = *std::min_element(low.begin() + (end - period),
                                      low.begin() + end);
    const double range = hi - lo;
    out.push_back(range > 0.0 ? 100.0 * (close[end - 1] - lo) / range : 50.0);
  }
  return out;
}

std::optional<double> williams_r(const Series& high, const Series& low,
                                 const Series& close, std::size_t period) {
  if (period == 0 || close.size() < period) {
    return std::nullopt;
  }
  const std::size_t start = window_start(close, period);
  const auto hi = *std::max_element(high.begin() + start, high.end());
  const auto lo = *std::min_element(low.begin() + start, low.end());
  const double range = hi - lo;
  if (range <= 0.0) {
    return std::nullopt;
  }
  return -100.0 * (hi - close.back()) / range;
}

std::optional<double> cci(const Series& high, const Series& low,
                          const Series& close, std::size_t period) {
  if (period == 0 || close.size() < period) {
    return std::nullopt;
  }
  Series tp;
  tp.reserve(period);
  for (std::size_t i = window_start(close, period); i < close.size(); ++i) {
    tp.push_back(typical_price(high[i], low[i], close[i]));
  }
  const double mean = *sma(tp, period);
  double mad = 0.0;
  for (double v : tp) {
    mad += std::abs(v - mean);
  }
  mad /= static_cast<double>(period);
  if (mad == 0.0) {
    return std::nullopt;
  }
  return (tp.back() - mean) / (0.015 * mad);
}

std::optional<double> atr(const Series& high, const Series& low,
                          const Series& close, std::size_t period) {
  if (period == 0 || close.size() < period + 1) {
    return std::nullopt;
  }
  auto true_range = [&](std::size_t i) {
    return std::max({high[i] - low[i], std::abs(high[i] - close[i - 1]),
                     std::abs(low[i] - close[i - 1])});
  };
  double value = 0.0;
  for (std::size_t i = 1; i <= period; ++i) {
    value += true_range(i);
  }
  value /= static_cast<double>(period);
  const double p = static_cast<double>(period);
  for (std::size_t i = period + 1; i < close.size(); ++i) {
    value = (value * (p - 1.0) + true_range(i)) / p;
  }
  return value;
}

std::optional<double> mfi(const Series& high, const Series& low,
                          const Series& close, const Series& volume,
                          std::size_t period) {
  if (period == 0 || close.size() < period + 1) {
    return std::nullopt;
  }
  double positive = 0.0;
  double negative = 0.0;
  for (std::size_t i = close.size() - period; i < close.size(); ++i) {
    const double tp = typical_price(high[i], low[i], close[i]);
    const double prev = typical_price(high[i - 1], low[i - 1], close[i - 1]);
    const double flow = tp * volume[i];
    if (tp > prev) {
      positive += flow;
    } else if (tp < prev) {
      negative += flow;
    }
  }
  if (positive == 0.0 && negative == 0.0) {
    return std::nullopt;
  }
  if (negative == 0.0) {
    return 100.0;
  }
  return 100.0 - 100.0 / (1.0 + positive / negative);
}

Series obv_series(const Series& close, const Series& volume) {
  Series out;
  if (close.empty()) {
    return out;
  }
  out.reserve(close.size());
  double running = 0.0;
  out.push_back(running);
  for (std::size_t i = 1; i < close.size(); ++i) {
    if (close[i] > close[i - 1]) {
      running += volume[i];
    } else if (close[i] < close[i - 1]) {
      running -= volume[i];
    }
    out.push_back(running);
  }
  return out;
}

std::optional<double> linear_slope(const Series& values, std::size_t period) {
  if (period < 2 || values.size() < period) {
    return std::nullopt;
  }
  const double n = static_cast<double>(period);
  const double x_mean = (n - 1.0) / 2.0;
  const double y_mean = *sma(values, period);
  double num = 0.0;
  double den = 0.0;
  const std::size_t start = window_start(values, period);
  for (std::size_t k = 0; k < period; ++k) {
    const double dx = static_cast<double>(k) - x_mean;
    num += dx * (values[start + k] - y_mean);
    den += dx * dx;
  }
  return num / den;
}

std::optional<double> first_order_autocovariance(const Series& values,
                                                 std::size_t period) {
  // `period` changes need period + 1 prices; the lagged pair needs one more.
  if (period < 2 || values.size() < period + 2) {
    return std::nullopt;
  }
  Series changes;
  changes.reserve(period + 1);
  for (std::size_t i = values.size() - period - 1; i < values.size(); ++i) {
    changes.push_back(values[i] - values[i - 1]);
  }
  double mean_now = 0.0;
  double mean_lag = 0.0;
  for (std::size_t i = 1; i < changes.size(); ++i) {
    mean_now += changes[i];
    mean_lag += changes[i - 1];
  }
  mean_now /= static_cast<double>(period);
  mean_lag /= static_cast<double>(period);
  double cov = 0.0;
  for (std::size_t i = 1; i < changes.size(); ++i) {
    cov += (changes[i] - mean_now) * (changes[i - 1] - mean_lag);
  }
  return cov / static_cast<double>(period - 1);
}

}  // namespace indicators
}  // namespace sigrisk
