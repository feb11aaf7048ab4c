#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace sigrisk {
namespace indicators {

// -----------------------------------------------------------------------------
// Rolling-window indicator primitives
// -----------------------------------------------------------------------------
//
// @brief  Pure functions over price/volume series ordered oldest-first.
//
// @details
// Every function evaluates the indicator at the LAST element of the series
// unless its name ends in _series. A function returns std::nullopt when the
// series is too short for the requested period, or when the result would be
// undefined (zero variance, zero range). The FeatureEngine maps nullopt to
// the neutral sentinel 0.
//
// No function keeps state between calls.
// -----------------------------------------------------------------------------

using Series = std::vector<double>;

std::optional<double> sma(const Series& values, std::size_t period);

// Exponential moving average series seeded with the SMA of the first
// `period` values. Element i of the result corresponds to values[period-1+i].
// Empty when values.size() < period.
Series ema_series(const Series& values, std::size_t period);

std::optional<double> ema(const Series& values, std::size_t period);

// Sample standard deviation of the last `period` values.
std::optional<double> stddev(const Series& values, std::size_t period);

// Log returns r[i] = ln(v[i+1] / v[i]). Size is values.size() - 1.
Series log_returns(const Series& values);

// Wilder RSI over `period` changes, in [0, 100].
std::optional<double> rsi(const Series& close, std::size_t period);

// Stochastic %K series over `period` bars, values in [0, 100].
Series stochastic_k_series(const Series& high, const Series& low,
                           const Series& close, std::size_t period);

std::optional<double> williams_r(const Series& high, const Series& low,
                                 const Series& close, std::size_t period);

std::optional<double> cci(const Series& high, const Series& low,
                          const Series& close, std::size_t period);

// Wilder average true range.
std::optional<double> atr(const Series& high, const Series& low,
                          const Series& close, std::size_t period);

std::optional<double> mfi(const Series& high, const Series& low,
                          const Series& close, const Series& volume,
                          std::size_t period);

// On-balance volume, cumulative from the first bar (OBV[0] = 0).
Series obv_series(const Series& close, const Series& volume);

// Least-squares slope of the last `period` values against 0..period-1.
std::optional<double> linear_slope(const Series& values, std::size_t period);

// Sample covariance of consecutive price changes over the last `period`
// changes; used by the Roll spread estimator.
std::optional<double> first_order_autocovariance(const Series& values,
                                                 std::size_t period);

}  // namespace indicators
}  // namespace sigrisk
