#pragma once

#include "sigrisk/domain/candle.hpp"
#include "sigrisk/domain/prediction.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// Engine configuration
// -----------------------------------------------------------------------------
//
// @brief  Plain structs with defaults, one per component, aggregated into
//         EngineConfig.
//
// @details
// Each component receives its own struct by value at construction and
// never mutates it. Changing a setting at runtime means building a new
// instance (see SignalScheduler::replace_reconciler()).
//
// Defaults are the values the pipeline runs with when a key is absent from
// the JSON file; see config_loader.hpp for the file layout. All durations
// are milliseconds; all "_pct" values are fractions (0.01 == 1%).
// -----------------------------------------------------------------------------

struct CacheConfig {
  std::size_t max_candles{1000};              // ring size per symbol/timeframe
  std::int64_t ttl_ms{60 * 60 * 1000};        // idle entries evicted after this
  std::int64_t stale_tolerance_ms{5 * 60 * 1000};  // grace beyond the staleness bound
  std::int64_t fetch_timeout_ms{10 * 1000};   // ceiling for one upstream call
  double rate_limit_per_second{10.0};         // token refill rate
  double rate_limit_burst{20.0};              // bucket capacity
};

struct FeatureConfig {
  std::size_t lookback{96};
};

struct ModelConfig {
  std::string weights_path;                   // LinearSoftmaxModel JSON weights
  std::int64_t inference_timeout_ms{5 * 1000};
  std::size_t inference_threads{4};           // threads a hung model can occupy
};

struct ReconcilerConfig {
  // Indexed by Horizon: 15m, 1h, 4h, 12h. Must sum to 1.
  std::array<double, domain::kHorizonCount> horizon_weights{{0.4, 0.3, 0.2, 0.1}};
  double low_threshold{0.5};
  double high_threshold{1.5};
  double min_confidence{0.3};
  double min_agreement{0.5};
  double sl_min_pct{0.005};
  double sl_max_pct{0.05};
  double tp_min_pct{0.01};
  double tp_max_pct{0.10};
  // One take-profit price per entry: entry * (1 ± tp_pct * scale).
  std::vector<double> take_profit_scales{1.0};
  std::string strategy_id{"ml_multi_horizon"};
  std::int64_t signal_ttl_ms{15 * 60 * 1000};
  std::int64_t fingerprint_bucket_ms{5 * 60 * 1000};
};

struct SchedulerConfig {
  std::vector<std::string> symbols;
  domain::Timeframe timeframe{domain::Timeframe::M15};
  std::int64_t tick_interval_ms{60 * 1000};
  std::int64_t safety_margin_ms{5 * 1000};
  std::int64_t run_timeout_ms{45 * 1000};
  std::size_t worker_pool_size{4};
  int max_attempts{3};
  std::int64_t backoff_base_ms{500};
  double backoff_multiplier{2.0};
};

// One rung of the take-profit ladder: close `fraction` of the original
// quantity once price moves `offset_pct` in the position's favour.
struct TakeProfitStep {
  double offset_pct{0.0};
  double fraction{0.0};
};

struct RiskConfig {
  double position_quantity{1.0};
  std::size_t max_open_positions{5};
  double min_signal_confidence{0.3};
  std::vector<TakeProfitStep> take_profit_schedule{
      {0.01, 0.3}, {0.02, 0.3}, {0.03, 0.4}};
  bool use_signal_take_profits{false};
  double default_stop_loss_pct{0.02};  // when the signal carries no stop
  bool trailing_enabled{true};
  double trailing_activation_pct{0.015};
  double trailing_distance_pct{0.005};
  bool breakeven_enabled{false};
  double breakeven_at_pct{0.01};
  int dispatch_max_attempts{3};
  std::int64_t dispatch_backoff_ms{100};
};

// Empty endpoint disables the corresponding network component.
struct NetworkConfig {
  std::string price_tick_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string candle_source_endpoint{"tcp://127.0.0.1:5558"};
};

struct PersistenceConfig {
  std::string jsonl_path{"sigrisk_events.jsonl"};  // empty disables persistence
};

struct EngineConfig {
  CacheConfig cache;
  FeatureConfig features;
  ModelConfig model;
  ReconcilerConfig reconciler;
  SchedulerConfig scheduler;
  RiskConfig risk;
  NetworkConfig network;
  PersistenceConfig persistence;
};

}  // namespace sigrisk
