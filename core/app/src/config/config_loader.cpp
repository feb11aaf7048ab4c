#include "sigrisk/config/config_loader.hpp"
#include "sigrisk/domain/errors.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <iostream>
#include <string>

namespace sigrisk {

namespace {

constexpr double kWeightTolerance = 1e-6;

// -----------------------------------------------------------------------------
// read(): copy section[key] into out if present. nlohmann reports type
// mismatches as json::type_error; surface them as ConfigError with the path.
// -----------------------------------------------------------------------------
template <typename T>
void read(const nlohmann::json& section, const char* section_name,
          const char* key, T& out) {
  if (!section.contains(key)) {
    return;
  }
  try {
    out = section.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for ") + section_name + "." +
                      key + ": " + e.what());
  }
}

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!root.contains(name)) {
    return kEmpty;
  }
  const nlohmann::json& s = root.at(name);
  if (!s.is_object()) {
    throw ConfigError(std::string("Section '") + name + "' must be an object");
  }
  return s;
}

void parse_cache(const nlohmann::json& s, CacheConfig& c) {
  read(s, "cache", "max_candles", c.max_candles);
  read(s, "cache", "ttl_ms", c.ttl_ms);
  read(s, "cache", "stale_tolerance_ms", c.stale_tolerance_ms);
  read(s, "cache", "fetch_timeout_ms", c.fetch_timeout_ms);
  read(s, "cache", "rate_limit_per_second", c.rate_limit_per_second);
  read(s, "cache", "rate_limit_burst", c.rate_limit_burst);
}

void parse_reconciler(const nlohmann::json& s, ReconcilerConfig& c) {
  if (s.contains("horizon_weights")) {
    std::vector<double> weights;
    read(s, "reconciler", "horizon_weights", weights);
    if (weights.size() != c.horizon_weights.size()) {
      throw ConfigError("reconciler.horizon_weights must have " +
                        std::to_string(c.horizon_weights.size()) + " entries");
    }
    for (std::size_t i = 0; i < weights.size(); ++i) {
      c.horizon_weights[i] = weights[i];
    }
  }
  read(s, "reconciler", "low_threshold", c.low_threshold);
  read(s, "reconciler", "high_threshold", c.high_threshold);
  read(s, "reconciler", "min_confidence", c.min_confidence);
  read(s, "reconciler", "min_agreement", c.min_agreement);
  read(s, "reconciler", "sl_min_pct", c.sl_min_pct);
  read(s, "reconciler", "sl_max_pct", c.sl_max_pct);
  read(s, "reconciler", "tp_min_pct", c.tp_min_pct);
  read(s, "reconciler", "tp_max_pct", c.tp_max_pct);
  read(s, "reconciler", "take_profit_scales", c.take_profit_scales);
  read(s, "reconciler", "strategy_id", c.strategy_id);
  read(s, "reconciler", "signal_ttl_ms", c.signal_ttl_ms);
  read(s, "reconciler", "fingerprint_bucket_ms", c.fingerprint_bucket_ms);
}

void parse_scheduler(const nlohmann::json& s, SchedulerConfig& c) {
  read(s, "scheduler", "symbols", c.symbols);
  if (s.contains("timeframe")) {
    std::string tf;
    read(s, "scheduler", "timeframe", tf);
    c.timeframe = domain::parse_timeframe(tf);
  }
  read(s, "scheduler", "tick_interval_ms", c.tick_interval_ms);
  read(s, "scheduler", "safety_margin_ms", c.safety_margin_ms);
  read(s, "scheduler", "run_timeout_ms", c.run_timeout_ms);
  read(s, "scheduler", "worker_pool_size", c.worker_pool_size);
  read(s, "scheduler", "max_attempts", c.max_attempts);
  read(s, "scheduler", "backoff_base_ms", c.backoff_base_ms);
  read(s, "scheduler", "backoff_multiplier", c.backoff_multiplier);
}

// take_profit_schedule is a list of [offset_pct, fraction] pairs.
void parse_risk(const nlohmann::json& s, RiskConfig& c) {
  read(s, "risk", "position_quantity", c.position_quantity);
  read(s, "risk", "max_open_positions", c.max_open_positions);
  read(s, "risk", "min_signal_confidence", c.min_signal_confidence);
  if (s.contains("take_profit_schedule")) {
    std::vector<std::array<double, 2>> pairs;
    read(s, "risk", "take_profit_schedule", pairs);
    c.take_profit_schedule.clear();
    for (const auto& p : pairs) {
      c.take_profit_schedule.push_back(TakeProfitStep{p[0], p[1]});
    }
  }
  read(s, "risk", "use_signal_take_profits", c.use_signal_take_profits);
  read(s, "risk", "default_stop_loss_pct", c.default_stop_loss_pct);
  read(s, "risk", "trailing_enabled", c.trailing_enabled);
  read(s, "risk", "trailing_activation_pct", c.trailing_activation_pct);
  read(s, "risk", "trailing_distance_pct", c.trailing_distance_pct);
  read(s, "risk", "breakeven_enabled", c.breakeven_enabled);
  read(s, "risk", "breakeven_at_pct", c.breakeven_at_pct);
  read(s, "risk", "dispatch_max_attempts", c.dispatch_max_attempts);
  read(s, "risk", "dispatch_backoff_ms", c.dispatch_backoff_ms);
}

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigError(message);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parse_engine_config
// -----------------------------------------------------------------------------
EngineConfig parse_engine_config(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }

  EngineConfig config;
  parse_cache(section(root, "cache"), config.cache);
  read(section(root, "features"), "features", "lookback",
       config.features.lookback);

  const auto& model = section(root, "model");
  read(model, "model", "weights_path", config.model.weights_path);
  read(model, "model", "inference_timeout_ms",
       config.model.inference_timeout_ms);
  read(model, "model", "inference_threads", config.model.inference_threads);

  parse_reconciler(section(root, "reconciler"), config.reconciler);
  parse_scheduler(section(root, "scheduler"), config.scheduler);
  parse_risk(section(root, "risk"), config.risk);

  const auto& net = section(root, "network");
  read(net, "network", "price_tick_endpoint",
       config.network.price_tick_endpoint);
  read(net, "network", "ipc_cmd_endpoint", config.network.ipc_cmd_endpoint);
  read(net, "network", "ipc_pub_endpoint", config.network.ipc_pub_endpoint);
  read(net, "network", "candle_source_endpoint",
       config.network.candle_source_endpoint);

  read(section(root, "persistence"), "persistence", "jsonl_path",
       config.persistence.jsonl_path);

  validate_engine_config(config);
  return config;
}

// -----------------------------------------------------------------------------
// load_engine_config
// -----------------------------------------------------------------------------
EngineConfig load_engine_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open configuration file: " + path);
  }

  nlohmann::json root;
  try {
    in >> root;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed configuration file " + path + ": " +
                      e.what());
  }

  EngineConfig config = parse_engine_config(root);
  std::cout << "[Config] loaded " << path << ": "
            << config.scheduler.symbols.size() << " symbol(s), tick="
            << config.scheduler.tick_interval_ms << "ms, workers="
            << config.scheduler.worker_pool_size << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// validate_engine_config
// -----------------------------------------------------------------------------
void validate_engine_config(const EngineConfig& c) {
  require(c.cache.max_candles > 0, "cache.max_candles must be positive");
  require(c.cache.ttl_ms > 0, "cache.ttl_ms must be positive");
  require(c.cache.stale_tolerance_ms >= 0,
          "cache.stale_tolerance_ms must be non-negative");
  require(c.cache.fetch_timeout_ms > 0,
          "cache.fetch_timeout_ms must be positive");
  require(c.cache.rate_limit_per_second > 0.0 &&
              c.cache.rate_limit_burst >= 1.0,
          "cache rate limit must allow at least one request");

  require(c.features.lookback >= 2, "features.lookback must be at least 2");
  require(c.features.lookback <= c.cache.max_candles,
          "features.lookback cannot exceed cache.max_candles");
  require(c.model.inference_timeout_ms > 0,
          "model.inference_timeout_ms must be positive");
  require(c.model.inference_threads > 0, "model.inference_threads must be positive");

  const auto& r = c.reconciler;
  double sum = 0.0;
  for (double w : r.horizon_weights) {
    require(w >= 0.0, "reconciler.horizon_weights must be non-negative");
    sum += w;
  }
  require(std::abs(sum - 1.0) <= kWeightTolerance,
          "reconciler.horizon_weights must sum to 1");
  require(r.low_threshold < r.high_threshold,
          "reconciler.low_threshold must be below high_threshold");
  require(r.sl_min_pct > 0.0 && r.sl_min_pct <= r.sl_max_pct,
          "reconciler stop-loss band must satisfy 0 < min <= max");
  require(r.tp_min_pct > 0.0 && r.tp_min_pct <= r.tp_max_pct,
          "reconciler take-profit band must satisfy 0 < min <= max");
  require(!r.take_profit_scales.empty(),
          "reconciler.take_profit_scales must not be empty");
  require(r.signal_ttl_ms > 0 && r.fingerprint_bucket_ms > 0,
          "reconciler durations must be positive");

  const auto& s = c.scheduler;
  require(s.tick_interval_ms > 0, "scheduler.tick_interval_ms must be positive");
  require(s.safety_margin_ms >= 0 && s.safety_margin_ms < s.tick_interval_ms,
          "scheduler.safety_margin_ms must be within the tick interval");
  require(s.run_timeout_ms > 0, "scheduler.run_timeout_ms must be positive");
  require(s.worker_pool_size > 0, "scheduler.worker_pool_size must be positive");
  require(s.max_attempts >= 1, "scheduler.max_attempts must be at least 1");
  require(s.backoff_base_ms >= 0 && s.backoff_multiplier >= 1.0,
          "scheduler backoff must be non-decreasing");

  const auto& k = c.risk;
  require(k.position_quantity > 0.0, "risk.position_quantity must be positive");
  require(k.max_open_positions > 0, "risk.max_open_positions must be positive");
  double fraction_sum = 0.0;
  for (const auto& step : k.take_profit_schedule) {
    require(step.offset_pct > 0.0 && step.fraction > 0.0,
            "risk.take_profit_schedule entries must be positive");
    fraction_sum += step.fraction;
  }
  require(fraction_sum <= 1.0 + kWeightTolerance,
          "risk.take_profit_schedule fractions must not exceed 1");
  require(k.default_stop_loss_pct > 0.0,
          "risk.default_stop_loss_pct must be positive");
  require(k.trailing_activation_pct >= 0.0 && k.trailing_distance_pct > 0.0,
          "risk trailing parameters must be positive");
  require(k.dispatch_max_attempts >= 1,
          "risk.dispatch_max_attempts must be at least 1");
  require(k.dispatch_backoff_ms >= 0,
          "risk.dispatch_backoff_ms must be non-negative");
}

}  // namespace sigrisk
