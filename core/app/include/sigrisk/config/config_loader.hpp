#pragma once

#include "sigrisk/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from JSON with nlohmann::json.
//
// @details
// File layout (every section and every key is optional):
//
//   {
//     "cache":       { "max_candles": 1000, "ttl_ms": 3600000, ... },
//     "features":    { "lookback": 96 },
//     "model":       { "weights_path": "model.json", ... },
//     "reconciler":  { "horizon_weights": [0.4, 0.3, 0.2, 0.1], ... },
//     "scheduler":   { "symbols": ["BTCUSDT"], "timeframe": "15m", ... },
//     "risk":        { "take_profit_schedule": [[0.01, 0.3], ...], ... },
//     "network":     { "price_tick_endpoint": "tcp://...", ... },
//     "persistence": { "jsonl_path": "events.jsonl" }
//   }
//
// Keys are the EngineConfig member names. Unknown keys are ignored; missing
// keys keep their defaults. A value of the wrong JSON type, or a value that
// fails validation (non-positive sizes, bad timeframe string, weights that
// do not sum to 1, a take-profit schedule whose fractions exceed 1, ...)
// raises ConfigError naming the offending key.
// -----------------------------------------------------------------------------

EngineConfig parse_engine_config(const nlohmann::json& root);

// Reads and parses the file. Throws ConfigError if it cannot be opened or is
// not valid JSON.
EngineConfig load_engine_config(const std::string& path);

// Checks cross-field constraints. Called by parse_engine_config(); exposed so
// code that builds an EngineConfig by hand can run the same checks.
void validate_engine_config(const EngineConfig& config);

}  // namespace sigrisk
