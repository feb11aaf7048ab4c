#pragma once

#include "sigrisk/domain/prediction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigrisk {
namespace domain {

// -----------------------------------------------------------------------------
// SignalType
// -----------------------------------------------------------------------------
enum class SignalType {
  Long,
  Short,
  Neutral,
};

const char* to_string(SignalType t);

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
//
// @brief  The consolidated trading decision for one symbol at one point in
//         time.
//
// @details
// Constructed exclusively by SignalReconciler. Everything except created_at,
// expires_at and fingerprint is a pure function of the ModelPrediction that
// produced it; those three are deterministic functions of the prediction
// plus the clock (fingerprint uses the 5-minute bucket of created_at).
//
// Suggested levels are absent for NEUTRAL signals. take_profit_prices is
// ordered nearest-first.
//
// fingerprint identifies (symbol, type, strategy, 5-minute bucket). Two
// signals with the same fingerprint are duplicates; the scheduler emits at
// most one per fingerprint while it is unexpired.
// -----------------------------------------------------------------------------
struct Signal {
  std::string symbol;
  SignalType type{SignalType::Neutral};
  double confidence{0.0};          // [0, 1], after the agreement penalty
  double agreement_ratio{0.0};     // fraction of horizons voting the majority
  double direction_score{1.0};     // weighted {0,1,2} score
  Horizon primary_horizon{Horizon::M15};
  double reference_price{0.0};     // close the prediction was made at
  std::optional<double> stop_loss_price;
  std::vector<double> take_profit_prices;
  std::string strategy_id;
  std::string fingerprint;
  std::int64_t created_at_ms{0};
  std::int64_t expires_at_ms{0};
};

}  // namespace domain
}  // namespace sigrisk
