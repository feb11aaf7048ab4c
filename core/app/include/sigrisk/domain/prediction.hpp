#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sigrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Horizon
// -----------------------------------------------------------------------------
// Forward-looking windows the model predicts, in ascending order. The
// numeric value doubles as the index into per-horizon arrays.
// -----------------------------------------------------------------------------
enum class Horizon : std::size_t {
  M15 = 0,
  H1 = 1,
  H4 = 2,
  H12 = 3,
};

inline constexpr std::size_t kHorizonCount = 4;

inline constexpr std::array<Horizon, kHorizonCount> kAllHorizons = {
    Horizon::M15, Horizon::H1, Horizon::H4, Horizon::H12};

const char* to_string(Horizon h);

// Parses "15m" / "1h" / "4h" / "12h". Throws ConfigError otherwise.
Horizon parse_horizon(const std::string& text);

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Class order matches the model's output layout and the reconciler's score
// mapping {down: 0, flat: 1, up: 2}.
// -----------------------------------------------------------------------------
enum class Direction {
  Down = 0,
  Flat = 1,
  Up = 2,
};

const char* to_string(Direction d);

// -----------------------------------------------------------------------------
// HorizonPrediction
// -----------------------------------------------------------------------------
// One decoded horizon: predicted fractional return (0.01 == +1%), the
// direction class with its probability triple, and the confidence (max class
// probability). predicted_volatility is informational.
// -----------------------------------------------------------------------------
struct HorizonPrediction {
  Horizon horizon{Horizon::M15};
  double predicted_return{0.0};
  Direction direction{Direction::Flat};
  std::array<double, 3> probabilities{{0.0, 1.0, 0.0}};  // down, flat, up
  double confidence{0.0};
  double predicted_volatility{0.0};
};

// -----------------------------------------------------------------------------
// ModelPrediction
// -----------------------------------------------------------------------------
//
// @brief  Immutable result of one inference call.
//
// @details
// Produced by ModelAdapter::infer() and consumed by SignalReconciler.
// `horizons[static_cast<size_t>(h)]` holds horizon h; entries are always in
// ascending horizon order.
// -----------------------------------------------------------------------------
struct ModelPrediction {
  std::string symbol;
  std::int64_t as_of_ms{0};
  double reference_price{0.0};
  std::string model_version;
  std::array<HorizonPrediction, kHorizonCount> horizons{};
};

}  // namespace domain
}  // namespace sigrisk
