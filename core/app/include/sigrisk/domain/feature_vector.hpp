#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sigrisk {
namespace domain {

// -----------------------------------------------------------------------------
// FeatureVector
// -----------------------------------------------------------------------------
//
// @brief  Fixed-length ordered sequence of named numeric features computed
//         from one candle window.
//
// @details
// Derived data: never the source of truth, always recomputable from the
// window that produced it. `values[i]` is the feature named `names[i]`; the
// ordering is fixed by FeatureEngine::feature_names() and is what the model
// was trained against.
//
// as_of_ms is the open time of the last candle in the window and
// reference_price its close. Both travel with the prediction so the
// SignalReconciler can turn predicted returns into price levels without
// reaching back into the cache.
// -----------------------------------------------------------------------------
struct FeatureVector {
  std::string symbol;
  std::int64_t as_of_ms{0};
  double reference_price{0.0};
  std::vector<std::string> names;
  std::vector<double> values;
};

}  // namespace domain
}  // namespace sigrisk
