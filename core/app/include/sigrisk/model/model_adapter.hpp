#pragma once

#include "sigrisk/concurrent/worker_pool.hpp"
#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/domain/feature_vector.hpp"
#include "sigrisk/domain/prediction.hpp"
#include "sigrisk/model/i_prediction_model.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// ModelAdapter: shape checks and output decoding around IPredictionModel
// -----------------------------------------------------------------------------
//
// @brief  Turns a FeatureVector into a ModelPrediction.
//
// @details
// Output layout (20 values):
//   [0, 4)    predicted return per horizon, 15m / 1h / 4h / 12h
//   [4, 16)   class scores per horizon as (down, flat, up) triples
//   [16, 20)  predicted volatility per horizon
//
// Class scores that already form a probability distribution (each in
// [0, 1], summing to 1 within 1e-6) are used as-is; anything else goes
// through a numerically stable softmax. Direction is the argmax class; a
// tie for the maximum resolves to Flat. Confidence is the max probability.
//
// Failure modes:
//   features.size() != input_dimension()          → FeatureShapeMismatch
//   output size != 20, or any non-finite value    → ModelOutputError
//   no result by the run deadline                 → RunCancelled
//   no result within inference_timeout_ms         → InferenceTimeout
//
// predict() runs on the adapter's own WorkerPool and infer() waits on its
// future for at most min(inference_timeout_ms, deadline - now). A model
// that hangs is abandoned there: its thread stays busy until predict()
// returns, and the late result is discarded. The same two checks are
// repeated against the injected clock when the result arrives, which is
// what catches a simulated clock moved forward inside predict().
//
// Thread model:
//   infer() may run concurrently for different symbols provided the model
//   honours the IPredictionModel contract. At most inference_threads
//   predictions run at once; further calls queue behind them and still
//   give up at their own bound.
//
// Ownership:
//   Non-owning references to the model and the clock; both must outlive
//   the adapter. Owns the inference pool; the destructor joins it, so it
//   waits for any prediction still running.
// -----------------------------------------------------------------------------
class ModelAdapter {
 public:
  static constexpr std::size_t kOutputDimension = 5 * domain::kHorizonCount;

  // Throws ConfigError if the model's output_dimension() is not 20.
  ModelAdapter(const IPredictionModel& model, const ITimeProvider& clock,
               ModelConfig config);
  ~ModelAdapter();

  ModelAdapter(const ModelAdapter&) = delete;
  ModelAdapter& operator=(const ModelAdapter&) = delete;

  domain::ModelPrediction infer(const domain::FeatureVector& features,
                                std::int64_t deadline_ms = 0) const;

  std::size_t input_dimension() const { return model_.input_dimension(); }

  // Exposed for tests: probability triple and argmax rule used by infer().
  static std::array<double, 3> to_probabilities(const std::array<double, 3>& scores);
  static domain::Direction argmax_direction(const std::array<double, 3>& probabilities);

 private:
  domain::ModelPrediction decode(const domain::FeatureVector& features,
                                 const std::vector<double>& raw) const;

  const IPredictionModel& model_;
  const ITimeProvider& clock_;
  const ModelConfig config_;
  std::unique_ptr<WorkerPool> pool_;
};

}  // namespace sigrisk
