#include "sigrisk/model/model_adapter.hpp"

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <string>
#include <utility>

namespace sigrisk {

namespace {

constexpr double kDistributionTolerance = 1e-6;
constexpr std::size_t kReturnsOffset = 0;
constexpr std::size_t kScoresOffset = domain::kHorizonCount;
constexpr std::size_t kVolatilityOffset = 4 * domain::kHorizonCount;

}  // namespace

ModelAdapter::ModelAdapter(const IPredictionModel& model,
                           const ITimeProvider& clock, ModelConfig config)
    : model_(model), clock_(clock), config_(std::move(config)) {
  if (model_.output_dimension() != kOutputDimension) {
    throw ConfigError("ModelAdapter: model output dimension is " +
                      std::to_string(model_.output_dimension()) +
                      ", expected " + std::to_string(kOutputDimension));
  }
  if (config_.inference_timeout_ms <= 0 || config_.inference_threads == 0) {
    throw ConfigError(
        "ModelAdapter: inference_timeout_ms and inference_threads must be positive");
  }
  pool_ = std::make_unique<WorkerPool>(config_.inference_threads);
}

ModelAdapter::~ModelAdapter() { pool_->shutdown(); }

std::array<double, 3> ModelAdapter::to_probabilities(
    const std::array<double, 3>& scores) {
  double sum = 0.0;
  bool in_unit_range = true;
  for (double s : scores) {
    sum += s;
    in_unit_range = in_unit_range && s >= 0.0 && s <= 1.0;
  }
  if (in_unit_range && std::abs(sum - 1.0) <= kDistributionTolerance) {
    return scores;
  }

  const double peak = *std::max_element(scores.begin(), scores.end());
  std::array<double, 3> out{};
  double total = 0.0;
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = std::exp(scores[i] - peak);
    total += out[i];
  }
  for (double& p : out) {
    p /= total;
  }
  return out;
}

domain::Direction ModelAdapter::argmax_direction(
    const std::array<double, 3>& probabilities) {
  const double peak = *std::max_element(probabilities.begin(), probabilities.end());
  std::size_t winners = 0;
  std::size_t winner = 1;
  for (std::size_t i = 0; i < probabilities.size(); ++i) {
    if (probabilities[i] == peak) {
      ++winners;
      winner = i;
    }
  }
  if (winners != 1) {
    return domain::Direction::Flat;
  }
  return static_cast<domain::Direction>(winner);
}

// -----------------------------------------------------------------------------
// infer()
// -----------------------------------------------------------------------------
// A run already past its deadline never reaches the model. Otherwise the
// wait is bounded by whichever of the timeout and the deadline comes first,
// and that bound decides which error a missing result becomes.
// -----------------------------------------------------------------------------
domain::ModelPrediction ModelAdapter::infer(const domain::FeatureVector& features,
                                            std::int64_t deadline_ms) const {
  const std::size_t expected = model_.input_dimension();
  if (features.values.size() != expected) {
    throw FeatureShapeMismatch("ModelAdapter: " + features.symbol + " has " +
                               std::to_string(features.values.size()) +
                               " features, model " + model_.version() +
                               " expects " + std::to_string(expected));
  }

  const std::int64_t started = clock_.now_ms();
  if (deadline_ms > 0 && started >= deadline_ms) {
    throw RunCancelled("ModelAdapter: " + features.symbol +
                       " run deadline passed before inference");
  }

  std::int64_t budget_ms = config_.inference_timeout_ms;
  const bool deadline_bound = deadline_ms > 0 && deadline_ms - started < budget_ms;
  if (deadline_bound) {
    budget_ms = deadline_ms - started;
  }

  const IPredictionModel& model = model_;
  std::future<std::vector<double>> pending =
      pool_->submit([&model, values = features.values] { return model.predict(values); });
  if (pending.wait_for(to_duration(budget_ms)) != std::future_status::ready) {
    if (deadline_bound) {
      throw RunCancelled("ModelAdapter: " + features.symbol +
                         " inference still running at the run deadline");
    }
    throw InferenceTimeout("ModelAdapter: " + features.symbol +
                           " inference gave no result within " +
                           std::to_string(budget_ms) + " ms");
  }
  std::vector<double> raw = pending.get();

  const std::int64_t finished = clock_.now_ms();
  if (deadline_ms > 0 && finished > deadline_ms) {
    throw RunCancelled("ModelAdapter: " + features.symbol +
                       " inference returned after the run deadline");
  }
  if (finished - started > config_.inference_timeout_ms) {
    throw InferenceTimeout("ModelAdapter: " + features.symbol + " inference took " +
                           std::to_string(finished - started) + " ms");
  }

  return decode(features, raw);
}

domain::ModelPrediction ModelAdapter::decode(const domain::FeatureVector& features,
                                             const std::vector<double>& raw) const {
  if (raw.size() != kOutputDimension) {
    throw ModelOutputError("ModelAdapter: model returned " +
                           std::to_string(raw.size()) + " values, expected " +
                           std::to_string(kOutputDimension));
  }
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (!std::isfinite(raw[i])) {
      throw ModelOutputError("ModelAdapter: output[" + std::to_string(i) +
                             "] is not finite");
    }
  }

  domain::ModelPrediction prediction;
  prediction.symbol = features.symbol;
  prediction.as_of_ms = features.as_of_ms;
  prediction.reference_price = features.reference_price;
  prediction.model_version = model_.version();

  for (std::size_t h = 0; h < domain::kHorizonCount; ++h) {
    const std::size_t base = kScoresOffset + 3 * h;
    const std::array<double, 3> scores{{raw[base], raw[base + 1], raw[base + 2]}};

    domain::HorizonPrediction& out = prediction.horizons[h];
    out.horizon = domain::kAllHorizons[h];
    out.predicted_return = raw[kReturnsOffset + h];
    out.probabilities = to_probabilities(scores);
    out.direction = argmax_direction(out.probabilities);
    out.confidence = *std::max_element(out.probabilities.begin(),
                                       out.probabilities.end());
    out.predicted_volatility = raw[kVolatilityOffset + h];
  }
  return prediction;
}

}  // namespace sigrisk
