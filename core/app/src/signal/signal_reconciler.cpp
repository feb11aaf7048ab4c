#include "sigrisk/signal/signal_reconciler.hpp"

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/signal/fingerprint.hpp"
#include "sigrisk/time/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace sigrisk {

namespace {

constexpr double kWeightTolerance = 1e-6;

double direction_value(domain::Direction d) {
  return static_cast<double>(static_cast<int>(d));
}

bool agrees(domain::Direction d, domain::SignalType type) {
  switch (type) {
    case domain::SignalType::Long:    return d == domain::Direction::Up;
    case domain::SignalType::Short:   return d == domain::Direction::Down;
    case domain::SignalType::Neutral: return d == domain::Direction::Flat;
  }
  return false;
}

}  // namespace

void SignalReconciler::validate(const ReconcilerConfig& c) {
  double sum = 0.0;
  for (double w : c.horizon_weights) {
    if (!(w >= 0.0)) {
      throw ConfigError("Reconciler: horizon weights must be non-negative");
    }
    sum += w;
  }
  if (std::abs(sum - 1.0) > kWeightTolerance) {
    throw ConfigError("Reconciler: horizon weights sum to " + std::to_string(sum) +
                      ", expected 1");
  }
  if (!(c.low_threshold >= 0.0 && c.low_threshold < c.high_threshold &&
        c.high_threshold <= 2.0)) {
    throw ConfigError("Reconciler: thresholds must satisfy 0 <= low < high <= 2");
  }
  if (c.min_confidence < 0.0 || c.min_confidence > 1.0 || c.min_agreement < 0.0 ||
      c.min_agreement > 1.0) {
    throw ConfigError("Reconciler: confidence and agreement floors must be in [0, 1]");
  }
  if (!(c.sl_min_pct > 0.0 && c.sl_min_pct <= c.sl_max_pct && c.sl_max_pct < 1.0)) {
    throw ConfigError("Reconciler: stop-loss bounds must satisfy 0 < min <= max < 1");
  }
  if (!(c.tp_min_pct > 0.0 && c.tp_min_pct <= c.tp_max_pct)) {
    throw ConfigError("Reconciler: take-profit bounds must satisfy 0 < min <= max");
  }
  if (c.take_profit_scales.empty()) {
    throw ConfigError("Reconciler: take_profit_scales must not be empty");
  }
  double previous = 0.0;
  for (double s : c.take_profit_scales) {
    if (!(s > previous)) {
      throw ConfigError("Reconciler: take_profit_scales must be positive and ascending");
    }
    previous = s;
  }
  // Short targets sit at ref * (1 - tp_pct * scale) and must stay positive.
  if (c.tp_max_pct * previous >= 1.0) {
    throw ConfigError("Reconciler: tp_max_pct * largest scale must be below 1");
  }
  if (c.strategy_id.empty()) {
    throw ConfigError("Reconciler: strategy_id must not be empty");
  }
  if (c.signal_ttl_ms <= 0 || c.fingerprint_bucket_ms <= 0) {
    throw ConfigError("Reconciler: signal_ttl_ms and fingerprint_bucket_ms must be positive");
  }
}

SignalReconciler::SignalReconciler(ReconcilerConfig config,
                                   const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock) {
  validate(config_);
}

// -----------------------------------------------------------------------------
// reconcile()
// -----------------------------------------------------------------------------
domain::Signal SignalReconciler::reconcile(
    const domain::ModelPrediction& prediction) const {
  const auto& w = config_.horizon_weights;

  double score = 0.0;
  double weighted_confidence = 0.0;
  std::array<int, 3> votes{{0, 0, 0}};
  std::array<double, 3> vote_weight{{0.0, 0.0, 0.0}};
  for (std::size_t h = 0; h < domain::kHorizonCount; ++h) {
    const domain::HorizonPrediction& hp = prediction.horizons[h];
    const auto cls = static_cast<std::size_t>(hp.direction);
    score += w[h] * direction_value(hp.direction);
    weighted_confidence += w[h] * hp.confidence;
    ++votes[cls];
    vote_weight[cls] += w[h];
  }

  // Majority by count, then by weight; an unresolved tie is FLAT.
  domain::Direction majority = domain::Direction::Flat;
  {
    const int best = *std::max_element(votes.begin(), votes.end());
    double best_weight = -1.0;
    bool tied = false;
    for (std::size_t cls = 0; cls < votes.size(); ++cls) {
      if (votes[cls] != best) {
        continue;
      }
      if (vote_weight[cls] > best_weight + kWeightTolerance) {
        best_weight = vote_weight[cls];
        majority = static_cast<domain::Direction>(cls);
        tied = false;
      } else if (std::abs(vote_weight[cls] - best_weight) <= kWeightTolerance) {
        tied = true;
      }
    }
    if (tied) {
      majority = domain::Direction::Flat;
    }
  }
  const double agreement =
      static_cast<double>(votes[static_cast<std::size_t>(majority)]) /
      static_cast<double>(domain::kHorizonCount);

  domain::SignalType type = domain::SignalType::Neutral;
  if (score < config_.low_threshold) {
    type = domain::SignalType::Short;
  } else if (score > config_.high_threshold) {
    type = domain::SignalType::Long;
  }

  const double confidence = std::clamp(weighted_confidence * agreement, 0.0, 1.0);
  if (type != domain::SignalType::Neutral &&
      (confidence < config_.min_confidence || agreement < config_.min_agreement)) {
    type = domain::SignalType::Neutral;
  }

  domain::Signal signal;
  signal.symbol = prediction.symbol;
  signal.type = type;
  signal.confidence = confidence;
  signal.agreement_ratio = agreement;
  signal.direction_score = score;
  signal.primary_horizon = primary_horizon(prediction, type);
  signal.reference_price = prediction.reference_price;
  signal.strategy_id = config_.strategy_id;
  apply_levels(prediction, signal);

  signal.created_at_ms = clock_.now_ms();
  signal.expires_at_ms = signal.created_at_ms + config_.signal_ttl_ms;
  signal.fingerprint = signal_fingerprint(
      signal.symbol, signal.type, signal.strategy_id,
      floor_to_bucket(signal.created_at_ms, config_.fingerprint_bucket_ms));
  return signal;
}

void SignalReconciler::apply_levels(const domain::ModelPrediction& prediction,
                                    domain::Signal& signal) const {
  if (signal.type == domain::SignalType::Neutral) {
    return;
  }

  double min_ret = prediction.horizons.front().predicted_return;
  double max_ret = min_ret;
  for (const auto& hp : prediction.horizons) {
    min_ret = std::min(min_ret, hp.predicted_return);
    max_ret = std::max(max_ret, hp.predicted_return);
  }

  const double ref = prediction.reference_price;
  const bool is_long = signal.type == domain::SignalType::Long;
  const double adverse = is_long ? std::max(-min_ret, 0.0) : std::max(max_ret, 0.0);
  const double favourable = is_long ? std::max(max_ret, 0.0) : std::max(-min_ret, 0.0);
  const double sl_pct = std::clamp(adverse, config_.sl_min_pct, config_.sl_max_pct);
  const double tp_pct = std::clamp(favourable, config_.tp_min_pct, config_.tp_max_pct);

  signal.stop_loss_price = is_long ? ref * (1.0 - sl_pct) : ref * (1.0 + sl_pct);
  signal.take_profit_prices.reserve(config_.take_profit_scales.size());
  for (double scale : config_.take_profit_scales) {
    signal.take_profit_prices.push_back(is_long ? ref * (1.0 + tp_pct * scale)
                                                : ref * (1.0 - tp_pct * scale));
  }
}

domain::Horizon SignalReconciler::primary_horizon(
    const domain::ModelPrediction& prediction, domain::SignalType type) const {
  domain::Horizon best = domain::Horizon::M15;
  double best_strength = -1.0;
  for (std::size_t h = 0; h < domain::kHorizonCount; ++h) {
    const domain::HorizonPrediction& hp = prediction.horizons[h];
    if (!agrees(hp.direction, type)) {
      continue;
    }
    const double strength = config_.horizon_weights[h] * hp.confidence;
    if (strength > best_strength) {
      best_strength = strength;
      best = domain::kAllHorizons[h];
    }
  }
  return best;
}

}  // namespace sigrisk
