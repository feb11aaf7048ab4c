#pragma once

#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/domain/prediction.hpp"
#include "sigrisk/domain/signal.hpp"
#include "sigrisk/time/i_time_provider.hpp"

namespace sigrisk {

// -----------------------------------------------------------------------------
// SignalReconciler: per-horizon predictions → one consolidated Signal
// -----------------------------------------------------------------------------
//
// @brief  The only constructor of domain::Signal in the pipeline.
//
// @details
// Rules, with w[h] the configured horizon weights (sum 1):
//
//   score      = Σ w[h] · {down: 0, flat: 1, up: 2}[direction[h]]
//   type       = SHORT if score < low_threshold,
//                LONG  if score > high_threshold, else NEUTRAL
//   majority   = direction with the most horizons; ties go to the direction
//                with the larger total weight, then to FLAT
//   agreement  = horizons voting the majority / 4
//   confidence = Σ w[h] · confidence[h] × agreement
//
// A LONG/SHORT signal is demoted to NEUTRAL when confidence < min_confidence
// or agreement < min_agreement.
//
// Levels, from the min and max predicted return across horizons:
//   LONG   sl_pct = clamp(max(-min_ret, 0), sl_min, sl_max)  stop = ref·(1 - sl_pct)
//          tp_pct = clamp(max( max_ret, 0), tp_min, tp_max)  tp_i = ref·(1 + tp_pct·scale_i)
//   SHORT  mirrored: stop from max_ret above ref, targets from -min_ret below.
//   NEUTRAL carries no levels.
//
// The primary horizon is the one with the largest w[h]·confidence[h] among
// horizons agreeing with the signal's direction (flat horizons for NEUTRAL);
// ties and empty sets fall back to the shortest horizon.
//
// Apart from created_at, expires_at and fingerprint (clock, clock + ttl,
// and the fingerprint bucket of created_at) the output is a pure function
// of the prediction.
//
// Thread model:
//   Immutable after construction; reconcile() is safe from any thread.
//   Reloading configuration means constructing a new instance.
// -----------------------------------------------------------------------------
class SignalReconciler {
 public:
  // Throws ConfigError for invalid configuration.
  SignalReconciler(ReconcilerConfig config, const ITimeProvider& clock);

  domain::Signal reconcile(const domain::ModelPrediction& prediction) const;

  const ReconcilerConfig& config() const { return config_; }

  static void validate(const ReconcilerConfig& config);

 private:
  void apply_levels(const domain::ModelPrediction& prediction,
                    domain::Signal& signal) const;
  domain::Horizon primary_horizon(const domain::ModelPrediction& prediction,
                                  domain::SignalType type) const;

  const ReconcilerConfig config_;
  const ITimeProvider& clock_;
};

}  // namespace sigrisk
