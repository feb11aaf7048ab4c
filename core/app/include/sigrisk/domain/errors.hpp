#pragma once

#include <stdexcept>
#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// SigriskError: root of the pipeline's exception taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every failure raised by a pipeline component derives from this
//         class so that run boundaries (SignalScheduler, the risk loop,
//         the persistence worker) can catch one type and log it.
//
// @details
// The taxonomy mirrors how each failure must be handled:
//
//   InsufficientHistory / InsufficientWindow
//       Not enough data yet. Not fatal; the symbol is retried next tick.
//   FeatureShapeMismatch
//       Model/feature configuration drift. Fatal for the run, logged loudly.
//   ModelOutputError
//       The model returned an array that cannot be decoded.
//   DataUnavailable (and RateLimited, which is-a DataUnavailable)
//       Upstream failure. The run is skipped for this tick; RateLimited is
//       retried with backoff inside the tick when time allows.
//   InferenceTimeout
//       One model call took longer than inference_timeout_ms. Retryable
//       while the run deadline allows.
//   RunCancelled
//       The run exceeded its deadline and was abandoned.
//   ExecutionRejected
//       The execution collaborator refused an order. Propagates to the
//       caller of the PositionRiskManager.
//   ConfigError
//       Invalid configuration value detected at load or construction time.
//
// Thread model:
//   Exceptions are value types; safe to throw across any thread boundary
//   that the caller explicitly marshals (e.g. std::exception_ptr).
// -----------------------------------------------------------------------------
class SigriskError : public std::runtime_error {
 public:
  explicit SigriskError(const std::string& message)
      : std::runtime_error(message) {}
};

class InsufficientHistory : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class InsufficientWindow : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class FeatureShapeMismatch : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class ModelOutputError : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class DataUnavailable : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

// Upstream asked us to back off. Derived from DataUnavailable so that code
// paths which only care about "no data this tick" handle it uniformly.
class RateLimited : public DataUnavailable {
 public:
  using DataUnavailable::DataUnavailable;
};

class InferenceTimeout : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class RunCancelled : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class ExecutionRejected : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

class ConfigError : public SigriskError {
 public:
  using SigriskError::SigriskError;
};

}  // namespace sigrisk
