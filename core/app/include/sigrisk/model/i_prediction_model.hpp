#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// IPredictionModel: the opaque trained model
// -----------------------------------------------------------------------------
//
// @brief  Fixed-shape numeric function: input_dimension() doubles in,
//         output_dimension() doubles out.
//
// @details
// The pipeline never looks inside the model. ModelAdapter owns the contract
// for what the output array means (see model_adapter.hpp).
//
// Thread model:
//   predict() is called concurrently from SignalScheduler workers, one call
//   per symbol run. Implementations must be safe for concurrent const use.
// -----------------------------------------------------------------------------
class IPredictionModel {
 public:
  virtual ~IPredictionModel() = default;

  virtual std::size_t input_dimension() const = 0;
  virtual std::size_t output_dimension() const = 0;
  virtual std::vector<double> predict(const std::vector<double>& features) const = 0;
  virtual std::string version() const = 0;
};

}  // namespace sigrisk
