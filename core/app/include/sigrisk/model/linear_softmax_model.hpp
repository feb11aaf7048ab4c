#pragma once

#include "sigrisk/model/i_prediction_model.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// LinearSoftmaxModel: deterministic affine model loaded from JSON
// -----------------------------------------------------------------------------
//
// @brief  output = W · features + b, with W of shape (outputs × inputs).
//
// @details
// The executable runs this model when no external inference service is
// wired in. Class-score rows produce logits; ModelAdapter turns them into
// probabilities.
//
// Weights file:
//   {
//     "version": "linear-2024-06",
//     "input_dimension": 44,
//     "weights": [[...44 doubles...], ... 20 rows],
//     "bias": [...20 doubles...]
//   }
// Shape errors throw ConfigError at load time.
//
// Thread model:
//   Immutable after construction; predict() is safe concurrently.
// -----------------------------------------------------------------------------
class LinearSoftmaxModel : public IPredictionModel {
 public:
  LinearSoftmaxModel(std::string version, std::vector<std::vector<double>> weights,
                     std::vector<double> bias);

  static LinearSoftmaxModel from_json(const nlohmann::json& doc);
  static LinearSoftmaxModel load(const std::string& path);

  std::size_t input_dimension() const override { return input_dimension_; }
  std::size_t output_dimension() const override { return bias_.size(); }
  std::vector<double> predict(const std::vector<double>& features) const override;
  std::string version() const override { return version_; }

 private:
  std::string version_;
  std::vector<std::vector<double>> weights_;
  std::vector<double> bias_;
  std::size_t input_dimension_{0};
};

}  // namespace sigrisk
