#include "sigrisk/model/linear_softmax_model.hpp"

#include "sigrisk/domain/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace sigrisk {

LinearSoftmaxModel::LinearSoftmaxModel(std::string version,
                                       std::vector<std::vector<double>> weights,
                                       std::vector<double> bias)
    : version_(std::move(version)),
      weights_(std::move(weights)),
      bias_(std::move(bias)) {
  if (weights_.empty() || weights_.size() != bias_.size()) {
    throw ConfigError("LinearSoftmaxModel: " + std::to_string(weights_.size()) +
                      " weight rows for " + std::to_string(bias_.size()) +
                      " biases");
  }
  input_dimension_ = weights_.front().size();
  for (const auto& row : weights_) {
    if (row.size() != input_dimension_) {
      throw ConfigError("LinearSoftmaxModel: ragged weight matrix");
    }
  }
}

LinearSoftmaxModel LinearSoftmaxModel::from_json(const nlohmann::json& doc) {
  try {
    auto model = LinearSoftmaxModel(doc.value("version", std::string("linear")),
                                    doc.at("weights").get<std::vector<std::vector<double>>>(),
                                    doc.at("bias").get<std::vector<double>>());
    if (doc.contains("input_dimension") &&
        doc.at("input_dimension").get<std::size_t>() != model.input_dimension()) {
      throw ConfigError("LinearSoftmaxModel: input_dimension does not match weights");
    }
    return model;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("LinearSoftmaxModel: malformed weights: ") + e.what());
  }
}

LinearSoftmaxModel LinearSoftmaxModel::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open model weights: " + path);
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed model weights " + path + ": " + e.what());
  }
  LinearSoftmaxModel model = from_json(doc);
  std::cout << "[Model] loaded " << model.version() << " from " << path << " ("
            << model.input_dimension() << " -> " << model.output_dimension()
            << ")\n";
  return model;
}

std::vector<double> LinearSoftmaxModel::predict(
    const std::vector<double>& features) const {
  std::vector<double> out(bias_);
  const std::size_t n = std::min(features.size(), input_dimension_);
  for (std::size_t r = 0; r < weights_.size(); ++r) {
    for (std::size_t c = 0; c < n; ++c) {
      out[r] += weights_[r][c] * features[c];
    }
  }
  return out;
}

}  // namespace sigrisk
