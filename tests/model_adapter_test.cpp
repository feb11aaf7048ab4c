// =============================================================================
// model_adapter_test.cpp
// =============================================================================
// Unit tests for sigrisk::ModelAdapter and sigrisk::LinearSoftmaxModel.
//
// Validates:
//   - output decoding into four ordered horizons
//   - probability handling: ready-made distributions pass through, logits go
//     through softmax, ties resolve to Flat
//   - every failure mode: feature count, output size, non-finite output,
//     slow inference, late result past the run deadline, and a model that
//     never returns within the bound
//   - LinearSoftmaxModel shape checks and its affine output
// =============================================================================

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/model/linear_softmax_model.hpp"
#include "sigrisk/model/model_adapter.hpp"
#include "sigrisk/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using sigrisk::domain::Direction;
using sigrisk::domain::Horizon;
using sigrisk::testing_support::HorizonOutput;
using sigrisk::testing_support::StubModel;
using sigrisk::testing_support::kEpochMs;
using sigrisk::testing_support::model_output;

namespace {

constexpr std::size_t kInputs = 4;

sigrisk::domain::FeatureVector features(std::size_t n = kInputs) {
  sigrisk::domain::FeatureVector fv;
  fv.symbol = "BTCUSDT";
  fv.as_of_ms = kEpochMs;
  fv.reference_price = 42000.0;
  fv.values.assign(n, 0.5);
  fv.names.assign(n, "f");
  return fv;
}

sigrisk::ModelConfig model_config(std::int64_t timeout_ms = 1000) {
  sigrisk::ModelConfig c;
  c.inference_timeout_ms = timeout_ms;
  return c;
}

}  // namespace

class ModelAdapterTest : public ::testing::Test {
 protected:
  sigrisk::SimulationTimeProvider clock{kEpochMs};
};

// -----------------------------------------------------------------------------
// 1. Returns, probabilities, direction, confidence and volatility land in
//    the right horizon slots, in ascending horizon order.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, DecodesFourHorizons) {
  StubModel model(kInputs, model_output({HorizonOutput{0.01, 0.1, 0.2, 0.7, 0.02},
                                         HorizonOutput{-0.02, 0.6, 0.3, 0.1, 0.03},
                                         HorizonOutput{0.0, 0.2, 0.5, 0.3, 0.04},
                                         HorizonOutput{0.05, 0.0, 0.0, 1.0, 0.05}}),
                  "v7");
  sigrisk::ModelAdapter adapter(model, clock, model_config());

  const auto p = adapter.infer(features());

  EXPECT_EQ(p.symbol, "BTCUSDT");
  EXPECT_EQ(p.as_of_ms, kEpochMs);
  EXPECT_DOUBLE_EQ(p.reference_price, 42000.0);
  EXPECT_EQ(p.model_version, "v7");

  EXPECT_EQ(p.horizons[0].horizon, Horizon::M15);
  EXPECT_EQ(p.horizons[3].horizon, Horizon::H12);

  EXPECT_EQ(p.horizons[0].direction, Direction::Up);
  EXPECT_DOUBLE_EQ(p.horizons[0].confidence, 0.7);
  EXPECT_DOUBLE_EQ(p.horizons[0].predicted_return, 0.01);
  EXPECT_DOUBLE_EQ(p.horizons[0].predicted_volatility, 0.02);

  EXPECT_EQ(p.horizons[1].direction, Direction::Down);
  EXPECT_DOUBLE_EQ(p.horizons[1].predicted_return, -0.02);
  EXPECT_EQ(p.horizons[2].direction, Direction::Flat);
  EXPECT_EQ(p.horizons[3].direction, Direction::Up);
  EXPECT_DOUBLE_EQ(p.horizons[3].confidence, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Scores that are not a distribution go through a stable softmax.
// -----------------------------------------------------------------------------
TEST(ModelAdapterStatics, SoftmaxForLogits) {
  const auto p = sigrisk::ModelAdapter::to_probabilities({{1000.0, 1001.0, 999.0}});
  const double sum = p[0] + p[1] + p[2];
  EXPECT_NEAR(sum, 1.0, 1e-12);
  for (double v : p) {
    EXPECT_TRUE(std::isfinite(v));
  }
  EXPECT_GT(p[1], p[0]);
  EXPECT_GT(p[0], p[2]);

  const auto passthrough = sigrisk::ModelAdapter::to_probabilities({{0.2, 0.3, 0.5}});
  EXPECT_DOUBLE_EQ(passthrough[2], 0.5);
}

// -----------------------------------------------------------------------------
// 3. A tie for the maximum probability is Flat, even between Down and Up.
// -----------------------------------------------------------------------------
TEST(ModelAdapterStatics, TieResolvesToFlat) {
  EXPECT_EQ(sigrisk::ModelAdapter::argmax_direction({{0.45, 0.1, 0.45}}), Direction::Flat);
  EXPECT_EQ(sigrisk::ModelAdapter::argmax_direction({{0.4, 0.4, 0.2}}), Direction::Flat);
  EXPECT_EQ(sigrisk::ModelAdapter::argmax_direction({{0.5, 0.2, 0.3}}), Direction::Down);
}

// -----------------------------------------------------------------------------
// 4. Feature count differing from the model's input dimension.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, FeatureCountMismatchThrows) {
  StubModel model(kInputs, sigrisk::testing_support::bullish_output());
  sigrisk::ModelAdapter adapter(model, clock, model_config());

  EXPECT_THROW(adapter.infer(features(kInputs + 1)), sigrisk::FeatureShapeMismatch);
  EXPECT_EQ(model.calls(), 0);
}

// -----------------------------------------------------------------------------
// 5. Output problems are ModelOutputError: wrong length at call time, or a
//    NaN/inf anywhere.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, BadOutputThrowsModelOutputError) {
  StubModel model(kInputs, sigrisk::testing_support::bullish_output());
  sigrisk::ModelAdapter adapter(model, clock, model_config());

  auto with_nan = sigrisk::testing_support::bullish_output();
  with_nan[7] = std::numeric_limits<double>::quiet_NaN();
  model.set_output(with_nan);
  EXPECT_THROW(adapter.infer(features()), sigrisk::ModelOutputError);

  auto with_inf = sigrisk::testing_support::bullish_output();
  with_inf[0] = std::numeric_limits<double>::infinity();
  model.set_output(with_inf);
  EXPECT_THROW(adapter.infer(features()), sigrisk::ModelOutputError);

  model.set_declared_output_dimension(sigrisk::ModelAdapter::kOutputDimension);
  model.set_output(std::vector<double>(19, 0.1));
  EXPECT_THROW(adapter.infer(features()), sigrisk::ModelOutputError);
}

// -----------------------------------------------------------------------------
// 6. A model that declares the wrong output size is refused up front.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, WrongDeclaredOutputIsConfigError) {
  StubModel model(kInputs, std::vector<double>(12, 0.0));
  EXPECT_THROW(sigrisk::ModelAdapter(model, clock, model_config()), sigrisk::ConfigError);

  StubModel ok(kInputs, sigrisk::testing_support::bullish_output());
  EXPECT_THROW(sigrisk::ModelAdapter(ok, clock, model_config(0)), sigrisk::ConfigError);
}

// -----------------------------------------------------------------------------
// 7. An inference slower than inference_timeout_ms is InferenceTimeout; one
//    that returns after the run deadline is RunCancelled.
// Why: The scheduler retries the first and abandons the second.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, SlowAndLateInference) {
  StubModel model(kInputs, sigrisk::testing_support::bullish_output());
  sigrisk::ModelAdapter adapter(model, clock, model_config(1000));

  model.set_on_predict([this] { clock.advance_by(1500); });
  EXPECT_THROW(adapter.infer(features()), sigrisk::InferenceTimeout);

  model.set_on_predict([this] { clock.advance_by(200); });
  const std::int64_t deadline = clock.now_ms() + 100;
  EXPECT_THROW(adapter.infer(features(), deadline), sigrisk::RunCancelled);

  // Already past the deadline: the model is never called.
  const int calls_before = model.calls();
  EXPECT_THROW(adapter.infer(features(), clock.now_ms()), sigrisk::RunCancelled);
  EXPECT_EQ(model.calls(), calls_before);

  model.set_on_predict(nullptr);
  EXPECT_NO_THROW(adapter.infer(features(), clock.now_ms() + 1000));
}

// -----------------------------------------------------------------------------
// 8. A model that does not return is abandoned at the bound instead of
//    blocking the caller: InferenceTimeout when the timeout is the nearer
//    bound, RunCancelled when the run deadline is.
// -----------------------------------------------------------------------------
TEST_F(ModelAdapterTest, HungModelIsAbandonedAtBound) {
  StubModel model(kInputs, sigrisk::testing_support::bullish_output());
  sigrisk::ModelAdapter adapter(model, clock, model_config(100));
  model.set_on_predict([] { std::this_thread::sleep_for(std::chrono::milliseconds(800)); });

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.infer(features()), sigrisk::InferenceTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(600));

  started = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.infer(features(), clock.now_ms() + 50), sigrisk::RunCancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(600));
}

// =============================================================================
// LinearSoftmaxModel
// =============================================================================

TEST(LinearSoftmaxModelTest, AffineOutput) {
  sigrisk::LinearSoftmaxModel model("lin-1", {{1.0, 2.0}, {0.0, -1.0}}, {0.5, 0.0});

  EXPECT_EQ(model.input_dimension(), 2u);
  EXPECT_EQ(model.output_dimension(), 2u);
  const auto out = model.predict({3.0, 4.0});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_DOUBLE_EQ(out[0], 0.5 + 3.0 + 8.0);
  EXPECT_DOUBLE_EQ(out[1], -4.0);
}

TEST(LinearSoftmaxModelTest, FromJsonValidatesShape) {
  const nlohmann::json good = {
      {"version", "lin-json"},
      {"input_dimension", 2},
      {"weights", {{1.0, 0.0}, {0.0, 1.0}}},
      {"bias", {0.0, 0.0}},
  };
  const auto model = sigrisk::LinearSoftmaxModel::from_json(good);
  EXPECT_EQ(model.version(), "lin-json");

  nlohmann::json ragged = good;
  ragged["weights"] = nlohmann::json::array(
      {nlohmann::json::array({1.0, 0.0}), nlohmann::json::array({1.0})});
  EXPECT_THROW(sigrisk::LinearSoftmaxModel::from_json(ragged), sigrisk::ConfigError);

  nlohmann::json short_bias = good;
  short_bias["bias"] = nlohmann::json::array({0.0});
  EXPECT_THROW(sigrisk::LinearSoftmaxModel::from_json(short_bias), sigrisk::ConfigError);

  nlohmann::json wrong_dim = good;
  wrong_dim["input_dimension"] = 3;
  EXPECT_THROW(sigrisk::LinearSoftmaxModel::from_json(wrong_dim), sigrisk::ConfigError);

  nlohmann::json missing = good;
  missing.erase("weights");
  EXPECT_THROW(sigrisk::LinearSoftmaxModel::from_json(missing), sigrisk::ConfigError);

  EXPECT_THROW(sigrisk::LinearSoftmaxModel::load("/nonexistent/weights.json"),
               sigrisk::ConfigError);
}
