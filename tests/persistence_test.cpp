// =============================================================================
// persistence_test.cpp
// =============================================================================
// Unit tests for the JSON codec, sigrisk::JsonLinesPersistenceSink and
// sigrisk::AsyncPersistenceWriter.
//
// Validates:
//   - signal / position / position-event field layout, nulls for absent
//     optionals
//   - one JSON object per line, appended across sink instances
//   - the async writer drains everything accepted before stop(), survives a
//     throwing sink, and drops records offered after stop()
// =============================================================================

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/persistence/async_persistence_writer.hpp"
#include "sigrisk/persistence/json_codec.hpp"
#include "sigrisk/persistence/json_lines_sink.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using sigrisk::testing_support::kEpochMs;

namespace {

sigrisk::domain::Signal long_signal() {
  sigrisk::domain::Signal s;
  s.symbol = "BTCUSDT";
  s.type = sigrisk::domain::SignalType::Long;
  s.confidence = 0.72;
  s.agreement_ratio = 0.75;
  s.direction_score = 1.9;
  s.primary_horizon = sigrisk::domain::Horizon::H1;
  s.reference_price = 42000.0;
  s.stop_loss_price = 41580.0;
  s.take_profit_prices = {42840.0};
  s.strategy_id = "ml_multi_horizon";
  s.fingerprint = "00112233445566ff";
  s.created_at_ms = kEpochMs;
  s.expires_at_ms = kEpochMs + 15 * 60 * 1000;
  return s;
}

sigrisk::domain::PositionEvent closed_event() {
  sigrisk::domain::Position p;
  p.id = "pos-1";
  p.symbol = "BTCUSDT";
  p.side = sigrisk::domain::PositionSide::Short;
  p.entry_price = 100.0;
  p.quantity = 2.0;
  p.stop_loss_price = 102.0;
  p.take_profits = {{99.0, 0.5, true}, {98.0, 0.5, true}};
  p.status = sigrisk::domain::PositionStatus::Closed;
  p.closed_fraction = 1.0;
  p.exit_price = 98.0;

  sigrisk::domain::PositionEvent e;
  e.kind = sigrisk::domain::PositionEventKind::Closed;
  e.position = p;
  e.price = 98.0;
  e.fraction = 0.5;
  e.reason = "take_profit";
  e.timestamp_ms = kEpochMs + 1;
  return e;
}

std::vector<nlohmann::json> read_lines(const std::string& path) {
  std::vector<nlohmann::json> out;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    out.push_back(nlohmann::json::parse(line));
  }
  return out;
}

std::string temp_path(const std::string& name) {
  const std::string path = ::testing::TempDir() + name;
  std::remove(path.c_str());
  return path;
}

// In-memory sink; throws on signals whose symbol is "BOOM".
class RecordingSink final : public sigrisk::IPersistenceSink {
 public:
  void save_signal(const sigrisk::domain::Signal& signal) override {
    if (signal.symbol == "BOOM") {
      throw std::runtime_error("disk full");
    }
    std::lock_guard lock(mutex_);
    order_.push_back("signal:" + signal.symbol);
  }

  void save_position_event(const sigrisk::domain::PositionEvent& event) override {
    std::lock_guard lock(mutex_);
    order_.push_back("event:" + event.position.id);
  }

  std::vector<std::string> order() const {
    std::lock_guard lock(mutex_);
    return order_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> order_;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Signal encoding: enum strings, levels, and a null stop when absent.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SignalFields) {
  nlohmann::json j = long_signal();

  EXPECT_EQ(j.at("symbol"), "BTCUSDT");
  EXPECT_EQ(j.at("signal_type"), "LONG");
  EXPECT_EQ(j.at("primary_horizon"), "1h");
  EXPECT_DOUBLE_EQ(j.at("confidence").get<double>(), 0.72);
  EXPECT_DOUBLE_EQ(j.at("stop_loss_price").get<double>(), 41580.0);
  EXPECT_EQ(j.at("take_profit_prices").size(), 1u);
  EXPECT_EQ(j.at("fingerprint"), "00112233445566ff");
  EXPECT_EQ(j.at("expires_at_ms").get<std::int64_t>(), kEpochMs + 15 * 60 * 1000);

  auto neutral = long_signal();
  neutral.type = sigrisk::domain::SignalType::Neutral;
  neutral.stop_loss_price.reset();
  neutral.take_profit_prices.clear();
  nlohmann::json n = neutral;
  EXPECT_EQ(n.at("signal_type"), "NEUTRAL");
  EXPECT_TRUE(n.at("stop_loss_price").is_null());
  EXPECT_TRUE(n.at("take_profit_prices").is_array());
  EXPECT_TRUE(n.at("take_profit_prices").empty());
}

// -----------------------------------------------------------------------------
// 2. Position events nest the position snapshot with its ladder.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, PositionEventFields) {
  nlohmann::json j = closed_event();

  EXPECT_EQ(j.at("kind"), "CLOSED");
  EXPECT_EQ(j.at("reason"), "take_profit");
  const auto& p = j.at("position");
  EXPECT_EQ(p.at("id"), "pos-1");
  EXPECT_EQ(p.at("side"), "SHORT");
  EXPECT_EQ(p.at("status"), "CLOSED");
  EXPECT_DOUBLE_EQ(p.at("exit_price").get<double>(), 98.0);
  ASSERT_EQ(p.at("take_profits").size(), 2u);
  EXPECT_TRUE(p.at("take_profits")[0].at("filled").get<bool>());
  EXPECT_FALSE(p.at("trailing").at("active").get<bool>());

  auto open = closed_event();
  open.position.exit_price.reset();
  nlohmann::json o = open;
  EXPECT_TRUE(o.at("position").at("exit_price").is_null());
}

// -----------------------------------------------------------------------------
// 3. The JSON-lines sink writes one typed object per line and appends to an
//    existing file.
// -----------------------------------------------------------------------------
TEST(JsonLinesSinkTest, AppendsOneObjectPerLine) {
  const std::string path = temp_path("sigrisk_sink_test.jsonl");
  {
    sigrisk::JsonLinesPersistenceSink sink(path);
    sink.save_signal(long_signal());
    sink.save_position_event(closed_event());
  }
  {
    sigrisk::JsonLinesPersistenceSink sink(path);
    sink.save_signal(long_signal());
  }

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].at("type"), "signal");
  EXPECT_EQ(lines[0].at("data").at("symbol"), "BTCUSDT");
  EXPECT_EQ(lines[1].at("type"), "position_event");
  EXPECT_EQ(lines[1].at("data").at("position").at("id"), "pos-1");
  EXPECT_EQ(lines[2].at("type"), "signal");
  std::remove(path.c_str());
}

TEST(JsonLinesSinkTest, UnwritablePathIsConfigError) {
  EXPECT_THROW(sigrisk::JsonLinesPersistenceSink("/nonexistent-dir/x/events.jsonl"),
               sigrisk::ConfigError);
}

// -----------------------------------------------------------------------------
// 4. The writer keeps order, counts a failing record without dying, and
//    drains everything accepted before stop().
// Why: Persistence failures must never reach the scheduler or risk thread.
// -----------------------------------------------------------------------------
TEST(AsyncPersistenceWriterTest, DrainsInOrderAndSurvivesSinkFailure) {
  RecordingSink sink;
  sigrisk::AsyncPersistenceWriter writer(sink);

  // Accepted before start(): written once the thread runs.
  writer.save_signal(long_signal());
  writer.start();

  auto boom = long_signal();
  boom.symbol = "BOOM";
  writer.save_signal(boom);
  writer.save_position_event(closed_event());
  auto eth = long_signal();
  eth.symbol = "ETHUSDT";
  writer.save_signal(eth);
  writer.stop();

  EXPECT_EQ(writer.written(), 3u);
  EXPECT_EQ(writer.failed(), 1u);
  EXPECT_EQ(sink.order(),
            (std::vector<std::string>{"signal:BTCUSDT", "event:pos-1", "signal:ETHUSDT"}));

  writer.save_signal(long_signal());
  EXPECT_EQ(writer.dropped(), 1u);
  EXPECT_EQ(sink.order().size(), 3u);
}
