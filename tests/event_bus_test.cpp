// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for sigrisk::EventBus and sigrisk::EventLoopThread.
//
// Validates:
//   - Generic subscribers see every event; typed subscribers only their type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback without deadlock
//   - EventLoopThread delivers on its own thread, survives a throwing
//     subscriber, and publishes everything queued before stop()
//   - The periodic task runs on the loop thread and survives a throw
// =============================================================================

#include "sigrisk/concurrent/event_loop_thread.hpp"
#include "sigrisk/eventbus/event_bus.hpp"
#include "sigrisk/events/event.hpp"
#include "sigrisk/events/event_types.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

sigrisk::PriceTickEvent make_tick(const std::string& symbol, double price) {
  sigrisk::PriceTickEvent e;
  e.symbol = symbol;
  e.price = price;
  e.timestamp_ms = 1000;
  return e;
}

sigrisk::SignalEvent make_signal(const std::string& symbol) {
  sigrisk::SignalEvent e;
  e.signal.symbol = symbol;
  e.signal.type = sigrisk::domain::SignalType::Long;
  e.signal.confidence = 0.8;
  return e;
}

// Waits up to one second for pred() to hold.
template <typename Pred>
bool eventually(Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  sigrisk::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const sigrisk::Event&) { ++call_count; });

  bus.publish(make_tick("BTCUSDT", 100.0));
  bus.publish(make_signal("BTCUSDT"));
  bus.publish(sigrisk::CriticalAlertEvent{"SignalScheduler", "BTCUSDT", "", "x", 0});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type and sees
//    the payload intact.
// Why: The risk loop subscribes to SignalEvent and PriceTickEvent on the same
//      bus; a tick must never reach the signal handler.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersAndReceivesPayload) {
  int tick_count = 0;
  double last_price = 0.0;
  std::string last_symbol;
  bus.subscribe<sigrisk::PriceTickEvent>(
      [&](const sigrisk::PriceTickEvent& e) {
        ++tick_count;
        last_price = e.price;
        last_symbol = e.symbol;
      });

  bus.publish(make_signal("ETHUSDT"));
  bus.publish(make_tick("ETHUSDT", 2500.25));

  EXPECT_EQ(tick_count, 1);
  EXPECT_EQ(last_symbol, "ETHUSDT");
  EXPECT_DOUBLE_EQ(last_price, 2500.25);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback no longer fires. Unknown ids are
//    ignored.
// Why: SignalRiskEngine::stop() unsubscribes its handlers before the
//      components they capture are destroyed.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  const auto id = bus.subscribe<sigrisk::PriceTickEvent>(
      [&call_count](const sigrisk::PriceTickEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriber_count(), 1u);

  bus.publish(make_tick("BTCUSDT", 100.0));
  bus.unsubscribe(id);
  bus.unsubscribe(9999);
  bus.publish(make_tick("BTCUSDT", 101.0));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriber_count(), 0u);
}

// -----------------------------------------------------------------------------
// 4. A subscriber that publishes inside its callback does not deadlock.
// Why: The engine's risk event sink publishes PositionUpdateEvent from inside
//      the PriceTickEvent handler.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int updates = 0;
  bus.subscribe<sigrisk::PositionUpdateEvent>(
      [&updates](const sigrisk::PositionUpdateEvent&) { ++updates; });
  bus.subscribe<sigrisk::PriceTickEvent>(
      [this](const sigrisk::PriceTickEvent& tick) {
        sigrisk::PositionUpdateEvent update;
        update.event.price = tick.price;
        bus.publish(update);
      });

  bus.publish(make_tick("BTCUSDT", 100.0));

  EXPECT_EQ(updates, 1);
}

// -----------------------------------------------------------------------------
// 5. EventLoopThread runs subscribers on its own thread.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnLoopThread) {
  sigrisk::EventLoopThread loop("TestLoop");
  std::atomic<int> received{0};
  std::thread::id handler_thread;
  std::mutex mutex;

  loop.eventBus().subscribe<sigrisk::PriceTickEvent>(
      [&](const sigrisk::PriceTickEvent&) {
        std::lock_guard lock(mutex);
        handler_thread = std::this_thread::get_id();
        ++received;
      });

  loop.start();
  EXPECT_TRUE(loop.running());
  loop.push(make_tick("BTCUSDT", 100.0));

  ASSERT_TRUE(eventually([&] { return received.load() == 1; }));
  loop.stop();

  std::lock_guard lock(mutex);
  EXPECT_NE(handler_thread, std::this_thread::get_id());
}

// -----------------------------------------------------------------------------
// 6. A subscriber that throws does not stop the loop.
// Why: The risk loop is a component boundary; one bad event must not halt
//      exit management for every other position.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, ThrowingSubscriberDoesNotKillLoop) {
  sigrisk::EventLoopThread loop("TestLoop");
  std::atomic<int> good{0};

  loop.eventBus().subscribe<sigrisk::SignalEvent>(
      [](const sigrisk::SignalEvent&) { throw std::runtime_error("boom"); });
  loop.eventBus().subscribe<sigrisk::PriceTickEvent>(
      [&good](const sigrisk::PriceTickEvent&) { ++good; });

  loop.start();
  loop.push(make_signal("BTCUSDT"));
  loop.push(make_tick("BTCUSDT", 100.0));
  loop.push(make_signal("BTCUSDT"));
  loop.push(make_tick("BTCUSDT", 101.0));

  ASSERT_TRUE(eventually([&] { return good.load() == 2; }));
  loop.stop();
}

// -----------------------------------------------------------------------------
// 7. Events pushed before stop() are all published before the thread exits.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsQueuedEvents) {
  sigrisk::EventLoopThread loop("TestLoop");
  std::vector<double> prices;

  loop.eventBus().subscribe<sigrisk::PriceTickEvent>(
      [&prices](const sigrisk::PriceTickEvent& e) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        prices.push_back(e.price);
      });

  loop.start();
  for (int i = 0; i < 20; ++i) {
    loop.push(make_tick("BTCUSDT", 100.0 + i));
  }
  loop.stop();

  ASSERT_EQ(prices.size(), 20u);
  for (int i = 0; i < 20; ++i) {
    EXPECT_DOUBLE_EQ(prices[i], 100.0 + i);
  }
}

// -----------------------------------------------------------------------------
// 8. The periodic task runs on the loop thread while the queue is idle, and
//    an exception from it is logged without stopping the loop.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, PeriodicTaskRunsWhileIdle) {
  sigrisk::EventLoopThread loop("TestLoop");
  std::atomic<int> runs{0};
  std::atomic<bool> on_loop_thread{true};
  const auto test_thread = std::this_thread::get_id();

  loop.set_periodic(
      [&] {
        if (std::this_thread::get_id() == test_thread) {
          on_loop_thread = false;
        }
        if (++runs == 1) {
          throw std::runtime_error("first run fails");
        }
      },
      std::chrono::milliseconds(1));

  loop.start();
  ASSERT_TRUE(eventually([&] { return runs.load() >= 3; }));
  loop.stop();
  EXPECT_TRUE(on_loop_thread.load());
}
