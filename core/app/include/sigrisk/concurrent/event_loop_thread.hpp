#pragma once

#include "sigrisk/concurrent/thread_safe_queue.hpp"
#include "sigrisk/eventbus/event_bus.hpp"
#include "sigrisk/events/event.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace sigrisk {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Any thread may push();
// subscribers of the bus run only on the loop thread, so everything they
// touch is serialized on it.
//
// The engine's risk loop is one of these: SignalEvent and PriceTickEvent
// are pushed from the scheduler workers and the price-tick gateway, and the
// PositionRiskManager handles them on the risk thread.
//
// Exceptions: a subscriber that throws does not kill the loop. The loop
// catches std::exception, logs it with the loop's name, and moves on to the
// next event. This is the risk loop's component boundary.
//
// Periodic task: set_periodic() installs one callback that the loop runs
// between events, at most once per interval, on the loop thread. It still
// runs when the queue is idle and is guarded like a subscriber. The engine
// uses it to re-dispatch exits whose retry backoff has elapsed.
//
// Thread model: start() and stop() from the owning thread; push() from any.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop")
      : name_(std::move(name)) {}

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker thread. No-op if already running.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker to exit and joins it. Events still queued when stop()
  // is called are published before the worker exits. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Must be called before start().
  void set_periodic(std::function<void()> task, std::chrono::milliseconds every) {
    periodic_ = std::move(task);
    periodic_every_ = every;
  }

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  void run();
  void dispatch(const Event& event);
  void run_periodic();

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::function<void()> periodic_;
  std::chrono::milliseconds periodic_every_{0};
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace sigrisk
