#include "sigrisk/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace sigrisk {

namespace {

// How long the worker waits on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): pop with a short timeout so a cleared running_ flag is noticed even
// when nothing is pushed. On exit, drain what is left so stop() never drops
// an event that was accepted before it.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  auto next_periodic = std::chrono::steady_clock::now() + periodic_every_;
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWaitTimeout)) {
      dispatch(*event);
    }
    if (periodic_ && std::chrono::steady_clock::now() >= next_periodic) {
      run_periodic();
      next_periodic = std::chrono::steady_clock::now() + periodic_every_;
    }
  }

  while (auto event = queue_.try_pop()) {
    dispatch(*event);
  }
}

void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[" << name_ << "] subscriber threw: " << e.what() << "\n";
  }
}

void EventLoopThread::run_periodic() {
  try {
    periodic_();
  } catch (const std::exception& e) {
    std::cerr << "[" << name_ << "] periodic task threw: " << e.what() << "\n";
  }
}

}  // namespace sigrisk
