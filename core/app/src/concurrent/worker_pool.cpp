#include "sigrisk/concurrent/worker_pool.hpp"

namespace sigrisk {

// -----------------------------------------------------------------------------
// Constructor: spawn `size` workers (at least one)
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t size) {
  if (size == 0) {
    size = 1;
  }
  threads_.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

// -----------------------------------------------------------------------------
// shutdown(): close the queue so wait_pop() returns nullopt once drained,
// then join. A second call finds no joinable threads.
// -----------------------------------------------------------------------------
void WorkerPool::shutdown() {
  jobs_.close();
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop. packaged_task captures job exceptions into the future,
// so nothing escapes a job through here.
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (auto job = jobs_.wait_pop()) {
    (*job)();
  }
}

}  // namespace sigrisk
