#pragma once

#include "sigrisk/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// WorkerPool: fixed-size pool of threads draining a job queue
// -----------------------------------------------------------------------------
//
// @brief  Runs submitted callables on a bounded number of threads. The pool
//         size is chosen from configuration and is independent of how many
//         symbols the scheduler tracks.
//
// @details
// Jobs are type-erased into std::function<void()> and pushed onto a
// ThreadSafeQueue. Each worker loops on wait_pop() until the queue is closed
// and drained. submit() wraps the callable in a std::packaged_task so the
// caller gets a std::future that carries either the result or the exception
// the job threw.
//
// SignalScheduler submits at most one job per symbol per tick, so a stuck
// run can occupy at most one of its workers. ModelAdapter keeps a second
// pool for predict() calls, so a hung model ties up inference threads and
// not scheduler workers.
//
// Thread model:
//   submit() is safe from any thread. Workers run jobs concurrently; jobs
//   must synchronize any shared state themselves. shutdown() (also run by
//   the destructor) closes the queue, lets workers finish queued jobs, and
//   joins them. Jobs submitted after shutdown() are never run; their future
//   reports std::future_errc::broken_promise.
//
// Ownership:
//   Owned by SignalScheduler and ModelAdapter via std::unique_ptr. Owns its
//   threads.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t size);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // @brief  Enqueues fn for execution on a worker thread.
  //
  // @return std::future for fn's result. Exceptions thrown by fn surface
  //         from future::get().
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    // packaged_task is move-only; std::function requires copyable targets,
    // so the task lives behind a shared_ptr.
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    jobs_.push([task] { (*task)(); });
    return future;
  }

  // Closes the job queue and joins every worker. Idempotent.
  void shutdown();

  std::size_t size() const { return threads_.size(); }

 private:
  void run();

  ThreadSafeQueue<std::function<void()>> jobs_;
  std::vector<std::thread> threads_;
};

}  // namespace sigrisk
