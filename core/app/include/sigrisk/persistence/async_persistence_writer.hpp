#pragma once

#include "sigrisk/concurrent/thread_safe_queue.hpp"
#include "sigrisk/domain/position.hpp"
#include "sigrisk/domain/signal.hpp"
#include "sigrisk/persistence/i_persistence_sink.hpp"

#include <atomic>
#include <cstdint>
#include <thread>
#include <variant>

namespace sigrisk {

// -----------------------------------------------------------------------------
// AsyncPersistenceWriter: fire-and-forget front of an IPersistenceSink
// -----------------------------------------------------------------------------
//
// @brief  Queues records and writes them to the sink on its own thread, so
//         the scheduler workers and the risk thread never wait on storage.
//
// @details
// save_signal() / save_position_event() copy the record into a
// ThreadSafeQueue and return. The writer thread pops records in order and
// forwards them to the sink. A sink that throws loses that record only:
// the failure is logged with a "[Persistence]" prefix and counted, and the
// thread moves on. Records offered after stop() are dropped and counted.
//
// stop() closes the queue, lets the thread write everything already
// accepted, and joins it. The destructor calls stop().
//
// Thread model:
//   save_*() from any thread; the sink is only ever called from the writer
//   thread.
//
// Ownership:
//   Non-owning reference to the sink, which must outlive the writer.
// -----------------------------------------------------------------------------
class AsyncPersistenceWriter {
 public:
  explicit AsyncPersistenceWriter(IPersistenceSink& sink);
  ~AsyncPersistenceWriter();

  AsyncPersistenceWriter(const AsyncPersistenceWriter&) = delete;
  AsyncPersistenceWriter& operator=(const AsyncPersistenceWriter&) = delete;
  AsyncPersistenceWriter(AsyncPersistenceWriter&&) = delete;
  AsyncPersistenceWriter& operator=(AsyncPersistenceWriter&&) = delete;

  void start();
  void stop();

  void save_signal(const domain::Signal& signal);
  void save_position_event(const domain::PositionEvent& event);

  std::uint64_t written() const { return written_.load(); }
  std::uint64_t failed() const { return failed_.load(); }
  std::uint64_t dropped() const { return dropped_.load(); }

 private:
  using Record = std::variant<domain::Signal, domain::PositionEvent>;

  void offer(Record record);
  void run();
  void write(const Record& record);

  IPersistenceSink& sink_;
  ThreadSafeQueue<Record> queue_;
  std::thread thread_;

  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace sigrisk
