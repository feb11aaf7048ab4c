#include "sigrisk/persistence/async_persistence_writer.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace sigrisk {

AsyncPersistenceWriter::AsyncPersistenceWriter(IPersistenceSink& sink)
    : sink_(sink) {}

AsyncPersistenceWriter::~AsyncPersistenceWriter() { stop(); }

void AsyncPersistenceWriter::start() {
  if (thread_.joinable() || queue_.closed()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void AsyncPersistenceWriter::stop() {
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[Persistence] writer stopped: " << written_.load()
              << " written, " << failed_.load() << " failed, "
              << dropped_.load() << " dropped\n";
  }
}

void AsyncPersistenceWriter::save_signal(const domain::Signal& signal) {
  offer(Record{signal});
}

void AsyncPersistenceWriter::save_position_event(const domain::PositionEvent& event) {
  offer(Record{event});
}

void AsyncPersistenceWriter::offer(Record record) {
  if (!queue_.push(std::move(record))) {
    ++dropped_;
  }
}

void AsyncPersistenceWriter::run() {
  while (auto record = queue_.wait_pop()) {
    write(*record);
  }
}

// -----------------------------------------------------------------------------
// write(): the persistence component boundary. A failing sink costs one
// record, never the writer thread.
// -----------------------------------------------------------------------------
void AsyncPersistenceWriter::write(const Record& record) {
  try {
    if (const auto* signal = std::get_if<domain::Signal>(&record)) {
      sink_.save_signal(*signal);
    } else if (const auto* event = std::get_if<domain::PositionEvent>(&record)) {
      sink_.save_position_event(*event);
    }
    ++written_;
  } catch (const std::exception& e) {
    ++failed_;
    std::cerr << "[Persistence] write failed: " << e.what() << "\n";
  }
}

}  // namespace sigrisk
