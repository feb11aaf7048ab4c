#pragma once

#include "sigrisk/persistence/i_persistence_sink.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// JsonLinesPersistenceSink: append-only JSON-lines file
// -----------------------------------------------------------------------------
// One object per line:
//   {"type":"signal","data":{...}}
//   {"type":"position_event","data":{...}}
// with the field layout of json_codec.hpp. Each line is flushed so a crash
// loses at most the record being written. The constructor opens the file in
// append mode and throws ConfigError if it cannot.
// -----------------------------------------------------------------------------
class JsonLinesPersistenceSink final : public IPersistenceSink {
 public:
  explicit JsonLinesPersistenceSink(const std::string& path);

  void save_signal(const domain::Signal& signal) override;
  void save_position_event(const domain::PositionEvent& event) override;

 private:
  void append(const char* type, nlohmann::json data);

  const std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace sigrisk
