#include "sigrisk/persistence/json_lines_sink.hpp"

#include "sigrisk/domain/errors.hpp"
#include "sigrisk/persistence/json_codec.hpp"

#include <utility>

namespace sigrisk {

JsonLinesPersistenceSink::JsonLinesPersistenceSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
  if (!out_) {
    throw ConfigError("Cannot open persistence file: " + path);
  }
}

void JsonLinesPersistenceSink::save_signal(const domain::Signal& signal) {
  append("signal", signal);
}

void JsonLinesPersistenceSink::save_position_event(const domain::PositionEvent& event) {
  append("position_event", event);
}

void JsonLinesPersistenceSink::append(const char* type, nlohmann::json data) {
  nlohmann::json line = {{"type", type}, {"data", std::move(data)}};
  std::lock_guard lock(mutex_);
  out_ << line.dump() << '\n';
  out_.flush();
  if (!out_) {
    throw SigriskError("Write to " + path_ + " failed");
  }
}

}  // namespace sigrisk
