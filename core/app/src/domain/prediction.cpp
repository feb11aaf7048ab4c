#include "sigrisk/domain/prediction.hpp"
#include "sigrisk/domain/errors.hpp"

namespace sigrisk {
namespace domain {

const char* to_string(Horizon h) {
  switch (h) {
    case Horizon::M15: return "15m";
    case Horizon::H1:  return "1h";
    case Horizon::H4:  return "4h";
    case Horizon::H12: return "12h";
  }
  return "unknown";
}

Horizon parse_horizon(const std::string& text) {
  if (text == "15m") return Horizon::M15;
  if (text == "1h") return Horizon::H1;
  if (text == "4h") return Horizon::H4;
  if (text == "12h") return Horizon::H12;
  throw ConfigError("Unknown horizon: '" + text + "'");
}

const char* to_string(Direction d) {
  switch (d) {
    case Direction::Down: return "down";
    case Direction::Flat: return "flat";
    case Direction::Up:   return "up";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace sigrisk
