#include "sigrisk/domain/signal.hpp"

namespace sigrisk {
namespace domain {

const char* to_string(SignalType t) {
  switch (t) {
    case SignalType::Long:    return "LONG";
    case SignalType::Short:   return "SHORT";
    case SignalType::Neutral: return "NEUTRAL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace sigrisk
