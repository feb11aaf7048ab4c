#include "sigrisk/domain/position.hpp"

namespace sigrisk {
namespace domain {

const char* to_string(PositionSide s) {
  switch (s) {
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

const char* to_string(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:            return "OPEN";
    case PositionStatus::PartiallyClosed: return "PARTIALLY_CLOSED";
    case PositionStatus::Closed:          return "CLOSED";
  }
  return "UNKNOWN";
}

const char* to_string(ActionKind k) {
  switch (k) {
    case ActionKind::FullClose:    return "FULL_CLOSE";
    case ActionKind::PartialClose: return "PARTIAL_CLOSE";
    case ActionKind::UpdateStop:   return "UPDATE_STOP";
  }
  return "UNKNOWN";
}

const char* to_string(PositionEventKind k) {
  switch (k) {
    case PositionEventKind::Opened:       return "OPENED";
    case PositionEventKind::PartialClose: return "PARTIAL_CLOSE";
    case PositionEventKind::StopUpdated:  return "STOP_UPDATED";
    case PositionEventKind::Closed:       return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace sigrisk
