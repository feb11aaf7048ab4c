#pragma once

#include "sigrisk/events/event_types.hpp"

#include <variant>

namespace sigrisk {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by every EventBus and EventLoopThread in
// the engine. std::variant keeps events as plain values: no heap allocation
// per event, no base-class pointers, and std::get_if dispatch in typed
// subscribers.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvent,
    PriceTickEvent,
    PositionUpdateEvent,
    CriticalAlertEvent>;

}  // namespace sigrisk
