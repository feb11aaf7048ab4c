#pragma once

#include "sigrisk/domain/position.hpp"
#include "sigrisk/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one emitted (already deduplicated) Signal from the
// SignalScheduler into the risk loop.
// Thread model: pushed from a scheduler worker thread into the risk loop's
// queue; handled by PositionRiskManager::on_signal() on the risk thread.
// -----------------------------------------------------------------------------
struct SignalEvent {
  domain::Signal signal;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PriceTickEvent
// -----------------------------------------------------------------------------
// Responsibility: Last traded price for one symbol. Drives the per-position
// stop / take-profit / trailing state machine.
// Produced by the PriceTickGateway thread (or pushed directly by tests).
// -----------------------------------------------------------------------------
struct PriceTickEvent {
  std::string symbol;
  double price{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Published by PositionRiskManager after every committed
// transition (open, partial close, stop update, close). The IpcServer
// forwards it as telemetry.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::PositionEvent event;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CriticalAlertEvent
// -----------------------------------------------------------------------------
// Responsibility: A failure an operator must see, e.g. a stop-loss close
// that the execution collaborator kept rejecting after every retry.
// Published by the ActionDispatcher's alert sink and by the scheduler on
// FeatureShapeMismatch.
// -----------------------------------------------------------------------------
struct CriticalAlertEvent {
  std::string component;
  std::string symbol;
  std::string position_id;
  std::string message;
  std::int64_t timestamp_ms{0};
};

}  // namespace sigrisk
