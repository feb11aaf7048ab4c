#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigrisk {
namespace domain {

enum class PositionSide {
  Long,
  Short,
};

enum class PositionStatus {
  Open,
  PartiallyClosed,
  Closed,
};

const char* to_string(PositionSide s);
const char* to_string(PositionStatus s);

// -----------------------------------------------------------------------------
// TakeProfitLevel
// -----------------------------------------------------------------------------
// fraction is a share of the ORIGINAL quantity. Levels are stored in the
// order they are evaluated: ascending price for longs, descending for shorts.
// filled flips false → true exactly once.
// -----------------------------------------------------------------------------
struct TakeProfitLevel {
  double price{0.0};
  double fraction{0.0};
  bool filled{false};
};

// -----------------------------------------------------------------------------
// TrailingState
// -----------------------------------------------------------------------------
// water_mark is the best price seen since the position opened: the highest
// for a long, the lowest for a short. trail_distance_pct is the fraction
// below (long) / above (short) the water mark the stop trails at.
// -----------------------------------------------------------------------------
struct TrailingState {
  bool active{false};
  double water_mark{0.0};
  double activation_pct{0.0};
  double trail_distance_pct{0.0};
};

// -----------------------------------------------------------------------------
// Position: one open (or archived) exposure managed by PositionRiskManager
// -----------------------------------------------------------------------------
//
// @brief  Entry, stop, take-profit schedule and trailing state for a single
//         position opened from a Signal.
//
// @details
// Created from the IExecutionClient's fill of open_position(); the
// PositionRiskManager fills in the risk levels and from then on is the only
// writer. Copies handed out (snapshots, PositionEvent, PositionUpdateEvent)
// are immutable values.
//
// closed_fraction is the share of the original quantity already closed by
// partial take-profits. remaining quantity = quantity * (1 - closed_fraction).
// It never exceeds 1.0. realized_pnl accumulates
// closed quantity * (exit - entry) * (+1 long, -1 short) at trigger prices.
//
// Status transitions:
//   Open → PartiallyClosed → ... → Closed
//   Open → Closed (stop hit, or a single tick crossed every level)
//
// Thread model:
//   Value type. The authoritative copy lives inside PositionRiskManager,
//   guarded by that position's own mutex.
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double entry_price{0.0};
  double quantity{0.0};
  double stop_loss_price{0.0};
  std::vector<TakeProfitLevel> take_profits;
  TrailingState trailing;
  PositionStatus status{PositionStatus::Open};
  double closed_fraction{0.0};
  double realized_pnl{0.0};
  std::int64_t opened_at_ms{0};
  std::int64_t closed_at_ms{0};
  std::optional<double> exit_price;
  std::string signal_fingerprint;
  std::string strategy_id;
};

// -----------------------------------------------------------------------------
// PositionAction: one close/stop intent decided for one tick
// -----------------------------------------------------------------------------
// At most one close-type action (FullClose or PartialClose) is decided per
// position per tick. An UpdateStop may accompany a PartialClose on the same
// tick, never a FullClose.
// -----------------------------------------------------------------------------
enum class ActionKind {
  FullClose,
  PartialClose,
  UpdateStop,
};

const char* to_string(ActionKind k);

struct PositionAction {
  std::string position_id;
  std::string symbol;
  ActionKind kind{ActionKind::FullClose};
  double fraction{0.0};        // of the original quantity; close kinds only
  double trigger_price{0.0};   // tick price that caused the action
  double new_stop_price{0.0};  // UpdateStop only
  std::string reason;          // "stop_loss", "take_profit", "trailing", ...
};

// -----------------------------------------------------------------------------
// PositionEvent: persisted record of a committed transition
// -----------------------------------------------------------------------------
enum class PositionEventKind {
  Opened,
  PartialClose,
  StopUpdated,
  Closed,
};

const char* to_string(PositionEventKind k);

struct PositionEvent {
  PositionEventKind kind{PositionEventKind::Opened};
  Position position;        // snapshot after the transition
  double price{0.0};
  double fraction{0.0};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace sigrisk
