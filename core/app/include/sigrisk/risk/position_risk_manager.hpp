#pragma once

#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/domain/position.hpp"
#include "sigrisk/domain/signal.hpp"
#include "sigrisk/events/event_types.hpp"
#include "sigrisk/execution/i_execution_client.hpp"
#include "sigrisk/risk/action_dispatcher.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// PositionRiskManager: stop / take-profit / trailing state machine
// -----------------------------------------------------------------------------
//
// @brief  Opens positions from signals and drives each open position's
//         exits as price ticks arrive.
//
// @details
// Opening (on_signal): a LONG/SHORT signal opens a position when it is
// unexpired, its confidence is at least min_signal_confidence, trading is
// not halted, the symbol has no open position and fewer than
// max_open_positions are open. The fill comes from IExecutionClient; the
// stop is the signal's (or default_stop_loss_pct away when it has none or
// it sits on the wrong side of the fill), and the take-profit ladder is the
// configured schedule (or the signal's own targets, split evenly, when
// use_signal_take_profits is set).
//
// Per tick, for every open position of the symbol, plan_actions() decides:
//   1. Stop hit (long: price <= stop, short: price >= stop)
//        → FULL_CLOSE of the remainder. Nothing else this tick.
//   2. Unfilled take-profit levels reached by the price, in ladder order,
//        merged into ONE close: PARTIAL_CLOSE of their summed fraction, or
//        FULL_CLOSE of the remainder when the last level is among them.
//   3. Stop tightening: trailing (active once the best price seen is
//        activation_pct in profit; candidate = water mark ∓ distance) and
//        break-even (candidate = entry once price is breakeven_at_pct in
//        profit). The tightest candidate that beats the current stop
//        becomes one UPDATE_STOP. Stops never loosen.
// So each position gets at most one close intent per tick, plus at most
// one stop update that never accompanies a FULL_CLOSE.
//
// Commit protocol: each action is dispatched through the ActionDispatcher
// and applied to the position only after its ack. A rejection with
// attempts left marks the position as retrying: the tick returns at once,
// later ticks only record the water mark until the backoff has elapsed,
// and the first tick (or retry_due() call) after that re-plans at the
// current price and sends attempt n+1. When the last attempt is rejected
// the dispatcher has already raised a critical alert; the retry state is
// reset, the position keeps its pre-transition state, the remaining
// positions of the tick are still processed, and the first
// ExecutionRejected is rethrown at the end. Nothing ever sleeps on the
// calling thread, so one refused exit cannot delay another position.
//
// Every committed transition produces a PositionEvent handed to the event
// sink (the engine persists it and publishes a PositionUpdateEvent).
//
// Thread model:
//   positions_mutex_ (shared_mutex) guards the maps; each open position
//   has its own Slot mutex held for the whole evaluate-dispatch-commit
//   sequence, so one position has one mutator at a time while different
//   positions, even of the same symbol, may be processed concurrently.
//   on_signal() is serialized by open_mutex_. The event and alert sinks
//   must be set before use and are called with a Slot mutex held.
//
// Ownership:
//   Owned by SignalRiskEngine; the engine's risk loop calls on_signal(),
//   on_price_tick() and, from its periodic task, retry_due(). Non-owning reference to the execution client and
//   the clock; owns its ActionDispatcher.
// -----------------------------------------------------------------------------
class PositionRiskManager {
 public:
  using EventSink = std::function<void(const domain::PositionEvent&)>;
  using AlertSink = ActionDispatcher::AlertSink;

  // Throws ConfigError for an invalid RiskConfig.
  PositionRiskManager(RiskConfig config, IExecutionClient& execution,
                      const ITimeProvider& clock);

  PositionRiskManager(const PositionRiskManager&) = delete;
  PositionRiskManager& operator=(const PositionRiskManager&) = delete;
  PositionRiskManager(PositionRiskManager&&) = delete;
  PositionRiskManager& operator=(PositionRiskManager&&) = delete;

  void set_event_sink(EventSink sink);
  void set_alert_sink(AlertSink sink);

  // Returns the opened position, or nullopt when the signal is not
  // actionable. ExecutionRejected from the open propagates.
  std::optional<domain::Position> on_signal(const domain::Signal& signal);

  // Returns the events committed for this tick, in commit order.
  std::vector<domain::PositionEvent> on_price_tick(const std::string& symbol,
                                                   double price);

  // Re-evaluates, at its last seen price, every position whose retry
  // backoff has elapsed. The engine calls this periodically on the risk
  // loop so retries do not depend on the next tick for the symbol.
  std::vector<domain::PositionEvent> retry_due();

  // Pure decision step of on_price_tick() for one position.
  static std::vector<domain::PositionAction> plan_actions(
      const domain::Position& position, double price, const RiskConfig& config);

  // Kill switch for new entries. Exits keep being managed while halted.
  void halt();
  void resume();
  bool halted() const { return halted_.load(); }

  std::vector<domain::Position> snapshots() const;
  std::vector<domain::Position> closed_positions() const;
  std::optional<domain::Position> position(const std::string& id) const;
  std::size_t open_count() const;

  static void validate(const RiskConfig& config);

 private:
  struct Slot {
    std::mutex mutex;
    domain::Position position;
    double last_price{0.0};
    int failed_attempts{0};       // > 0 while a rejected action awaits retry
    std::int64_t retry_at_ms{0};
  };

  std::optional<std::string> rejection_reason(const domain::Signal& signal) const;
  domain::Position attach_levels(domain::Position filled,
                                 const domain::Signal& signal) const;
  std::vector<std::shared_ptr<Slot>> slots_for(const std::string& symbol) const;
  std::vector<std::shared_ptr<Slot>> all_slots() const;

  // Plans and dispatches for one position; slot.mutex must be held.
  // Throws ExecutionRejected once an action has used all its attempts.
  void evaluate_locked(Slot& slot, double price,
                       std::vector<domain::PositionEvent>& events);

  // Applies one acked action to the position and returns its event.
  domain::PositionEvent commit(domain::Position& position,
                               const domain::PositionAction& action);
  void archive(const std::string& position_id);
  void emit(const domain::PositionEvent& event);

  const RiskConfig config_;
  IExecutionClient& execution_;
  const ITimeProvider& clock_;
  ActionDispatcher dispatcher_;

  EventSink event_sink_;
  std::atomic<bool> halted_{false};

  std::mutex open_mutex_;
  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> open_;
  std::unordered_map<std::string, std::vector<std::string>> by_symbol_;
  std::vector<domain::Position> closed_;
};

}  // namespace sigrisk
