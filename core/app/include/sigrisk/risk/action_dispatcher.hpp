#pragma once

#include "sigrisk/domain/position.hpp"
#include "sigrisk/events/event_types.hpp"
#include "sigrisk/execution/i_execution_client.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace sigrisk {

// -----------------------------------------------------------------------------
// ActionDispatcher: sends PositionActions to the execution collaborator
// -----------------------------------------------------------------------------
//
// @brief  Maps a PositionAction onto IExecutionClient, one attempt per
//         call, and schedules the next attempt when the venue refuses.
//
// @details
//   FullClose / PartialClose → close_position(id, fraction)
//   UpdateStop               → update_stop(id, new_stop_price)
//
// dispatch(action, attempt) never sleeps. Attempt n (1-based) that throws
// ExecutionRejected while attempts remain returns retry_at_ms =
// now + backoff_ms · 2^(n-1); the caller keeps the action pending and
// calls again with attempt n+1 once that time has passed. When attempt
// max_attempts is rejected the dispatcher logs CRITICAL, hands a
// CriticalAlertEvent to the alert sink and rethrows the ExecutionRejected.
// Other exceptions propagate untouched.
//
// Thread model:
//   Stateless between calls. Safe to call concurrently for different
//   positions.
// -----------------------------------------------------------------------------
class ActionDispatcher {
 public:
  using AlertSink = std::function<void(const CriticalAlertEvent&)>;

  struct Result {
    std::optional<ExecutionAck> ack;  // set when the venue accepted
    std::int64_t retry_at_ms{0};      // set when rejected with attempts left
  };

  ActionDispatcher(IExecutionClient& execution, const ITimeProvider& clock,
                   int max_attempts, std::int64_t backoff_ms);

  void set_alert_sink(AlertSink sink) { alert_sink_ = std::move(sink); }

  Result dispatch(const domain::PositionAction& action, int attempt);

  int max_attempts() const { return max_attempts_; }

 private:
  ExecutionAck send(const domain::PositionAction& action);

  IExecutionClient& execution_;
  const ITimeProvider& clock_;
  const int max_attempts_;
  const std::int64_t backoff_ms_;
  AlertSink alert_sink_;
};

}  // namespace sigrisk
