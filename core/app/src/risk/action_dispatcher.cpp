#include "sigrisk/risk/action_dispatcher.hpp"

#include "sigrisk/domain/errors.hpp"

#include <iostream>
#include <string>

namespace sigrisk {

ActionDispatcher::ActionDispatcher(IExecutionClient& execution,
                                   const ITimeProvider& clock, int max_attempts,
                                   std::int64_t backoff_ms)
    : execution_(execution),
      clock_(clock),
      max_attempts_(max_attempts),
      backoff_ms_(backoff_ms) {
  if (max_attempts_ < 1 || backoff_ms_ < 0) {
    throw ConfigError("ActionDispatcher: need max_attempts >= 1 and backoff_ms >= 0");
  }
}

ExecutionAck ActionDispatcher::send(const domain::PositionAction& action) {
  switch (action.kind) {
    case domain::ActionKind::FullClose:
    case domain::ActionKind::PartialClose:
      return execution_.close_position(action.position_id, action.fraction);
    case domain::ActionKind::UpdateStop:
      return execution_.update_stop(action.position_id, action.new_stop_price);
  }
  throw ExecutionRejected("ActionDispatcher: unknown action kind");
}

ActionDispatcher::Result ActionDispatcher::dispatch(
    const domain::PositionAction& action, int attempt) {
  Result result;
  try {
    result.ack = send(action);
    return result;
  } catch (const ExecutionRejected& e) {
    if (attempt < max_attempts_) {
      const std::int64_t delay = backoff_ms_ << (attempt - 1);
      result.retry_at_ms = clock_.now_ms() + delay;
      std::cerr << "[ActionDispatcher] " << domain::to_string(action.kind) << " "
                << action.position_id << " rejected (attempt " << attempt << "/"
                << max_attempts_ << "): " << e.what() << ", next attempt in "
                << delay << "ms\n";
      return result;
    }

    const std::string message = std::string(domain::to_string(action.kind)) +
                                " (" + action.reason + ") rejected after " +
                                std::to_string(max_attempts_) +
                                " attempts: " + e.what();
    std::cerr << "[ActionDispatcher] CRITICAL " << action.symbol << " "
              << action.position_id << ": " << message << "\n";
    if (alert_sink_) {
      CriticalAlertEvent alert;
      alert.component = "PositionRiskManager";
      alert.symbol = action.symbol;
      alert.position_id = action.position_id;
      alert.message = message;
      alert.timestamp_ms = clock_.now_ms();
      alert_sink_(alert);
    }
    throw;
  }
}

}  // namespace sigrisk
