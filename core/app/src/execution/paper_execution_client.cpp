#include "sigrisk/execution/paper_execution_client.hpp"

#include "sigrisk/domain/errors.hpp"

#include <iostream>

namespace sigrisk {

namespace {

// Closing the last sliver of a ladder accumulates rounding error.
constexpr double kFractionEpsilon = 1e-9;

}  // namespace

PaperExecutionClient::PaperExecutionClient(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

domain::Position PaperExecutionClient::open_position(const std::string& symbol,
                                                     domain::PositionSide side,
                                                     double quantity,
                                                     double entry_hint) {
  if (!(quantity > 0.0) || !(entry_hint > 0.0)) {
    throw ExecutionRejected("PaperExecutionClient: invalid order for " + symbol);
  }

  domain::Position position;
  position.id = position_ids_.next_label();
  position.symbol = symbol;
  position.side = side;
  position.entry_price = entry_hint;
  position.quantity = quantity;
  position.opened_at_ms = time_provider_.now_ms();

  std::lock_guard lock(mutex_);
  open_fraction_[position.id] = 1.0;
  ++orders_accepted_;
  std::cout << "[PaperExecution] opened " << position.id << " "
            << domain::to_string(side) << " " << quantity << " " << symbol
            << " @ " << entry_hint << "\n";
  return position;
}

ExecutionAck PaperExecutionClient::close_position(const std::string& position_id,
                                                  double fraction) {
  std::lock_guard lock(mutex_);
  auto it = open_fraction_.find(position_id);
  if (it == open_fraction_.end() || it->second <= kFractionEpsilon) {
    throw ExecutionRejected("PaperExecutionClient: no open position " + position_id);
  }
  if (!(fraction > 0.0) || fraction > it->second + kFractionEpsilon) {
    throw ExecutionRejected("PaperExecutionClient: cannot close " +
                            std::to_string(fraction) + " of " + position_id);
  }
  it->second -= fraction;
  if (it->second < kFractionEpsilon) {
    it->second = 0.0;
  }
  return ack_locked(position_id);
}

ExecutionAck PaperExecutionClient::update_stop(const std::string& position_id,
                                               double new_stop) {
  std::lock_guard lock(mutex_);
  auto it = open_fraction_.find(position_id);
  if (it == open_fraction_.end() || it->second <= kFractionEpsilon) {
    throw ExecutionRejected("PaperExecutionClient: no open position " + position_id);
  }
  if (!(new_stop > 0.0)) {
    throw ExecutionRejected("PaperExecutionClient: invalid stop for " + position_id);
  }
  return ack_locked(position_id);
}

double PaperExecutionClient::open_fraction(const std::string& position_id) const {
  std::lock_guard lock(mutex_);
  auto it = open_fraction_.find(position_id);
  return it == open_fraction_.end() ? 0.0 : it->second;
}

std::size_t PaperExecutionClient::orders_accepted() const {
  std::lock_guard lock(mutex_);
  return orders_accepted_;
}

ExecutionAck PaperExecutionClient::ack_locked(const std::string& position_id) {
  ++orders_accepted_;
  ExecutionAck ack;
  ack.order_id = order_ids_.next_label();
  ack.position_id = position_id;
  ack.timestamp_ms = time_provider_.now_ms();
  return ack;
}

}  // namespace sigrisk
