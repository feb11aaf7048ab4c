#include "sigrisk/risk/position_risk_manager.hpp"

#include "sigrisk/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace sigrisk {

namespace {

constexpr double kFractionTolerance = 1e-9;

double side_sign(domain::PositionSide side) {
  return side == domain::PositionSide::Long ? 1.0 : -1.0;
}

bool is_long(const domain::Position& p) { return p.side == domain::PositionSide::Long; }

// Price has reached a level on the favourable side.
bool reached(const domain::Position& p, double price, double level) {
  return is_long(p) ? price >= level : price <= level;
}

// candidate is a strictly tighter stop than current.
bool tighter(const domain::Position& p, double candidate, double current) {
  return is_long(p) ? candidate > current : candidate < current;
}

double best_price(const domain::Position& p, double price) {
  return is_long(p) ? std::max(p.trailing.water_mark, price)
                    : std::min(p.trailing.water_mark, price);
}

}  // namespace

void PositionRiskManager::validate(const RiskConfig& c) {
  if (!(c.position_quantity > 0.0) || c.max_open_positions < 1) {
    throw ConfigError("Risk: position_quantity and max_open_positions must be positive");
  }
  if (c.min_signal_confidence < 0.0 || c.min_signal_confidence > 1.0) {
    throw ConfigError("Risk: min_signal_confidence must be in [0, 1]");
  }
  if (c.take_profit_schedule.empty()) {
    throw ConfigError("Risk: take_profit_schedule must not be empty");
  }
  double total = 0.0;
  double previous_offset = 0.0;
  for (const auto& step : c.take_profit_schedule) {
    if (!(step.offset_pct > previous_offset) || !(step.fraction > 0.0)) {
      throw ConfigError("Risk: take-profit offsets must ascend from 0 and fractions be positive");
    }
    previous_offset = step.offset_pct;
    total += step.fraction;
  }
  if (total > 1.0 + kFractionTolerance) {
    throw ConfigError("Risk: take-profit fractions sum to " + std::to_string(total) +
                      ", more than 1");
  }
  if (!(c.default_stop_loss_pct > 0.0 && c.default_stop_loss_pct < 1.0)) {
    throw ConfigError("Risk: default_stop_loss_pct must be in (0, 1)");
  }
  if (c.trailing_activation_pct < 0.0 || c.trailing_distance_pct < 0.0 ||
      c.trailing_distance_pct >= 1.0 || c.breakeven_at_pct < 0.0) {
    throw ConfigError("Risk: invalid trailing or break-even settings");
  }
}

PositionRiskManager::PositionRiskManager(RiskConfig config,
                                         IExecutionClient& execution,
                                         const ITimeProvider& clock)
    : config_(std::move(config)),
      execution_(execution),
      clock_(clock),
      dispatcher_(execution, clock, config_.dispatch_max_attempts,
                  config_.dispatch_backoff_ms) {
  validate(config_);
}

void PositionRiskManager::set_event_sink(EventSink sink) {
  event_sink_ = std::move(sink);
}

void PositionRiskManager::set_alert_sink(AlertSink sink) {
  dispatcher_.set_alert_sink(std::move(sink));
}

void PositionRiskManager::halt() {
  halted_.store(true);
  std::cout << "[PositionRiskManager] HALTED: new entries blocked\n";
}

void PositionRiskManager::resume() {
  halted_.store(false);
  std::cout << "[PositionRiskManager] resumed\n";
}

// -----------------------------------------------------------------------------
// on_signal()
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionRiskManager::on_signal(
    const domain::Signal& signal) {
  if (signal.type == domain::SignalType::Neutral) {
    return std::nullopt;
  }

  std::lock_guard open_lock(open_mutex_);
  if (auto reason = rejection_reason(signal)) {
    std::cout << "[PositionRiskManager] " << signal.symbol << " "
              << domain::to_string(signal.type) << " signal ignored: " << *reason
              << "\n";
    return std::nullopt;
  }

  const auto side = signal.type == domain::SignalType::Long
                        ? domain::PositionSide::Long
                        : domain::PositionSide::Short;
  domain::Position filled = execution_.open_position(
      signal.symbol, side, config_.position_quantity, signal.reference_price);
  domain::Position position = attach_levels(std::move(filled), signal);

  domain::PositionEvent opened;
  opened.kind = domain::PositionEventKind::Opened;
  opened.position = position;
  opened.price = position.entry_price;
  opened.fraction = 1.0;
  opened.reason = "signal";
  opened.timestamp_ms = position.opened_at_ms;
  emit(opened);

  auto slot = std::make_shared<Slot>();
  slot->position = position;
  {
    std::unique_lock lock(positions_mutex_);
    open_.emplace(position.id, std::move(slot));
    by_symbol_[position.symbol].push_back(position.id);
  }

  std::cout << "[PositionRiskManager] opened " << position.id << " "
            << domain::to_string(position.side) << " " << position.symbol
            << " @ " << position.entry_price << " stop=" << position.stop_loss_price
            << " levels=" << position.take_profits.size() << "\n";
  return position;
}

std::optional<std::string> PositionRiskManager::rejection_reason(
    const domain::Signal& signal) const {
  if (halted_.load()) {
    return std::string("trading halted");
  }
  if (clock_.now_ms() >= signal.expires_at_ms) {
    return std::string("signal expired");
  }
  if (signal.confidence < config_.min_signal_confidence) {
    return std::string("confidence below floor");
  }
  if (!(signal.reference_price > 0.0)) {
    return std::string("no reference price");
  }
  std::shared_lock lock(positions_mutex_);
  auto it = by_symbol_.find(signal.symbol);
  if (it != by_symbol_.end() && !it->second.empty()) {
    return std::string("position already open");
  }
  if (open_.size() >= config_.max_open_positions) {
    return std::string("open position cap reached");
  }
  return std::nullopt;
}

domain::Position PositionRiskManager::attach_levels(domain::Position position,
                                                    const domain::Signal& signal) const {
  const double entry = position.entry_price;
  const double sign = side_sign(position.side);

  const bool signal_stop_valid =
      signal.stop_loss_price && *signal.stop_loss_price > 0.0 &&
      tighter(position, entry, *signal.stop_loss_price);
  position.stop_loss_price = signal_stop_valid
                                 ? *signal.stop_loss_price
                                 : entry * (1.0 - sign * config_.default_stop_loss_pct);

  position.take_profits.clear();
  if (config_.use_signal_take_profits && !signal.take_profit_prices.empty()) {
    const double fraction = 1.0 / static_cast<double>(signal.take_profit_prices.size());
    for (double price : signal.take_profit_prices) {
      position.take_profits.push_back({price, fraction, false});
    }
  } else {
    for (const auto& step : config_.take_profit_schedule) {
      position.take_profits.push_back(
          {entry * (1.0 + sign * step.offset_pct), step.fraction, false});
    }
  }
  std::sort(position.take_profits.begin(), position.take_profits.end(),
            [&position](const domain::TakeProfitLevel& a, const domain::TakeProfitLevel& b) {
              return is_long(position) ? a.price < b.price : a.price > b.price;
            });

  position.trailing.active = false;
  position.trailing.water_mark = entry;
  position.trailing.activation_pct = config_.trailing_activation_pct;
  position.trailing.trail_distance_pct =
      config_.trailing_enabled ? config_.trailing_distance_pct : 0.0;

  position.status = domain::PositionStatus::Open;
  position.closed_fraction = 0.0;
  position.signal_fingerprint = signal.fingerprint;
  position.strategy_id = signal.strategy_id;
  return position;
}

// -----------------------------------------------------------------------------
// plan_actions(): see the class comment for the rule order.
// -----------------------------------------------------------------------------
std::vector<domain::PositionAction> PositionRiskManager::plan_actions(
    const domain::Position& p, double price, const RiskConfig& config) {
  std::vector<domain::PositionAction> actions;
  if (p.status == domain::PositionStatus::Closed) {
    return actions;
  }

  auto make = [&](domain::ActionKind kind, double fraction, const char* reason) {
    domain::PositionAction a;
    a.position_id = p.id;
    a.symbol = p.symbol;
    a.kind = kind;
    a.fraction = fraction;
    a.trigger_price = price;
    a.reason = reason;
    return a;
  };
  const double remaining = 1.0 - p.closed_fraction;

  // 1. Stop.
  const bool stop_hit = is_long(p) ? price <= p.stop_loss_price : price >= p.stop_loss_price;
  if (stop_hit) {
    actions.push_back(make(domain::ActionKind::FullClose, remaining,
                           p.trailing.active ? "trailing_stop" : "stop_loss"));
    return actions;
  }

  // 2. Take-profit ladder, merged into one close.
  double tp_fraction = 0.0;
  std::size_t unfilled = 0;
  std::size_t hit = 0;
  bool ladder_blocked = false;
  for (const auto& level : p.take_profits) {
    if (level.filled) {
      continue;
    }
    ++unfilled;
    if (!ladder_blocked && reached(p, price, level.price)) {
      ++hit;
      tp_fraction += level.fraction;
    } else {
      ladder_blocked = true;
    }
  }
  if (hit > 0 && hit == unfilled) {
    actions.push_back(make(domain::ActionKind::FullClose, remaining, "take_profit"));
    return actions;
  }
  if (hit > 0) {
    actions.push_back(make(domain::ActionKind::PartialClose,
                           std::min(tp_fraction, remaining), "take_profit"));
  }

  // 3. Stop tightening.
  const double sign = side_sign(p.side);
  double new_stop = p.stop_loss_price;
  const char* reason = nullptr;
  if (p.trailing.trail_distance_pct > 0.0) {
    const double water = best_price(p, price);
    const double best_profit = sign * (water - p.entry_price) / p.entry_price;
    if (p.trailing.active || best_profit >= p.trailing.activation_pct) {
      const double candidate = water * (1.0 - sign * p.trailing.trail_distance_pct);
      if (tighter(p, candidate, new_stop)) {
        new_stop = candidate;
        reason = "trailing";
      }
    }
  }
  if (config.breakeven_enabled) {
    const double profit = sign * (price - p.entry_price) / p.entry_price;
    if (profit >= config.breakeven_at_pct && tighter(p, p.entry_price, new_stop)) {
      new_stop = p.entry_price;
      reason = "breakeven";
    }
  }
  if (reason != nullptr) {
    domain::PositionAction update = make(domain::ActionKind::UpdateStop, 0.0, reason);
    update.new_stop_price = new_stop;
    actions.push_back(std::move(update));
  }
  return actions;
}

// -----------------------------------------------------------------------------
// on_price_tick()
// -----------------------------------------------------------------------------
std::vector<domain::PositionEvent> PositionRiskManager::on_price_tick(
    const std::string& symbol, double price) {
  std::vector<domain::PositionEvent> events;
  if (!std::isfinite(price) || price <= 0.0) {
    std::cerr << "[PositionRiskManager] ignoring invalid tick for " << symbol
              << ": " << price << "\n";
    return events;
  }

  std::exception_ptr first_rejection;
  std::vector<std::string> to_archive;

  for (const auto& slot : slots_for(symbol)) {
    std::lock_guard lock(slot->mutex);
    if (slot->position.status == domain::PositionStatus::Closed) {
      continue;
    }
    try {
      evaluate_locked(*slot, price, events);
    } catch (const ExecutionRejected&) {
      if (!first_rejection) {
        first_rejection = std::current_exception();
      }
    }
    if (slot->position.status == domain::PositionStatus::Closed) {
      to_archive.push_back(slot->position.id);
    }
  }

  for (const auto& id : to_archive) {
    archive(id);
  }
  if (first_rejection) {
    std::rethrow_exception(first_rejection);
  }
  return events;
}

std::vector<domain::PositionEvent> PositionRiskManager::retry_due() {
  std::vector<domain::PositionEvent> events;
  std::exception_ptr first_rejection;
  std::vector<std::string> to_archive;

  for (const auto& slot : all_slots()) {
    std::lock_guard lock(slot->mutex);
    if (slot->failed_attempts == 0 || clock_.now_ms() < slot->retry_at_ms ||
        slot->position.status == domain::PositionStatus::Closed) {
      continue;
    }
    try {
      evaluate_locked(*slot, slot->last_price, events);
    } catch (const ExecutionRejected&) {
      if (!first_rejection) {
        first_rejection = std::current_exception();
      }
    }
    if (slot->position.status == domain::PositionStatus::Closed) {
      to_archive.push_back(slot->position.id);
    }
  }

  for (const auto& id : to_archive) {
    archive(id);
  }
  if (first_rejection) {
    std::rethrow_exception(first_rejection);
  }
  return events;
}

// -----------------------------------------------------------------------------
// evaluate_locked()
// -----------------------------------------------------------------------------
// The water mark and trailing activation are observations, not transitions:
// they are recorded before planning is acted on, even while a rejected
// action is backing off.
// -----------------------------------------------------------------------------
void PositionRiskManager::evaluate_locked(Slot& slot, double price,
                                          std::vector<domain::PositionEvent>& events) {
  domain::Position& p = slot.position;
  const std::vector<domain::PositionAction> actions = plan_actions(p, price, config_);

  slot.last_price = price;
  p.trailing.water_mark = best_price(p, price);
  if (p.trailing.trail_distance_pct > 0.0 && !p.trailing.active) {
    const double best_profit =
        side_sign(p.side) * (p.trailing.water_mark - p.entry_price) / p.entry_price;
    p.trailing.active = best_profit >= p.trailing.activation_pct;
  }

  if (actions.empty()) {
    slot.failed_attempts = 0;
    slot.retry_at_ms = 0;
    return;
  }
  if (slot.failed_attempts > 0 && clock_.now_ms() < slot.retry_at_ms) {
    return;
  }

  for (const auto& action : actions) {
    const int attempt = slot.failed_attempts + 1;
    ActionDispatcher::Result result;
    try {
      result = dispatcher_.dispatch(action, attempt);
    } catch (const ExecutionRejected&) {
      slot.failed_attempts = 0;
      slot.retry_at_ms = 0;
      throw;
    }
    if (!result.ack) {
      slot.failed_attempts = attempt;
      slot.retry_at_ms = result.retry_at_ms;
      return;
    }
    slot.failed_attempts = 0;
    slot.retry_at_ms = 0;

    domain::PositionEvent event = commit(p, action);
    emit(event);
    events.push_back(std::move(event));
  }
}

domain::PositionEvent PositionRiskManager::commit(domain::Position& p,
                                                  const domain::PositionAction& action) {
  const double sign = side_sign(p.side);
  domain::PositionEvent event;
  event.price = action.trigger_price;
  event.fraction = action.fraction;
  event.reason = action.reason;
  event.timestamp_ms = clock_.now_ms();

  switch (action.kind) {
    case domain::ActionKind::PartialClose: {
      for (auto& level : p.take_profits) {
        if (level.filled) {
          continue;
        }
        if (!reached(p, action.trigger_price, level.price)) {
          break;
        }
        level.filled = true;
      }
      p.closed_fraction = std::min(1.0, p.closed_fraction + action.fraction);
      p.realized_pnl += p.quantity * action.fraction * sign *
                        (action.trigger_price - p.entry_price);
      p.status = domain::PositionStatus::PartiallyClosed;
      event.kind = domain::PositionEventKind::PartialClose;
      std::cout << "[PositionRiskManager] " << p.id << " partial close "
                << action.fraction << " @ " << action.trigger_price << "\n";
      break;
    }
    case domain::ActionKind::FullClose: {
      if (action.reason == "take_profit") {
        for (auto& level : p.take_profits) {
          level.filled = true;
        }
      }
      p.realized_pnl += p.quantity * action.fraction * sign *
                        (action.trigger_price - p.entry_price);
      p.closed_fraction = 1.0;
      p.status = domain::PositionStatus::Closed;
      p.closed_at_ms = event.timestamp_ms;
      p.exit_price = action.trigger_price;
      event.kind = domain::PositionEventKind::Closed;
      std::cout << "[PositionRiskManager] " << p.id << " CLOSED (" << action.reason
                << ") @ " << action.trigger_price << " pnl=" << p.realized_pnl << "\n";
      break;
    }
    case domain::ActionKind::UpdateStop: {
      p.stop_loss_price = action.new_stop_price;
      if (action.reason == "trailing") {
        p.trailing.active = true;
      }
      event.kind = domain::PositionEventKind::StopUpdated;
      std::cout << "[PositionRiskManager] " << p.id << " stop -> "
                << action.new_stop_price << " (" << action.reason << ")\n";
      break;
    }
  }

  event.position = p;
  return event;
}

void PositionRiskManager::archive(const std::string& position_id) {
  std::unique_lock lock(positions_mutex_);
  auto it = open_.find(position_id);
  if (it == open_.end()) {
    return;
  }
  std::shared_ptr<Slot> slot = it->second;
  open_.erase(it);

  domain::Position closed;
  {
    std::lock_guard slot_lock(slot->mutex);
    closed = slot->position;
  }
  auto& ids = by_symbol_[closed.symbol];
  ids.erase(std::remove(ids.begin(), ids.end(), position_id), ids.end());
  if (ids.empty()) {
    by_symbol_.erase(closed.symbol);
  }
  closed_.push_back(std::move(closed));
}

void PositionRiskManager::emit(const domain::PositionEvent& event) {
  if (event_sink_) {
    event_sink_(event);
  }
}

std::vector<std::shared_ptr<PositionRiskManager::Slot>> PositionRiskManager::slots_for(
    const std::string& symbol) const {
  std::vector<std::shared_ptr<Slot>> slots;
  std::shared_lock lock(positions_mutex_);
  auto it = by_symbol_.find(symbol);
  if (it == by_symbol_.end()) {
    return slots;
  }
  slots.reserve(it->second.size());
  for (const auto& id : it->second) {
    slots.push_back(open_.at(id));
  }
  return slots;
}

std::vector<std::shared_ptr<PositionRiskManager::Slot>> PositionRiskManager::all_slots()
    const {
  std::vector<std::shared_ptr<Slot>> slots;
  std::shared_lock lock(positions_mutex_);
  slots.reserve(open_.size());
  for (const auto& [id, slot] : open_) {
    slots.push_back(slot);
  }
  return slots;
}

std::vector<domain::Position> PositionRiskManager::snapshots() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> out;
  out.reserve(open_.size());
  for (const auto& [id, slot] : open_) {
    std::lock_guard slot_lock(slot->mutex);
    out.push_back(slot->position);
  }
  return out;
}

std::vector<domain::Position> PositionRiskManager::closed_positions() const {
  std::shared_lock lock(positions_mutex_);
  return closed_;
}

std::optional<domain::Position> PositionRiskManager::position(const std::string& id) const {
  std::shared_lock lock(positions_mutex_);
  auto it = open_.find(id);
  if (it != open_.end()) {
    std::lock_guard slot_lock(it->second->mutex);
    return it->second->position;
  }
  for (const auto& p : closed_) {
    if (p.id == id) {
      return p;
    }
  }
  return std::nullopt;
}

std::size_t PositionRiskManager::open_count() const {
  std::shared_lock lock(positions_mutex_);
  return open_.size();
}

}  // namespace sigrisk
