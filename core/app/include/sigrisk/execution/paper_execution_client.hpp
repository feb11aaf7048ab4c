#pragma once

#include "sigrisk/concurrent/id_generator.hpp"
#include "sigrisk/execution/i_execution_client.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sigrisk {

// -----------------------------------------------------------------------------
// PaperExecutionClient: deterministic fill simulator
// -----------------------------------------------------------------------------
//
// @brief  Accepts every well-formed request and fills it immediately.
//
// @details
// Fill model:
//   - open_position fills the full quantity at entry_hint, timestamped with
//     the injected ITimeProvider (SimulationTimeProvider in tests).
//   - close_position accepts fractions in (0, 1] of the original quantity
//     while the position still has that much open.
//   - update_stop accepts any positive price for a live position.
// Requests for unknown or fully closed positions, non-positive quantities
// or prices, and over-closing are rejected with ExecutionRejected.
//
// Position ids come from an IdGenerator ("paper-1", "paper-2", ...), order
// ids from a second one ("ord-1", ...).
//
// Thread model:
//   One mutex around the book; safe from any thread.
// -----------------------------------------------------------------------------
class PaperExecutionClient final : public IExecutionClient {
 public:
  explicit PaperExecutionClient(const ITimeProvider& time_provider);

  PaperExecutionClient(const PaperExecutionClient&) = delete;
  PaperExecutionClient& operator=(const PaperExecutionClient&) = delete;
  PaperExecutionClient(PaperExecutionClient&&) = delete;
  PaperExecutionClient& operator=(PaperExecutionClient&&) = delete;

  domain::Position open_position(const std::string& symbol,
                                 domain::PositionSide side, double quantity,
                                 double entry_hint) override;

  ExecutionAck close_position(const std::string& position_id,
                              double fraction) override;

  ExecutionAck update_stop(const std::string& position_id,
                           double new_stop) override;

  // Fraction of the original quantity still open; 0 for unknown ids.
  double open_fraction(const std::string& position_id) const;
  std::size_t orders_accepted() const;

 private:
  ExecutionAck ack_locked(const std::string& position_id);

  const ITimeProvider& time_provider_;
  IdGenerator position_ids_{"paper"};
  IdGenerator order_ids_{"ord"};

  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> open_fraction_;
  std::size_t orders_accepted_{0};
};

}  // namespace sigrisk
