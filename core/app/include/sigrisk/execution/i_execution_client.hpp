#pragma once

#include "sigrisk/domain/position.hpp"

#include <cstdint>
#include <string>

namespace sigrisk {

// Acknowledgement of a close or stop update accepted by the venue.
struct ExecutionAck {
  std::string order_id;
  std::string position_id;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// IExecutionClient: the exchange execution collaborator
// -----------------------------------------------------------------------------
//
// @brief  Narrow order interface the PositionRiskManager talks to.
//
// @details
// open_position() returns the filled Position (id, side, entry price,
// quantity, opened_at); the risk manager then attaches stop, take-profit
// and trailing levels. close_position() closes `fraction` of the ORIGINAL
// quantity. Every method throws ExecutionRejected when the venue refuses
// the request; nothing is assumed to have happened in that case.
//
// Thread model:
//   Called from the risk thread, and concurrently for different positions
//   when ticks are processed in parallel. Implementations synchronize
//   internally.
// -----------------------------------------------------------------------------
class IExecutionClient {
 public:
  virtual ~IExecutionClient() = default;

  virtual domain::Position open_position(const std::string& symbol,
                                         domain::PositionSide side,
                                         double quantity,
                                         double entry_hint) = 0;

  virtual ExecutionAck close_position(const std::string& position_id,
                                      double fraction) = 0;

  virtual ExecutionAck update_stop(const std::string& position_id,
                                   double new_stop) = 0;
};

}  // namespace sigrisk
