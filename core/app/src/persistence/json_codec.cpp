#include "sigrisk/persistence/json_codec.hpp"

#include <utility>

namespace sigrisk {
namespace domain {

void to_json(nlohmann::json& j, const Signal& signal) {
  j = nlohmann::json{
      {"symbol", signal.symbol},
      {"signal_type", to_string(signal.type)},
      {"confidence", signal.confidence},
      {"agreement_ratio", signal.agreement_ratio},
      {"direction_score", signal.direction_score},
      {"primary_horizon", to_string(signal.primary_horizon)},
      {"reference_price", signal.reference_price},
      {"take_profit_prices", signal.take_profit_prices},
      {"strategy_id", signal.strategy_id},
      {"fingerprint", signal.fingerprint},
      {"created_at_ms", signal.created_at_ms},
      {"expires_at_ms", signal.expires_at_ms},
  };
  if (signal.stop_loss_price) {
    j["stop_loss_price"] = *signal.stop_loss_price;
  } else {
    j["stop_loss_price"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const Position& position) {
  nlohmann::json levels = nlohmann::json::array();
  for (const auto& tp : position.take_profits) {
    levels.push_back({{"price", tp.price}, {"fraction", tp.fraction}, {"filled", tp.filled}});
  }
  j = nlohmann::json{
      {"id", position.id},
      {"symbol", position.symbol},
      {"side", to_string(position.side)},
      {"entry_price", position.entry_price},
      {"quantity", position.quantity},
      {"stop_loss_price", position.stop_loss_price},
      {"take_profits", std::move(levels)},
      {"trailing",
       {{"active", position.trailing.active},
        {"water_mark", position.trailing.water_mark},
        {"activation_pct", position.trailing.activation_pct},
        {"trail_distance_pct", position.trailing.trail_distance_pct}}},
      {"status", to_string(position.status)},
      {"closed_fraction", position.closed_fraction},
      {"realized_pnl", position.realized_pnl},
      {"opened_at_ms", position.opened_at_ms},
      {"closed_at_ms", position.closed_at_ms},
      {"signal_fingerprint", position.signal_fingerprint},
      {"strategy_id", position.strategy_id},
  };
  if (position.exit_price) {
    j["exit_price"] = *position.exit_price;
  } else {
    j["exit_price"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const PositionEvent& event) {
  j = nlohmann::json{
      {"kind", to_string(event.kind)},
      {"position", event.position},
      {"price", event.price},
      {"fraction", event.fraction},
      {"reason", event.reason},
      {"timestamp_ms", event.timestamp_ms},
  };
}

}  // namespace domain
}  // namespace sigrisk
