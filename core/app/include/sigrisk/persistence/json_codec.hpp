#pragma once

#include "sigrisk/domain/position.hpp"
#include "sigrisk/domain/signal.hpp"

#include <nlohmann/json.hpp>

namespace sigrisk {
namespace domain {

// -----------------------------------------------------------------------------
// JSON encoders for records that leave the process
// -----------------------------------------------------------------------------
// Found by nlohmann::json through ADL, so `nlohmann::json j = signal;` works.
// Used by the JSON-lines persistence sink and by IpcServer telemetry, which
// therefore publish the same field names. Enums are written in their
// to_string() form; absent optionals are written as null.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Signal& signal);
void to_json(nlohmann::json& j, const Position& position);
void to_json(nlohmann::json& j, const PositionEvent& event);

}  // namespace domain
}  // namespace sigrisk
