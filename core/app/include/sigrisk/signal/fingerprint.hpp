#pragma once

#include "sigrisk/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace sigrisk {

// FNV-1a 64 over "symbol|TYPE|strategy|bucket", rendered as 16 lowercase
// hex digits. bucket is floor(created_at / bucket width).
std::string signal_fingerprint(const std::string& symbol, domain::SignalType type,
                               const std::string& strategy_id, std::int64_t bucket);

}  // namespace sigrisk
