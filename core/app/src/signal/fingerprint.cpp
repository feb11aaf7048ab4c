#include "sigrisk/signal/fingerprint.hpp"

#include <iomanip>
#include <sstream>

namespace sigrisk {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

}  // namespace

std::string signal_fingerprint(const std::string& symbol, domain::SignalType type,
                               const std::string& strategy_id, std::int64_t bucket) {
  const std::string key = symbol + "|" + domain::to_string(type) + "|" +
                          strategy_id + "|" + std::to_string(bucket);
  std::uint64_t hash = kFnvOffsetBasis;
  for (unsigned char c : key) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << hash;
  return out.str();
}

}  // namespace sigrisk
