#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace sigrisk {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids for positions opened by the
//         PaperExecutionClient, optionally with a textual prefix
//         ("paper-1", "paper-2", ...).
//
// @details
// Starts at 1; 0 is reserved as the "unset" sentinel. fetch_add with relaxed
// ordering is sufficient because uniqueness is the only requirement.
//
// Owned as a value member by the component that needs it; never a
// singleton.
//
// Thread model:
//   next_id() and next_label() are safe to call concurrently.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // prefix + "-" + next_id(). Returns the bare number when no prefix is set.
  std::string next_label() {
    std::string number = std::to_string(next_id());
    return prefix_.empty() ? number : prefix_ + "-" + number;
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace sigrisk
